#pragma once
#include <httplib.h>

#include <nlohmann/json.hpp>
#include <optional>

#include "controller.hpp"

// JSON command and polling routes over the controller.
void register_routes(httplib::Server& svr, PipelineController& ctl, int default_delay_ms);

// Body of POST /sampling/start: {"interval": N}, {"delay_ms": N}, or neither
// for the configured delay. nullopt when the given field is not an integer.
std::optional<int> sampling_interval_from_body(const nlohmann::json& body, int default_delay_ms);
