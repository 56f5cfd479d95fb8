#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

using std::chrono::milliseconds;

namespace {

AppConfig parse(const YAML::Node& y) {
  AppConfig c{};

  if (y["source"]) {
    auto n = y["source"];
    if (n["uri"]) c.source.uri = n["uri"].as<std::string>();
    if (n["camera_index"]) c.source.camera_index = n["camera_index"].as<int>();
    if (n["loop_playback"]) c.playback.loop_playback = n["loop_playback"].as<bool>();
    if (n["camera_width"]) c.playback.capture.camera_width = n["camera_width"].as<int>();
    if (n["camera_height"]) c.playback.capture.camera_height = n["camera_height"].as<int>();
  }
  if (y["sampling"]) {
    auto n = y["sampling"];
    if (n["delay_ms"]) c.delay_ms = n["delay_ms"].as<int>();
    if (n["idle_retry_ms"]) c.sampler.idle_retry = milliseconds(n["idle_retry_ms"].as<int>());
    if (n["pace_ms"]) c.sampler.pace = milliseconds(n["pace_ms"].as<int>());
  }

  if (y["inference"]) {
    auto n = y["inference"];
    if (n["task"]) c.inference.task = parse_task(n["task"].as<std::string>());
    if (n["model_path"]) c.inference.model_path = n["model_path"].as<std::string>();
    if (n["confidence_threshold"])
      c.inference.confidence_threshold = n["confidence_threshold"].as<float>();
    if (n["iou_threshold"]) c.inference.iou_threshold = n["iou_threshold"].as<float>();
    if (n["max_detections"]) c.inference.max_detections = n["max_detections"].as<int>();
    if (n["input_width"]) c.inference.input_size.width = n["input_width"].as<int>();
    if (n["input_height"]) c.inference.input_size.height = n["input_height"].as<int>();

    if (n["class_names"]) {
      c.inference.class_names.clear();
      for (const auto& name : n["class_names"]) {
        c.inference.class_names.push_back(name.as<std::string>());
      }
    }
  }

  if (y["server"]) {
    if (y["server"]["host"]) c.server.host = y["server"]["host"].as<std::string>();
    if (y["server"]["port"]) c.server.port = y["server"]["port"].as<int>();
  }
  if (y["logging"] && y["logging"]["level"])
    c.log_level = y["logging"]["level"].as<std::string>();

  if (c.delay_ms < 0) throw ConfigError("sampling.delay_ms must be >= 0");
  if (c.server.port <= 0 || c.server.port > 65535) throw ConfigError("server.port out of range");
  return c;
}

}  // namespace

AppConfig load_config(const std::string& path) {
  try {
    return parse(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw ConfigError("failed to load config '" + path + "': " + e.what());
  } catch (const ConfigError& e) {
    throw ConfigError("invalid config '" + path + "': " + e.what());
  }
}

void apply_log_level(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn" || level == "warning") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    spdlog::warn("Unknown log level '{}', using info", level);
    spdlog::set_level(spdlog::level::info);
  }
}
