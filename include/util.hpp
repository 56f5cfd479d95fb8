#pragma once
#include <string>

#include "frame_sampler.hpp"
#include "inference.hpp"
#include "playback_engine.hpp"
#include "types.hpp"

struct SourceConfig {
  std::string uri;
  int camera_index{-1};  // -1: no camera configured
};

struct ServerConfig {
  std::string host{"0.0.0.0"};
  int port{8080};
};

struct AppConfig {
  SourceConfig source;
  PlaybackConfig playback;
  SamplerConfig sampler;
  int delay_ms{50};
  InferenceConfig inference;
  ServerConfig server;
  std::string log_level{"info"};
};

// Missing keys keep their defaults. Throws ConfigError on unreadable or
// malformed files.
AppConfig load_config(const std::string& path);

// debug|info|warn|error; anything else falls back to info with a warning.
void apply_log_level(const std::string& level);
