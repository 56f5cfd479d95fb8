#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

// Decoded picture plus where it came from. `image` is BGR as delivered by
// the capture backend.
struct Frame {
  cv::Mat image;
  int64_t index{-1};
  double timestamp_sec{0.0};

  bool empty() const { return image.empty(); }

  // Deep copy; the returned frame shares no pixel storage with this one.
  Frame clone() const { return Frame{image.clone(), index, timestamp_sec}; }
};

enum class PlaybackState { Idle, Playing, Paused, Stopped };

inline const char* to_string(PlaybackState s) {
  switch (s) {
    case PlaybackState::Idle:    return "idle";
    case PlaybackState::Playing: return "playing";
    case PlaybackState::Paused:  return "paused";
    case PlaybackState::Stopped: return "stopped";
  }
  return "unknown";
}

struct PlaybackProgress {
  int64_t current_index{0};
  int64_t total_frames{0};
  double current_time_sec{0.0};
};

struct SourceProperties {
  double frame_rate{30.0};
  int64_t total_frames{1000};
  double duration_sec{0.0};
  bool live{false};
};

class SourceOpenError : public std::runtime_error {
public:
  explicit SourceOpenError(const std::string& what) : std::runtime_error(what) {}
};

class InferenceError : public std::runtime_error {
public:
  explicit InferenceError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
