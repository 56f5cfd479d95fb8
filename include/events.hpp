#pragma once
#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include "metrics.hpp"

// Receiver for everything the playback and sampling threads report. Methods
// are invoked on the worker thread that produced the event; implementations
// must be thread-safe and must not block for long.
class EventSink {
public:
  virtual ~EventSink() = default;

  virtual void on_frame_ready(const cv::Mat& /*display_rgb*/) {}
  virtual void on_processed_frame(const cv::Mat& /*display_rgb*/) {}
  virtual void on_progress(int64_t /*index*/, int64_t /*total*/, double /*seconds*/) {}
  virtual void on_status(const std::string& /*message*/) {}
  virtual void on_processing_complete(const StatSnapshot& /*stats*/) {}
  virtual void on_error(const std::string& /*message*/) {}
  virtual void on_finished() {}
};

// Used when the owner did not install a sink.
class NullEventSink : public EventSink {};
