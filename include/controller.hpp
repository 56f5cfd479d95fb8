#pragma once
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "events.hpp"
#include "frame_sampler.hpp"
#include "inference.hpp"
#include "playback_engine.hpp"

struct LogEntry {
  enum class Kind { Status, Error };
  Kind kind;
  std::string message;
};

// Glue between the command surface and the two worker loops. Receives every
// worker event, keeps the latest frames/progress/statistics for polling
// clients, and forwards events to an optional downstream display sink.
class PipelineController : public EventSink {
public:
  explicit PipelineController(PlaybackConfig playback = PlaybackConfig{},
                              SamplerConfig sampler = SamplerConfig{},
                              EventSink* display = nullptr);
  ~PipelineController() override;

  PipelineController(const PipelineController&) = delete;
  PipelineController& operator=(const PipelineController&) = delete;

  void set_inferencer(std::shared_ptr<Inferencer> inferencer);
  bool has_inferencer() const;

  bool open_video(const std::string& path);
  bool open_camera(int device_index);
  bool open_source(std::unique_ptr<MediaSource> source);
  void pause() { engine_.pause(); }
  void resume() { engine_.resume(); }
  void toggle_pause();
  void stop_all();

  bool seek(int64_t frame_index);
  // Position as a fraction of 1000 of the total frame count.
  bool seek_permille(int permille);

  bool start_processing(int interval);
  bool start_processing_with_delay(int delay_ms);
  void stop_processing();

  // One-shot run of the collaborator over an image file.
  bool process_image(const std::string& path);
  // Writes the latest processed frame, or the latest display frame if none.
  bool save_screenshot(const std::string& path);

  PlaybackState state() const { return engine_.state(); }
  PlaybackProgress progress() const;
  StatSnapshot stats() const;
  bool processing() const { return sampler_.sampling(); }
  cv::Mat latest_display_frame() const;
  cv::Mat latest_processed_frame() const;
  std::vector<LogEntry> recent_messages() const;
  std::string prometheus_text() const;

  // Sampling interval for a UI delay setting: one sample per 10 ms of delay.
  static int interval_from_delay(int delay_ms);

  // EventSink
  void on_frame_ready(const cv::Mat& display_rgb) override;
  void on_processed_frame(const cv::Mat& display_rgb) override;
  void on_progress(int64_t index, int64_t total, double seconds) override;
  void on_status(const std::string& message) override;
  void on_processing_complete(const StatSnapshot& stats) override;
  void on_error(const std::string& message) override;
  void on_finished() override;

private:
  void push_message(LogEntry::Kind kind, const std::string& message);
  // Controller-originated events; worker events are logged where they arise.
  void report_status(const std::string& message);
  void report_error(const std::string& message);

  static constexpr size_t kMaxMessages = 64;

  EventSink* display_;

  mutable std::mutex mu_;
  cv::Mat display_frame_;
  cv::Mat processed_frame_;
  PlaybackProgress progress_{};
  StatSnapshot stats_{};
  std::deque<LogEntry> messages_;
  std::shared_ptr<Inferencer> inferencer_;
  StatisticsAggregator image_stats_;

  // Declared last: the workers call back into the members above.
  PlaybackEngine engine_;
  FrameSampler sampler_;
};
