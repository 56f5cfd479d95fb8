#include "controller.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <opencv2/imgcodecs.hpp>

#include "display.hpp"

using namespace std::chrono;

PipelineController::PipelineController(PlaybackConfig playback, SamplerConfig sampler,
                                       EventSink* display)
    : display_(display), engine_(*this, std::move(playback)), sampler_(engine_, *this, sampler) {}

PipelineController::~PipelineController() { stop_all(); }

void PipelineController::set_inferencer(std::shared_ptr<Inferencer> inferencer) {
  {
    std::lock_guard<std::mutex> g(mu_);
    inferencer_ = inferencer;
  }
  sampler_.set_inference_collaborator(std::move(inferencer));
}

bool PipelineController::has_inferencer() const {
  std::lock_guard<std::mutex> g(mu_);
  return inferencer_ != nullptr;
}

bool PipelineController::open_video(const std::string& path) { return engine_.play(path); }

bool PipelineController::open_camera(int device_index) { return engine_.play_camera(device_index); }

bool PipelineController::open_source(std::unique_ptr<MediaSource> source) {
  return engine_.play(std::move(source));
}

void PipelineController::toggle_pause() {
  if (engine_.state() == PlaybackState::Paused) {
    engine_.resume();
  } else {
    engine_.pause();
  }
}

void PipelineController::stop_all() {
  sampler_.stop_sampling();
  engine_.stop();
}

bool PipelineController::seek(int64_t frame_index) { return engine_.seek(frame_index); }

bool PipelineController::seek_permille(int permille) {
  auto props = engine_.properties();
  if (!props || props->live) return false;
  permille = std::clamp(permille, 0, 1000);
  const auto target =
      static_cast<int64_t>(static_cast<double>(permille) / 1000.0 * static_cast<double>(props->total_frames));
  spdlog::debug("Seek {}/1000 -> frame {}/{}", permille, target, props->total_frames);
  return engine_.seek(target);
}

bool PipelineController::start_processing(int interval) {
  if (!has_inferencer()) {
    report_error("No inference model configured; cannot start processing");
    return false;
  }
  sampler_.start_sampling(interval);
  return true;
}

bool PipelineController::start_processing_with_delay(int delay_ms) {
  return start_processing(interval_from_delay(delay_ms));
}

void PipelineController::stop_processing() { sampler_.stop_sampling(); }

int PipelineController::interval_from_delay(int delay_ms) { return std::max(1, delay_ms / 10); }

bool PipelineController::process_image(const std::string& path) {
  std::shared_ptr<Inferencer> inf;
  {
    std::lock_guard<std::mutex> g(mu_);
    inf = inferencer_;
  }
  if (!inf) {
    report_error("No inference model configured; cannot process image");
    return false;
  }

  cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
  if (image.empty()) {
    report_error("Cannot read image file: " + path);
    return false;
  }

  const auto t0 = Clock::now();
  InferenceResult r;
  try {
    r = inf->process(image);
  } catch (const std::exception& e) {
    report_error(fmt::format("Image processing failed for {}: {}", path, e.what()));
    return false;
  }
  const double latency_ms = duration<double, std::milli>(Clock::now() - t0).count();

  SampleOutcome o;
  o.latency_ms = latency_ms;
  o.detections = r.detection_count;
  if (r.avg_confidence) o.avg_confidence = static_cast<double>(*r.avg_confidence);
  if (r.label) {
    o.class_name = r.label->name;
    o.class_confidence = r.label->confidence;
    o.detections = r.label->confidence > 0.0f ? 1 : 0;
    o.avg_confidence = r.label->confidence;
  }
  image_stats_.reset(t0);
  image_stats_.observe();
  image_stats_.record(o, t0);
  StatSnapshot snap = image_stats_.snapshot();
  // A single still has no sampling cadence.
  snap.fps = 0.0;

  on_frame_ready(to_display_rgb(image));
  on_processed_frame(to_display_rgb(r.annotated.empty() ? image : r.annotated));
  on_processing_complete(snap);
  report_status(fmt::format("Processed image {} ({} detections, {:.1f} ms)", path,
                        snap.detection_count, latency_ms));
  return true;
}

bool PipelineController::save_screenshot(const std::string& path) {
  cv::Mat shot = latest_processed_frame();
  if (shot.empty()) shot = latest_display_frame();
  if (shot.empty()) {
    report_error("No image available for screenshot");
    return false;
  }

  std::string target = path.empty() ? "screenshot.png" : path;
  std::string ext = std::filesystem::path(target).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext != ".png" && ext != ".jpg" && ext != ".jpeg") target += ".png";

  if (!save_display_image(shot, target)) {
    report_error("Failed to save screenshot to " + target);
    return false;
  }
  report_status("Screenshot saved to " + target);
  return true;
}

PlaybackProgress PipelineController::progress() const {
  std::lock_guard<std::mutex> g(mu_);
  return progress_;
}

StatSnapshot PipelineController::stats() const {
  std::lock_guard<std::mutex> g(mu_);
  return stats_;
}

cv::Mat PipelineController::latest_display_frame() const {
  std::lock_guard<std::mutex> g(mu_);
  return display_frame_.clone();
}

cv::Mat PipelineController::latest_processed_frame() const {
  std::lock_guard<std::mutex> g(mu_);
  return processed_frame_.clone();
}

std::vector<LogEntry> PipelineController::recent_messages() const {
  std::lock_guard<std::mutex> g(mu_);
  return std::vector<LogEntry>(messages_.begin(), messages_.end());
}

std::string PipelineController::prometheus_text() const {
  return StatisticsAggregator::prometheus_text(stats());
}

void PipelineController::on_frame_ready(const cv::Mat& display_rgb) {
  {
    std::lock_guard<std::mutex> g(mu_);
    display_frame_ = display_rgb.clone();
  }
  if (display_) display_->on_frame_ready(display_rgb);
}

void PipelineController::on_processed_frame(const cv::Mat& display_rgb) {
  {
    std::lock_guard<std::mutex> g(mu_);
    processed_frame_ = display_rgb.clone();
  }
  if (display_) display_->on_processed_frame(display_rgb);
}

void PipelineController::on_progress(int64_t index, int64_t total, double seconds) {
  {
    std::lock_guard<std::mutex> g(mu_);
    progress_ = PlaybackProgress{index, total, seconds};
  }
  if (display_) display_->on_progress(index, total, seconds);
}

void PipelineController::on_status(const std::string& message) {
  push_message(LogEntry::Kind::Status, message);
  if (display_) display_->on_status(message);
}

void PipelineController::on_processing_complete(const StatSnapshot& stats) {
  {
    std::lock_guard<std::mutex> g(mu_);
    stats_ = stats;
  }
  if (display_) display_->on_processing_complete(stats);
}

void PipelineController::on_error(const std::string& message) {
  push_message(LogEntry::Kind::Error, message);
  if (display_) display_->on_error(message);
}

void PipelineController::on_finished() {
  if (display_) display_->on_finished();
}

void PipelineController::push_message(LogEntry::Kind kind, const std::string& message) {
  std::lock_guard<std::mutex> g(mu_);
  messages_.push_back(LogEntry{kind, message});
  while (messages_.size() > kMaxMessages) messages_.pop_front();
}

void PipelineController::report_status(const std::string& message) {
  spdlog::info("{}", message);
  on_status(message);
}

void PipelineController::report_error(const std::string& message) {
  spdlog::error("{}", message);
  on_error(message);
}
