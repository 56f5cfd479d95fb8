#include "media_source.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>

namespace {
constexpr double kDefaultFps = 30.0;
constexpr int64_t kDefaultTotalFrames = 1000;

bool is_device_index(const std::string& s) {
  return !s.empty() &&
         std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}
}  // namespace

OpenCvMediaSource::OpenCvMediaSource(const std::string& path, const CaptureOptions& opts)
    : name_(path), live_(false) {
  if (path.empty() || !cap_.open(path)) {
    throw SourceOpenError("cannot open video file '" + path + "'");
  }
  cap_.set(cv::CAP_PROP_BUFFERSIZE, opts.file_buffer_frames);
  probe_properties();
  opened_at_ = Clock::now();
  spdlog::info("Opened '{}' ({} frames @ {:.2f} fps)", name_, props_.total_frames,
               props_.frame_rate);
}

OpenCvMediaSource::OpenCvMediaSource(int device_index, const CaptureOptions& opts)
    : name_("camera:" + std::to_string(device_index)), live_(true) {
  if (device_index < 0 || !cap_.open(device_index)) {
    throw SourceOpenError("cannot open camera " + std::to_string(device_index));
  }
  cap_.set(cv::CAP_PROP_FRAME_WIDTH, opts.camera_width);
  cap_.set(cv::CAP_PROP_FRAME_HEIGHT, opts.camera_height);
  cap_.set(cv::CAP_PROP_BUFFERSIZE, opts.camera_buffer_frames);
  probe_properties();

  // First reads on some drivers stall; get them out of the way here.
  cv::Mat warm;
  for (int i = 0; i < opts.camera_warmup_reads; ++i) {
    if (!cap_.read(warm) || warm.empty()) break;
  }
  opened_at_ = Clock::now();
  spdlog::info("Opened {} (~{:.1f} fps)", name_, props_.frame_rate);
}

OpenCvMediaSource::~OpenCvMediaSource() { close(); }

void OpenCvMediaSource::probe_properties() {
  props_.live = live_;

  double fps = cap_.get(cv::CAP_PROP_FPS);
  props_.frame_rate = (std::isfinite(fps) && fps > 0.0) ? fps : kDefaultFps;

  double count = cap_.get(cv::CAP_PROP_FRAME_COUNT);
  if (!live_ && std::isfinite(count) && count > 0.0) {
    props_.total_frames = static_cast<int64_t>(count);
    props_.duration_sec = static_cast<double>(props_.total_frames) / props_.frame_rate;
  } else {
    props_.total_frames = kDefaultTotalFrames;
    props_.duration_sec = 0.0;
  }
}

std::optional<Frame> OpenCvMediaSource::read_next() {
  std::lock_guard<std::mutex> g(mu_);
  if (!cap_.isOpened()) return std::nullopt;

  Frame f;
  if (!cap_.read(f.image) || f.image.empty()) return std::nullopt;

  f.index = next_index_++;
  if (live_) {
    f.timestamp_sec = std::chrono::duration<double>(Clock::now() - opened_at_).count();
  } else {
    f.timestamp_sec = static_cast<double>(f.index) / props_.frame_rate;
  }
  return f;
}

void OpenCvMediaSource::seek(int64_t frame_index) {
  std::lock_guard<std::mutex> g(mu_);
  if (live_ || !cap_.isOpened()) return;
  int64_t target = std::clamp<int64_t>(frame_index, 0, std::max<int64_t>(0, props_.total_frames - 1));
  if (!cap_.set(cv::CAP_PROP_POS_FRAMES, static_cast<double>(target))) {
    spdlog::debug("{}: backend refused seek to {}", name_, target);
  }
  next_index_ = target;
}

SourceProperties OpenCvMediaSource::properties() const { return props_; }

void OpenCvMediaSource::close() {
  std::lock_guard<std::mutex> g(mu_);
  if (cap_.isOpened()) {
    cap_.release();
    spdlog::debug("Released {}", name_);
  }
}

bool OpenCvMediaSource::is_open() const {
  std::lock_guard<std::mutex> g(mu_);
  return cap_.isOpened();
}

std::unique_ptr<MediaSource> open_media_source(const std::string& identifier,
                                               const CaptureOptions& opts) {
  if (is_device_index(identifier)) {
    return std::make_unique<OpenCvMediaSource>(std::stoi(identifier), opts);
  }
  return std::make_unique<OpenCvMediaSource>(identifier, opts);
}
