#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <opencv2/videoio.hpp>

#include "types.hpp"

// Sequential frame producer over a file or a capture device. Implementations
// have no threads of their own; close() must be idempotent and callable from
// a thread other than the reader.
class MediaSource {
public:
  virtual ~MediaSource() = default;

  // Next frame, or nullopt at end of stream / on a failed read.
  virtual std::optional<Frame> read_next() = 0;
  // Best effort; clamps to [0, total_frames).
  virtual void seek(int64_t frame_index) = 0;
  virtual SourceProperties properties() const = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
  virtual std::string describe() const = 0;
};

struct CaptureOptions {
  int camera_width{640};
  int camera_height{480};
  int camera_buffer_frames{1};
  int file_buffer_frames{2};
  int camera_warmup_reads{3};
};

class OpenCvMediaSource : public MediaSource {
public:
  // Both throw SourceOpenError when the backend cannot open the target.
  OpenCvMediaSource(const std::string& path, const CaptureOptions& opts = CaptureOptions{});
  OpenCvMediaSource(int device_index, const CaptureOptions& opts = CaptureOptions{});
  ~OpenCvMediaSource() override;

  std::optional<Frame> read_next() override;
  void seek(int64_t frame_index) override;
  SourceProperties properties() const override;
  void close() override;
  bool is_open() const override;
  std::string describe() const override { return name_; }

private:
  void probe_properties();

  std::string name_;
  bool live_;
  SourceProperties props_;

  mutable std::mutex mu_;
  cv::VideoCapture cap_;
  int64_t next_index_{0};
  TimePoint opened_at_{};
};

// "0", "1", ... open a camera; anything else is treated as a file path.
std::unique_ptr<MediaSource> open_media_source(const std::string& identifier,
                                               const CaptureOptions& opts = CaptureOptions{});
