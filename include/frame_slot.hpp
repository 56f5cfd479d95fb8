#pragma once
#include <mutex>
#include <optional>

#include "types.hpp"

// Latest-wins single cell shared between the decode loop and its readers.
// Frames are cloned on the way in and on the way out, so no caller ever
// holds storage that the decoder can still write to.
class CurrentFrameSlot {
public:
  void store(const Frame& f) {
    Frame copy = f.clone();
    std::lock_guard<std::mutex> g(mu_);
    frame_ = std::move(copy);
  }

  std::optional<Frame> load() const {
    std::lock_guard<std::mutex> g(mu_);
    if (!frame_) return std::nullopt;
    return frame_->clone();
  }

  void clear() {
    std::lock_guard<std::mutex> g(mu_);
    frame_.reset();
  }

  bool has_frame() const {
    std::lock_guard<std::mutex> g(mu_);
    return frame_.has_value();
  }

private:
  mutable std::mutex mu_;
  std::optional<Frame> frame_;
};
