#pragma once
#include <algorithm>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }
  void clear() {
    std::lock_guard<std::mutex> g(mu_);
    vals_.clear();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct StatSnapshot {
  uint64_t frames_observed{0};
  uint64_t total_frames_processed{0};
  uint64_t total_detections{0};
  int detection_count{0};  // reported by the latest sample
  double total_inference_ms{0};
  double avg_inference_ms{0};
  double last_inference_ms{0};
  double inf_p50{0}, inf_p95{0}, inf_p99{0};
  double fps{0};
  double avg_confidence{0};
  std::string class_name;
  double class_confidence{0};
};

// What one inference call contributed to the session.
struct SampleOutcome {
  double latency_ms{0};
  std::optional<int> detections;
  std::optional<double> avg_confidence;
  std::string class_name;
  double class_confidence{0};
};

// Session accumulator for the sampling loop. Written by the sampling thread,
// snapshot() may be called from any thread.
class StatisticsAggregator {
public:
  explicit StatisticsAggregator(size_t window = 256) : latency_(window) {}

  void reset(TimePoint session_start);
  void observe();
  void record(const SampleOutcome& o, TimePoint sampled_at);

  StatSnapshot snapshot() const;
  // Prometheus exposition text for a snapshot.
  static std::string prometheus_text(const StatSnapshot& s);

private:
  mutable std::mutex mu_;
  StatSnapshot cur_{};
  TimePoint prev_sample_{};
  RollingHist latency_;
};
