#include "metrics.hpp"

#include <chrono>
#include <sstream>

void StatisticsAggregator::reset(TimePoint session_start) {
  std::lock_guard<std::mutex> g(mu_);
  cur_ = StatSnapshot{};
  prev_sample_ = session_start;
  latency_.clear();
}

void StatisticsAggregator::observe() {
  std::lock_guard<std::mutex> g(mu_);
  cur_.frames_observed++;
}

void StatisticsAggregator::record(const SampleOutcome& o, TimePoint sampled_at) {
  latency_.add(o.latency_ms);

  std::lock_guard<std::mutex> g(mu_);
  cur_.total_frames_processed++;
  cur_.total_inference_ms += o.latency_ms;
  cur_.last_inference_ms = o.latency_ms;
  cur_.avg_inference_ms =
      cur_.total_inference_ms / static_cast<double>(cur_.total_frames_processed);

  if (o.detections) {
    cur_.detection_count = *o.detections;
    if (*o.detections > 0) cur_.total_detections += static_cast<uint64_t>(*o.detections);
  } else {
    cur_.detection_count = 0;
  }

  double gap = std::chrono::duration<double>(sampled_at - prev_sample_).count();
  cur_.fps = gap > 0.0 ? 1.0 / gap : 0.0;
  prev_sample_ = sampled_at;

  cur_.avg_confidence = o.avg_confidence.value_or(0.0);
  cur_.class_name = o.class_name;
  cur_.class_confidence = o.class_name.empty() ? 0.0 : o.class_confidence;
}

StatSnapshot StatisticsAggregator::snapshot() const {
  StatSnapshot s;
  {
    std::lock_guard<std::mutex> g(mu_);
    s = cur_;
  }
  s.inf_p50 = latency_.perc(50);
  s.inf_p95 = latency_.perc(95);
  s.inf_p99 = latency_.perc(99);
  return s;
}

std::string StatisticsAggregator::prometheus_text(const StatSnapshot& s) {
  std::ostringstream os;
  os << "frametap_frames_observed_total " << s.frames_observed << "\n";
  os << "frametap_frames_processed_total " << s.total_frames_processed << "\n";
  os << "frametap_detections_total " << s.total_detections << "\n";
  os << "frametap_inference_ms{quantile=\"0.5\"} " << s.inf_p50 << "\n";
  os << "frametap_inference_ms{quantile=\"0.95\"} " << s.inf_p95 << "\n";
  os << "frametap_inference_ms{quantile=\"0.99\"} " << s.inf_p99 << "\n";
  os << "frametap_inference_ms_avg " << s.avg_inference_ms << "\n";
  os << "frametap_sample_fps " << s.fps << "\n";
  return os.str();
}
