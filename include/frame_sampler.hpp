#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "events.hpp"
#include "gate.hpp"
#include "inference.hpp"
#include "metrics.hpp"
#include "playback_engine.hpp"

struct SamplerConfig {
  // Wait before re-polling an empty slot.
  std::chrono::milliseconds idle_retry{100};
  // Fixed pause after every pass; caps sampling at 1000/pace passes per second.
  std::chrono::milliseconds pace{50};
  std::chrono::milliseconds join_timeout{1000};
};

// Consumer: polls whatever frame is current, forwards every Nth observed one
// to the inference collaborator and reports results. Never waits for a
// particular frame, so playback is never throttled by inference.
class FrameSampler {
public:
  FrameSampler(const FrameProvider& provider, EventSink& sink,
               SamplerConfig cfg = SamplerConfig{});
  ~FrameSampler();

  FrameSampler(const FrameSampler&) = delete;
  FrameSampler& operator=(const FrameSampler&) = delete;

  // interval: submit every Nth observed frame. Values below 1 are treated
  // as 1. Restarts the session if one is running.
  void start_sampling(int interval);
  void stop_sampling();
  void set_inference_collaborator(std::shared_ptr<Inferencer> collaborator);

  bool sampling() const { return sampling_.load(); }
  int interval() const { return interval_.load(); }
  // Statistics of the running session, or of the last one after a stop.
  StatSnapshot stats() const;

private:
  // Everything a sampling thread touches lives here, so a thread detached
  // after the join timeout never needs the sampler.
  struct Session {
    int interval{1};
    std::chrono::milliseconds idle_retry{100};
    std::chrono::milliseconds pace{50};
    std::shared_ptr<StatisticsAggregator> stats;
    Gate gate;

    // Held while the loop calls into the provider, the sampler or the sink.
    // stop_sampling() takes it once after cancelling.
    std::mutex emit_mu;

    std::mutex done_mu;
    std::condition_variable done_cv;
    bool done{false};
  };

  // Runs fn under the session's emit lock unless it has been cancelled.
  template <class Fn>
  bool emit(Session& s, Fn&& fn) {
    std::lock_guard<std::mutex> g(s.emit_mu);
    if (s.gate.cancelled()) return false;
    fn();
    return true;
  }

  bool on_sampling_thread() const;
  std::unique_lock<std::mutex> lock_commands();

  std::shared_ptr<Inferencer> collaborator() const;
  void sample_loop(std::shared_ptr<Session> session);
  void sample_once(Session& s, Inferencer& inf, const Frame& f);
  void stop_locked();

  const FrameProvider& provider_;
  EventSink& sink_;
  SamplerConfig cfg_;

  std::mutex cmd_mu_;
  std::shared_ptr<Session> session_;
  std::thread loop_thread_;

  mutable std::mutex inf_mu_;
  std::shared_ptr<Inferencer> inferencer_;

  std::atomic<bool> sampling_{false};
  std::atomic<int> interval_{1};

  mutable std::mutex stats_mu_;
  std::shared_ptr<StatisticsAggregator> stats_;
};
