#include "frame_sampler.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include "display.hpp"

using namespace std::chrono;

namespace {
// Sampler whose loop runs on this thread, if any.
thread_local const FrameSampler* t_sampling = nullptr;
}  // namespace

FrameSampler::FrameSampler(const FrameProvider& provider, EventSink& sink, SamplerConfig cfg)
    : provider_(provider),
      sink_(sink),
      cfg_(cfg),
      stats_(std::make_shared<StatisticsAggregator>()) {}

FrameSampler::~FrameSampler() { stop_sampling(); }

void FrameSampler::set_inference_collaborator(std::shared_ptr<Inferencer> collaborator) {
  std::lock_guard<std::mutex> g(inf_mu_);
  inferencer_ = std::move(collaborator);
  spdlog::info("Inference collaborator: {}", inferencer_ ? inferencer_->name() : "none");
}

std::shared_ptr<Inferencer> FrameSampler::collaborator() const {
  std::lock_guard<std::mutex> g(inf_mu_);
  return inferencer_;
}

StatSnapshot FrameSampler::stats() const {
  std::lock_guard<std::mutex> g(stats_mu_);
  return stats_->snapshot();
}

bool FrameSampler::on_sampling_thread() const { return t_sampling == this; }

// Sink callbacks run on the sampling thread, possibly while a stop on another
// thread waits for the session's emit lock; there the lock is only tried.
std::unique_lock<std::mutex> FrameSampler::lock_commands() {
  if (on_sampling_thread()) return std::unique_lock<std::mutex>(cmd_mu_, std::try_to_lock);
  return std::unique_lock<std::mutex>(cmd_mu_);
}

void FrameSampler::start_sampling(int interval) {
  std::unique_lock<std::mutex> cmd = lock_commands();
  if (!cmd.owns_lock()) {
    spdlog::warn("start_sampling() ignored: another sampling command is in progress");
    return;
  }
  stop_locked();

  if (interval < 1) {
    spdlog::warn("Sampling interval {} is below 1; using 1", interval);
    interval = 1;
  }
  interval_ = interval;

  auto session = std::make_shared<Session>();
  session->interval = interval;
  session->idle_retry = cfg_.idle_retry;
  session->pace = cfg_.pace;
  session->stats = std::make_shared<StatisticsAggregator>();
  session->stats->reset(Clock::now());
  {
    std::lock_guard<std::mutex> g(stats_mu_);
    stats_ = session->stats;
  }
  session_ = session;
  sampling_ = true;

  const std::string msg = fmt::format("Sampling every {} observed frame(s)", interval);
  spdlog::info("{}", msg);
  sink_.on_status(msg);

  loop_thread_ = std::thread([this, session] { sample_loop(session); });
}

void FrameSampler::stop_sampling() {
  std::unique_lock<std::mutex> cmd = lock_commands();
  if (!cmd.owns_lock()) {
    spdlog::warn("stop_sampling() ignored: another sampling command is in progress");
    return;
  }
  stop_locked();
}

void FrameSampler::stop_locked() {
  if (!session_) return;
  std::shared_ptr<Session> session = std::move(session_);
  session->gate.cancel();

  if (loop_thread_.joinable() && loop_thread_.get_id() == std::this_thread::get_id()) {
    // Called from a sink callback of this session; the loop sees the
    // cancelled gate as soon as the callback returns.
    loop_thread_.detach();
  } else {
    bool exited = true;
    {
      std::unique_lock<std::mutex> lk(session->done_mu);
      exited = session->done_cv.wait_for(lk, cfg_.join_timeout, [&] { return session->done; });
    }
    if (!exited) {
      spdlog::warn("Sampling thread did not exit within {} ms; detaching",
                   cfg_.join_timeout.count());
      // Waits out a callback already in progress; later ones see the
      // cancelled gate.
      std::lock_guard<std::mutex> fence(session->emit_mu);
    }
    if (loop_thread_.joinable()) {
      if (exited) {
        loop_thread_.join();
      } else {
        loop_thread_.detach();
      }
    }
  }

  sampling_ = false;
  spdlog::info("Sampling stopped ({} frames processed)",
               session->stats->snapshot().total_frames_processed);
  sink_.on_finished();
}

// Only `session` is dereferenced outside emit(): once stop_sampling() has
// cancelled it and passed its emit lock, the sampler may already be gone.
void FrameSampler::sample_loop(std::shared_ptr<Session> session) {
  t_sampling = this;
  Session& s = *session;
  uint64_t observed = 0;

  while (!s.gate.cancelled()) {
    std::optional<Frame> f;
    std::shared_ptr<Inferencer> inf;
    if (!emit(s, [&] {
          f = provider_.get_current_frame();
          inf = collaborator();
        })) {
      break;
    }
    if (!f) {
      if (!s.gate.sleep_for(s.idle_retry)) break;
      continue;
    }

    ++observed;
    s.stats->observe();

    if (inf && observed % static_cast<uint64_t>(s.interval) == 0) sample_once(s, *inf, *f);

    if (!s.gate.sleep_for(s.pace)) break;
  }

  {
    std::lock_guard<std::mutex> lk(s.done_mu);
    s.done = true;
  }
  s.done_cv.notify_all();
}

void FrameSampler::sample_once(Session& s, Inferencer& inf, const Frame& f) {
  const auto sampled_at = Clock::now();
  SampleOutcome o;
  cv::Mat shown;
  try {
    InferenceResult r = inf.process(f.image);
    o.latency_ms = duration<double, std::milli>(Clock::now() - sampled_at).count();
    o.detections = r.detection_count;
    if (r.avg_confidence) o.avg_confidence = static_cast<double>(*r.avg_confidence);
    if (r.label) {
      o.class_name = r.label->name;
      o.class_confidence = r.label->confidence;
    }
    shown = to_display_rgb(r.annotated.empty() ? f.image : r.annotated);
  } catch (const std::exception& e) {
    const std::string msg = fmt::format("Frame processing error (frame {}): {}", f.index, e.what());
    emit(s, [&] {
      spdlog::error("{}", msg);
      sink_.on_error(msg);
    });
    return;
  }

  // A session stopped while the call was running drops its result.
  const bool delivered = emit(s, [&] {
    s.stats->record(o, sampled_at);
    sink_.on_processed_frame(shown);
    sink_.on_processing_complete(s.stats->snapshot());
  });
  if (delivered) {
    spdlog::debug("Frame {} -> {} in {:.1f} ms", f.index, inf.name(), o.latency_ms);
  } else {
    spdlog::debug("Frame {} result dropped: sampling stopped", f.index);
  }
}
