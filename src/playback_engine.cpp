#include "playback_engine.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include "display.hpp"

using namespace std::chrono;

namespace {
// Consecutive decode exceptions tolerated on a finite source before the run
// is abandoned. Live sources retry until stopped.
constexpr int kMaxFileReadFailures = 3;

// Engine whose decode loop runs on this thread, if any.
thread_local const PlaybackEngine* t_decoding_engine = nullptr;
}  // namespace

PlaybackEngine::Run::~Run() {
  if (source) source->close();
}

PlaybackEngine::PlaybackEngine(EventSink& sink, PlaybackConfig cfg)
    : sink_(sink), cfg_(std::move(cfg)) {}

PlaybackEngine::~PlaybackEngine() { stop(); }

bool PlaybackEngine::play(const std::string& source_identifier) {
  std::unique_ptr<MediaSource> src;
  try {
    src = open_media_source(source_identifier, cfg_.capture);
  } catch (const SourceOpenError& e) {
    error(e.what());
    return false;
  }
  return play(std::move(src));
}

bool PlaybackEngine::play_camera(int device_index) {
  std::unique_ptr<MediaSource> src;
  try {
    src = std::make_unique<OpenCvMediaSource>(device_index, cfg_.capture);
  } catch (const SourceOpenError& e) {
    error(e.what());
    return false;
  }
  return play(std::move(src));
}

bool PlaybackEngine::play(std::unique_ptr<MediaSource> source) {
  if (!source || !source->is_open()) {
    error("Cannot play: source is not open");
    return false;
  }

  std::unique_lock<std::mutex> cmd = lock_commands();
  if (!cmd.owns_lock()) {
    error("Cannot play: another playback command is in progress");
    return false;
  }
  stop_locked();

  auto run = std::make_shared<Run>();
  run->props = source->properties();
  run->source = std::move(source);
  run->loop_playback = cfg_.loop_playback;
  run->read_retry_delay = cfg_.read_retry_delay;

  {
    std::lock_guard<std::mutex> g(progress_mu_);
    progress_ = PlaybackProgress{0, run->props.total_frames, 0.0};
  }
  {
    std::lock_guard<std::mutex> g(run_mu_);
    run_ = run;
  }

  if (run->props.live) {
    status("Live view: " + run->source->describe());
  } else {
    status(fmt::format("Playing {}: {} frames @ {:.2f} fps", run->source->describe(),
                       run->props.total_frames, run->props.frame_rate));
  }

  state_ = PlaybackState::Playing;
  loop_thread_ = std::thread([this, run] { decode_loop(run); });
  return true;
}

void PlaybackEngine::pause() {
  auto run = current_run();
  if (!run) return;
  PlaybackState expected = PlaybackState::Playing;
  if (state_.compare_exchange_strong(expected, PlaybackState::Paused)) {
    run->gate.close();
    spdlog::debug("Playback paused");
  }
}

void PlaybackEngine::resume() {
  auto run = current_run();
  if (!run) return;
  PlaybackState expected = PlaybackState::Paused;
  if (state_.compare_exchange_strong(expected, PlaybackState::Playing)) {
    run->gate.open();
    spdlog::debug("Playback resumed");
  }
}

void PlaybackEngine::stop() {
  std::unique_lock<std::mutex> cmd = lock_commands();
  if (!cmd.owns_lock()) {
    // The command in progress stops or replaces this run.
    if (auto run = current_run()) {
      state_ = PlaybackState::Stopped;
      run->gate.cancel();
    }
    return;
  }
  stop_locked();
}

bool PlaybackEngine::on_decode_thread() const { return t_decoding_engine == this; }

std::unique_lock<std::mutex> PlaybackEngine::lock_commands() {
  if (on_decode_thread()) return std::unique_lock<std::mutex>(cmd_mu_, std::try_to_lock);
  return std::unique_lock<std::mutex>(cmd_mu_);
}

void PlaybackEngine::stop_locked() {
  std::shared_ptr<Run> run = current_run();
  if (!run) {
    state_ = PlaybackState::Idle;
    return;
  }

  state_ = PlaybackState::Stopped;
  run->gate.cancel();

  bool exited = false;
  if (loop_thread_.joinable() && loop_thread_.get_id() == std::this_thread::get_id()) {
    // Called from one of this run's event callbacks; the loop sees the
    // cancelled gate as soon as the callback returns.
    loop_thread_.detach();
  } else {
    {
      std::unique_lock<std::mutex> lk(run->done_mu);
      exited = run->done_cv.wait_for(lk, cfg_.join_timeout, [&] { return run->done; });
    }
    if (!exited) {
      spdlog::warn("Decode thread did not exit within {} ms; detaching",
                   cfg_.join_timeout.count());
      // Waits out a callback already in progress; later ones see the
      // cancelled gate.
      std::lock_guard<std::mutex> fence(run->emit_mu);
    }
    if (loop_thread_.joinable()) {
      if (exited) {
        loop_thread_.join();
      } else {
        loop_thread_.detach();
      }
    }
  }

  // A thread still running owns a reference; the source is closed when it
  // drops it.
  if (exited) run->source->close();

  {
    std::lock_guard<std::mutex> g(run_mu_);
    run_.reset();
  }
  state_ = PlaybackState::Idle;
  finish(*run);
}

bool PlaybackEngine::seek(int64_t frame_index) {
  auto run = current_run();
  if (!run || run->props.live) return false;
  if (on_decode_thread()) {
    spdlog::warn("seek() from a playback callback ignored");
    return false;
  }

  std::lock_guard<std::mutex> step(run->step_mu);
  if (run->gate.cancelled()) return false;

  try {
    run->source->seek(frame_index);
    std::optional<Frame> f = run->source->read_next();
    if (!f) {
      status(fmt::format("Seek to frame {} returned no frame", frame_index));
      return false;
    }
    if (!emit(*run, [&] { publish(*run, *f); })) return false;
  } catch (const std::exception& e) {
    error(fmt::format("Seek to frame {} failed: {}", frame_index, e.what()));
    return false;
  }
  return true;
}

std::optional<Frame> PlaybackEngine::get_current_frame() const {
  auto run = current_run();
  if (!run) return std::nullopt;
  return run->slot.load();
}

PlaybackProgress PlaybackEngine::progress() const {
  std::lock_guard<std::mutex> g(progress_mu_);
  return progress_;
}

std::optional<SourceProperties> PlaybackEngine::properties() const {
  auto run = current_run();
  if (!run) return std::nullopt;
  return run->props;
}

std::shared_ptr<PlaybackEngine::Run> PlaybackEngine::current_run() const {
  std::lock_guard<std::mutex> g(run_mu_);
  return run_;
}

// Only `run` is dereferenced outside emit(): once stop() has cancelled the
// run and passed its emit lock, the engine may already be gone.
void PlaybackEngine::decode_loop(std::shared_ptr<Run> run) {
  t_decoding_engine = this;

  MediaSource& src = *run->source;
  const bool live = run->props.live;
  const duration<double> period(1.0 / std::max(1e-3, run->props.frame_rate));

  int failures = 0;
  bool rewound = false;

  while (true) {
    if (!run->gate.is_open() && !run->gate.wait()) break;
    if (run->gate.cancelled()) break;

    const auto loop_t0 = Clock::now();
    bool got_frame = false;
    bool end_run = false;

    {
      std::lock_guard<std::mutex> step(run->step_mu);
      if (run->gate.cancelled()) break;
      // Paused between the gate check and here.
      if (!run->gate.is_open()) continue;

      try {
        std::optional<Frame> f = src.read_next();
        if (f) {
          failures = 0;
          rewound = false;
          if (!emit(*run, [&] { publish(*run, *f); })) break;
          got_frame = true;
        } else if (live) {
          ++failures;
          emit(*run, [&] { status(fmt::format("Camera read failed ({} in a row)", failures)); });
        } else if (!run->loop_playback) {
          emit(*run, [&] { status("End of stream"); });
          end_run = true;
        } else if (rewound) {
          emit(*run, [&] { error(src.describe() + ": no decodable frames after rewind"); });
          end_run = true;
        } else {
          src.seek(0);
          rewound = true;
          spdlog::debug("{}: end of stream, rewinding", src.describe());
          continue;
        }
      } catch (const std::exception& e) {
        ++failures;
        emit(*run, [&] { error(fmt::format("Decode error on {}: {}", src.describe(), e.what())); });
        if (!live && failures >= kMaxFileReadFailures) end_run = true;
      }
    }

    if (end_run) break;

    if (!got_frame) {
      if (!run->gate.sleep_for(run->read_retry_delay)) break;
      continue;
    }

    const auto elapsed = Clock::now() - loop_t0;
    if (elapsed < period && !run->gate.sleep_for(period - elapsed)) break;
  }

  emit(*run, [&] {
    // Ended on its own; stop() was not involved.
    state_ = PlaybackState::Idle;
    finish(*run);
  });

  {
    std::lock_guard<std::mutex> lk(run->done_mu);
    run->done = true;
  }
  run->done_cv.notify_all();
}

void PlaybackEngine::publish(Run& run, const Frame& f) {
  run.slot.store(f);

  if (!run.props.live) {
    PlaybackProgress p{f.index, run.props.total_frames,
                       static_cast<double>(f.index) / run.props.frame_rate};
    {
      std::lock_guard<std::mutex> g(progress_mu_);
      progress_ = p;
    }
    sink_.on_progress(p.current_index, p.total_frames, p.current_time_sec);
    // The callback may have stopped or replaced this run.
    if (run.gate.cancelled()) return;
  }

  sink_.on_frame_ready(to_display_rgb(f.image));
}

void PlaybackEngine::finish(Run& run) {
  if (!run.finished_emitted.exchange(true)) sink_.on_finished();
}

void PlaybackEngine::status(const std::string& msg) {
  spdlog::info("{}", msg);
  sink_.on_status(msg);
}

void PlaybackEngine::error(const std::string& msg) {
  spdlog::error("{}", msg);
  sink_.on_error(msg);
}
