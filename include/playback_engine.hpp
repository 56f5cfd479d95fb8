#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "events.hpp"
#include "frame_slot.hpp"
#include "gate.hpp"
#include "media_source.hpp"
#include "types.hpp"

struct PlaybackConfig {
  // Finite sources rewind to frame 0 at end of stream instead of finishing.
  bool loop_playback{true};
  std::chrono::milliseconds join_timeout{1000};
  std::chrono::milliseconds read_retry_delay{20};
  CaptureOptions capture;
};

// Read side of the current-frame slot, as seen by the sampler.
class FrameProvider {
public:
  virtual ~FrameProvider() = default;
  virtual std::optional<Frame> get_current_frame() const = 0;
};

// Producer: decodes one MediaSource at its native rate on a dedicated thread
// and publishes every frame to the slot and to the EventSink.
class PlaybackEngine : public FrameProvider {
public:
  explicit PlaybackEngine(EventSink& sink, PlaybackConfig cfg = PlaybackConfig{});
  ~PlaybackEngine() override;

  PlaybackEngine(const PlaybackEngine&) = delete;
  PlaybackEngine& operator=(const PlaybackEngine&) = delete;

  // File path, or a device index given as digits. Returns false and reports
  // an error event when the source cannot be opened; the engine stays Idle.
  bool play(const std::string& source_identifier);
  bool play_camera(int device_index);
  // Takes ownership of an already opened source.
  bool play(std::unique_ptr<MediaSource> source);

  void pause();
  void resume();
  void stop();
  // Synchronous reposition + decode of one frame; works while paused.
  // Returns false when called from an event callback of the decode thread.
  bool seek(int64_t frame_index);

  std::optional<Frame> get_current_frame() const override;
  PlaybackState state() const { return state_.load(); }
  PlaybackProgress progress() const;
  std::optional<SourceProperties> properties() const;

private:
  // Everything a decode thread touches lives here, so a thread detached after
  // the join timeout never needs the engine.
  struct Run {
    std::unique_ptr<MediaSource> source;
    SourceProperties props;
    bool loop_playback{true};
    std::chrono::milliseconds read_retry_delay{20};
    Gate gate;
    CurrentFrameSlot slot;
    std::atomic<bool> finished_emitted{false};

    // Held for one read+publish step, by the decode loop or by seek().
    std::mutex step_mu;
    // Held while the loop calls into the engine or the sink. stop() takes it
    // once after cancelling, so no callback from this run can follow.
    std::mutex emit_mu;

    std::mutex done_mu;
    std::condition_variable done_cv;
    bool done{false};

    ~Run();
  };

  // Runs fn under the run's emit lock unless the run has been cancelled.
  template <class Fn>
  bool emit(Run& run, Fn&& fn) {
    std::lock_guard<std::mutex> g(run.emit_mu);
    if (run.gate.cancelled()) return false;
    fn();
    return true;
  }

  bool on_decode_thread() const;
  // Event callbacks run on the decode thread, possibly while stop() on another
  // thread waits for this run's emit lock; there the lock is only tried.
  std::unique_lock<std::mutex> lock_commands();

  std::shared_ptr<Run> current_run() const;
  void stop_locked();
  void decode_loop(std::shared_ptr<Run> run);
  void publish(Run& run, const Frame& f);
  void finish(Run& run);
  void status(const std::string& msg);
  void error(const std::string& msg);

  EventSink& sink_;
  PlaybackConfig cfg_;

  std::mutex cmd_mu_;  // serializes play/stop
  mutable std::mutex run_mu_;
  std::shared_ptr<Run> run_;
  std::thread loop_thread_;

  std::atomic<PlaybackState> state_{PlaybackState::Idle};

  mutable std::mutex progress_mu_;
  PlaybackProgress progress_{};
};
