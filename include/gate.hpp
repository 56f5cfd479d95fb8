#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

// Binary pause gate with a one-way stop latch. Worker loops block on it while
// closed and use sleep_for() as an interruptible sleep.
class Gate {
public:
  void open() {
    {
      std::lock_guard<std::mutex> g(mu_);
      open_ = true;
    }
    cv_.notify_all();
  }

  void close() {
    {
      std::lock_guard<std::mutex> g(mu_);
      open_ = false;
    }
    cv_.notify_all();
  }

  // Latches until reset(); wakes every waiter.
  void cancel() {
    {
      std::lock_guard<std::mutex> g(mu_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  void reset() {
    std::lock_guard<std::mutex> g(mu_);
    open_ = true;
    cancelled_ = false;
  }

  bool is_open() const {
    std::lock_guard<std::mutex> g(mu_);
    return open_;
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> g(mu_);
    return cancelled_;
  }

  // Blocks while closed. Returns false if cancelled.
  bool wait() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return open_ || cancelled_; });
    return !cancelled_;
  }

  // Sleeps up to `d`, returning early when the gate closes or is cancelled.
  // Returns false if cancelled.
  template <class Rep, class Period>
  bool sleep_for(std::chrono::duration<Rep, Period> d) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, d, [this] { return !open_ || cancelled_; });
    return !cancelled_;
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool open_{true};
  bool cancelled_{false};
};
