// Repository: HoloHub-fleet
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from the render / heartbeat / poll loops.
//          Production: RealtimeWaitStrategy sleeps until deadline or Wake().
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_TIMING_IWAIT_STRATEGY_HPP_
#define HOLOHUB_TIMING_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace holohub::timing {

class IWaitStrategy {
 public:
  virtual ~IWaitStrategy() = default;

  // Blocks until deadline or Wake(). time_point::max() waits for Wake() only.
  // Returns true if the deadline was reached, false if woken early.
  virtual bool WaitUntil(std::chrono::steady_clock::time_point deadline) = 0;

  // Releases the current (or next) WaitUntil early.
  virtual void Wake() = 0;

  virtual bool WaitFor(std::chrono::milliseconds duration) {
    return WaitUntil(std::chrono::steady_clock::now() + duration);
  }
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  bool WaitUntil(std::chrono::steady_clock::time_point deadline) override {
    std::unique_lock<std::mutex> lock(mutex_);
    if (woken_) {
      woken_ = false;
      return false;
    }
    if (deadline == std::chrono::steady_clock::time_point::max()) {
      cv_.wait(lock, [this] { return woken_; });
      woken_ = false;
      return false;
    }
    const bool woken = cv_.wait_until(lock, deadline, [this] { return woken_; });
    woken_ = false;
    return !woken;
  }

  void Wake() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      woken_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool woken_ = false;
};

}  // namespace holohub::timing

#endif  // HOLOHUB_TIMING_IWAIT_STRATEGY_HPP_
