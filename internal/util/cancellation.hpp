#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace medsync::util {

enum class CancelReason : std::uint8_t {
  kNone     = 0,
  kUser     = 1, // caller cancelled the transfer; it is dropped
  kShutdown = 2, // engine stopping; the transfer stays queued
};

/*
  Cooperative cancellation flag shared between the engine and one worker.

  Checked before every chunk and polled by the HTTP transport while a request
  is in flight. The first reason wins.
*/
class CancellationToken {
 public:
  void Cancel(CancelReason reason) {
    {
      std::lock_guard lock(mutex_);
      if (reason_.load() != CancelReason::kNone) return;
      reason_.store(reason);
    }
    cv_.notify_all();
  }

  bool IsCancelled() const {
    return reason_.load() != CancelReason::kNone;
  }

  CancelReason Reason() const {
    return reason_.load();
  }

  // Sleeps for `duration` unless cancelled first. Returns true if the full
  // duration elapsed.
  bool WaitFor(std::chrono::milliseconds duration) const {
    std::unique_lock lock(mutex_);
    return !cv_.wait_for(lock, duration, [&] { return reason_.load() != CancelReason::kNone; });
  }

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  std::atomic<CancelReason>       reason_{CancelReason::kNone};
};

} // namespace medsync::util
