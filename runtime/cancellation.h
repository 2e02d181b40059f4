#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace pdserve {

// Shutdown request shared between the signal handler, the main thread and
// background loops.  Cancel() only flips a flag and wakes waiters; whoever
// owns a resource performs its teardown after observing IsCancelled().
class CancellationToken {
 public:
  void Cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // Sleep for up to `timeout`; returns true if cancellation was requested.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return IsCancelled(); });
  }

  // Async-signal-safe variant for use inside a signal handler: no lock, no
  // notify.  Waiters observe it on their next poll.
  void CancelFromSignal() { cancelled_.store(true, std::memory_order_release); }

 private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

}  // namespace pdserve
