#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tracr::core {

// One-shot cancellation flag shared between an orchestration pass and its
// device workers. `WaitFor` doubles as an interruptible sleep for polling.
class CancellationToken {
public:
  void Cancel() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      cancelled_.store(true);
    }
    cv_.notify_all();
  }

  bool IsCancelled() const {
    return cancelled_.load();
  }

  // Sleeps up to `duration`; returns true if cancellation arrived first.
  bool WaitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
  }

private:
  std::atomic<bool> cancelled_{false};
  std::mutex mu_;
  std::condition_variable cv_;
};

} // namespace tracr::core
