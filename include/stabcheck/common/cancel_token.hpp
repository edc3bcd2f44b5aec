#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace stabcheck::common {

/// Run-scoped cancellation flag. cancel() is sticky and wakes every waiter.
class CancelToken {
public:
  void cancel();
  [[nodiscard]] bool is_cancelled() const;

  /// Block for up to `timeout`. Returns true when woken by cancel().
  bool wait_for(std::chrono::nanoseconds timeout) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool> cancelled_{false};
};

} // namespace stabcheck::common
