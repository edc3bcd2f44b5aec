#include "stabcheck/common/cancel_token.hpp"

namespace stabcheck::common {

void CancelToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancelToken::is_cancelled() const { return cancelled_; }

bool CancelToken::wait_for(const std::chrono::nanoseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return cancelled_.load(); });
}

} // namespace stabcheck::common
