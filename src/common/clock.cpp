#include "stabcheck/common/clock.hpp"

#include <cmath>

namespace stabcheck::common {

std::chrono::steady_clock::time_point SystemClock::now() const {
  return std::chrono::steady_clock::now();
}

std::chrono::system_clock::time_point SystemClock::wall_now() const {
  return std::chrono::system_clock::now();
}

bool SystemClock::sleep_for(const std::chrono::nanoseconds duration, const CancelToken &cancel) {
  if (cancel.is_cancelled()) {
    return false;
  }
  if (duration <= std::chrono::nanoseconds::zero()) {
    return true;
  }
  return !cancel.wait_for(duration);
}

double to_millis(const std::chrono::nanoseconds duration) {
  return std::chrono::duration<double, std::milli>(duration).count();
}

std::chrono::nanoseconds from_seconds(const double seconds) {
  if (std::isnan(seconds) || seconds <= 0.0) {
    return std::chrono::nanoseconds::zero();
  }
  const std::chrono::duration<double> limit = std::chrono::nanoseconds::max();
  if (seconds >= limit.count()) {
    return std::chrono::nanoseconds::max();
  }
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(seconds));
}

} // namespace stabcheck::common
