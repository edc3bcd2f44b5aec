#pragma once

#include "stabcheck/common/cancel_token.hpp"

#include <chrono>

namespace stabcheck::common {

class IClock {
public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual std::chrono::steady_clock::time_point now() const = 0;
  [[nodiscard]] virtual std::chrono::system_clock::time_point wall_now() const = 0;

  /// Sleep for `duration` unless `cancel` fires first. Returns false when the
  /// sleep was cut short by cancellation.
  virtual bool sleep_for(std::chrono::nanoseconds duration, const CancelToken &cancel) = 0;
};

class SystemClock final : public IClock {
public:
  [[nodiscard]] std::chrono::steady_clock::time_point now() const override;
  [[nodiscard]] std::chrono::system_clock::time_point wall_now() const override;
  bool sleep_for(std::chrono::nanoseconds duration, const CancelToken &cancel) override;
};

[[nodiscard]] double to_millis(std::chrono::nanoseconds duration);
/// Saturates at nanoseconds::max() instead of overflowing.
[[nodiscard]] std::chrono::nanoseconds from_seconds(double seconds);

} // namespace stabcheck::common
