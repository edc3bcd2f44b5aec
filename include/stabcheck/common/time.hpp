#pragma once

#include <chrono>
#include <string>

namespace stabcheck::common {

/// RFC 3339 / ISO-8601 UTC timestamp with millisecond precision, e.g.
/// `2026-01-02T03:04:05.678Z`.
[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point time);
[[nodiscard]] std::string now_rfc3339();

/// Filename-safe UTC stamp, e.g. `20260102T030405Z`.
[[nodiscard]] std::string format_compact_utc(std::chrono::system_clock::time_point time);

} // namespace stabcheck::common
