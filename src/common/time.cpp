#include "stabcheck/common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace stabcheck::common {

namespace {

std::tm to_utc(const std::chrono::system_clock::time_point time) {
  const auto t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

} // namespace

std::string format_rfc3339(const std::chrono::system_clock::time_point time) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis % 1000 + 1000) % 1000);
  const std::tm tm = to_utc(time);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

std::string format_compact_utc(const std::chrono::system_clock::time_point time) {
  const std::tm tm = to_utc(time);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
  return out.str();
}

} // namespace stabcheck::common
