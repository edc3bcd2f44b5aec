#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace stabcheck::probe {

enum class ProbeError {
  Timeout,
  ConnectionError,
  UnexpectedResponse,
  Other,
};

/// Report tag for an error: timeout, connection_error, unexpected_response, other.
[[nodiscard]] std::string_view probe_error_name(ProbeError error);

/// Result of one probe. `success` implies `error` is empty.
struct ProbeOutcome {
  std::chrono::system_clock::time_point timestamp{};
  std::chrono::steady_clock::time_point started{};
  bool success = false;
  std::optional<int> status_code;
  double latency_ms = 0.0;
  std::optional<ProbeError> error;
  std::optional<std::string> error_detail;
};

} // namespace stabcheck::probe
