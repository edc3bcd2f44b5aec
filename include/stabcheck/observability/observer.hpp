#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace stabcheck::observability {

struct RunStartEvent {
  std::string url;
  double duration_seconds = 0.0;
  double interval_seconds = 0.0;
  double timeout_seconds = 0.0;
};

struct ProbeEvent {
  std::size_t index = 0;
  bool success = false;
  std::optional<int> status_code;
  double latency_ms = 0.0;
  std::string error;
  std::string detail;
};

struct RunEndEvent {
  std::string state;
  std::size_t total_probes = 0;
  std::size_t successful_probes = 0;
  std::chrono::milliseconds elapsed{0};
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<RunStartEvent, ProbeEvent, RunEndEvent, WarningEvent, ErrorEvent>;

struct ProbeLatencyMetric {
  double latency_ms = 0.0;
};

struct AvailabilityMetric {
  double availability_pct = 0.0;
};

using ObserverMetric = std::variant<ProbeLatencyMetric, AvailabilityMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace stabcheck::observability
