#include "stabcheck/observability/global.hpp"

#include <mutex>

namespace stabcheck::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_run_start(const std::string &url, const double duration_seconds,
                      const double interval_seconds, const double timeout_seconds) {
  record_event(RunStartEvent{.url = url,
                             .duration_seconds = duration_seconds,
                             .interval_seconds = interval_seconds,
                             .timeout_seconds = timeout_seconds});
}

void record_probe(ProbeEvent event) {
  const double latency = event.latency_ms;
  const bool success = event.success;
  record_event(std::move(event));
  if (success) {
    record_metric(ProbeLatencyMetric{.latency_ms = latency});
  }
}

void record_run_end(const std::string &state, const std::size_t total_probes,
                    const std::size_t successful_probes, const std::chrono::milliseconds elapsed) {
  record_event(RunEndEvent{.state = state,
                           .total_probes = total_probes,
                           .successful_probes = successful_probes,
                           .elapsed = elapsed});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void flush_global_observer() {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->flush();
  }
}

} // namespace stabcheck::observability
