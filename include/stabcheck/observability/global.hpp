#pragma once

#include "stabcheck/observability/observer.hpp"

#include <memory>

namespace stabcheck::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_run_start(const std::string &url, double duration_seconds, double interval_seconds,
                      double timeout_seconds);
void record_probe(ProbeEvent event);
void record_run_end(const std::string &state, std::size_t total_probes,
                    std::size_t successful_probes, std::chrono::milliseconds elapsed);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);
void flush_global_observer();

} // namespace stabcheck::observability
