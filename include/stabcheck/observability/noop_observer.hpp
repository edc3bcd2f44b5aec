#pragma once

#include "stabcheck/observability/observer.hpp"

namespace stabcheck::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace stabcheck::observability
