#include "stabcheck/observability/multi_observer.hpp"

#include <algorithm>

namespace stabcheck::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  observers_.push_back(std::move(observer));
}

bool MultiObserver::contains(const std::string_view backend) const {
  return std::any_of(observers_.begin(), observers_.end(),
                     [backend](const auto &child) { return child->name() == backend; });
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &child : observers_) {
    child->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &child : observers_) {
    child->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &child : observers_) {
    child->flush();
  }
}

} // namespace stabcheck::observability
