#pragma once

#include "stabcheck/observability/observer.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace stabcheck::observability {

/// Fans every event and metric out to its children in insertion order.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  /// True when a child reports `backend` as its name().
  [[nodiscard]] bool contains(std::string_view backend) const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace stabcheck::observability
