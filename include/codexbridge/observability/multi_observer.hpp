#pragma once

#include "codexbridge/observability/observer.hpp"

#include <memory>
#include <vector>

namespace codexbridge::observability {

/// Fans events and metrics out to each registered observer in order. A `LogEvent` only
/// reaches the observers that accept its level. Observers that accept no level at all are
/// not kept.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] bool accepts(LogLevel level) const override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace codexbridge::observability
