#pragma once

#include "codexbridge/observability/observer.hpp"

namespace codexbridge::observability {

/// Discards everything. Selected by the `none` backend.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] bool accepts(LogLevel) const override { return false; }
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

} // namespace codexbridge::observability
