#include "codexbridge/observability/multi_observer.hpp"

#include <algorithm>

namespace codexbridge::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr || !observer->accepts(LogLevel::Error)) {
    return;
  }
  observers_.push_back(std::move(observer));
}

void MultiObserver::record_event(const ObserverEvent &event) {
  const auto *log = std::get_if<LogEvent>(&event);
  for (auto &observer : observers_) {
    if (log != nullptr && !observer->accepts(log->level)) {
      continue;
    }
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

bool MultiObserver::accepts(const LogLevel level) const {
  return std::any_of(observers_.begin(), observers_.end(),
                     [level](const auto &observer) { return observer->accepts(level); });
}

} // namespace codexbridge::observability
