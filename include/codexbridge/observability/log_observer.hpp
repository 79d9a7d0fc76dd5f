#pragma once

#include "codexbridge/observability/observer.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace codexbridge::observability {

/// Writes one `timestamp [LEVEL] component: message` line per event at or above
/// `min_level`. Lines go to the log file when one is given, stderr otherwise.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info,
                       const std::filesystem::path &log_file = {});

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] bool accepts(const LogLevel level) const override { return level >= min_level_; }
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &component, const std::string &message);

  LogLevel min_level_;
  std::mutex mutex_;
  std::ofstream file_;
};

} // namespace codexbridge::observability
