#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace codexbridge::observability {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

[[nodiscard]] std::string_view level_name(LogLevel level);
[[nodiscard]] LogLevel parse_log_level(std::string_view value);

struct InvocationStartEvent {
  std::string executable;
  std::string working_directory;
  bool resume = false;
};

struct InvocationEndEvent {
  std::chrono::milliseconds duration{0};
  bool completed = false;
  std::optional<int> exit_code;
};

struct RetryEvent {
  std::uint32_t attempt = 0;
  std::uint32_t max_attempts = 0;
  std::string reason;
};

struct StreamEventSeen {
  std::string type;
};

struct DecodeWarningEvent {
  std::string snippet;
  std::string reason;
};

struct ProcessTerminatedEvent {
  std::int64_t pid = 0;
  bool forced = false;
};

struct SessionEvent {
  std::string action;
  std::string thread_id;
};

struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<InvocationStartEvent, InvocationEndEvent, RetryEvent, StreamEventSeen,
                 DecodeWarningEvent, ProcessTerminatedEvent, SessionEvent, LogEvent, ErrorEvent>;

struct InvocationLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct EventsParsedMetric {
  std::uint64_t count = 0;
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric =
    std::variant<InvocationLatencyMetric, EventsParsedMetric, ActiveSessionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  /// Whether a `LogEvent` at `level` would produce any output.
  [[nodiscard]] virtual bool accepts(LogLevel level) const {
    (void)level;
    return true;
  }
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace codexbridge::observability
