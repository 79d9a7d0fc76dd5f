#include "codexbridge/observability/log_observer.hpp"

#include "codexbridge/common/fs.hpp"
#include "codexbridge/common/time.hpp"

#include <iostream>
#include <type_traits>

namespace codexbridge::observability {

std::string_view level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogLevel parse_log_level(const std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "warning" || normalized == "warn") {
    return LogLevel::Warning;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogObserver::LogObserver(const LogLevel min_level, const std::filesystem::path &log_file)
    : min_level_(min_level) {
  if (!log_file.empty()) {
    std::error_code ec;
    if (log_file.has_parent_path()) {
      std::filesystem::create_directories(log_file.parent_path(), ec);
    }
    file_.open(log_file, std::ios::app);
    if (!file_) {
      std::cerr << "[WARNING] log: cannot open " << log_file.string()
                << ", logging to stderr\n";
    }
  }
}

void LogObserver::log_line(const LogLevel level, const std::string &component,
                           const std::string &message) {
  if (level < min_level_) {
    return;
  }
  const std::string line = common::now_rfc3339() + " [" + std::string(level_name(level)) + "] " +
                           component + ": " + message + "\n";
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_ << line;
  } else {
    std::cerr << line;
  }
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, InvocationStartEvent>) {
          log_line(LogLevel::Info, "process",
                   std::string("invocation.start executable=") + evt.executable +
                       " cwd=" + evt.working_directory + " resume=" +
                       (evt.resume ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, InvocationEndEvent>) {
          log_line(LogLevel::Info, "process",
                   "invocation.end duration_ms=" + std::to_string(evt.duration.count()) +
                       " completed=" + (evt.completed ? "true" : "false") + " exit_code=" +
                       (evt.exit_code.has_value() ? std::to_string(*evt.exit_code) : "none"));
        } else if constexpr (std::is_same_v<T, RetryEvent>) {
          log_line(LogLevel::Warning, "retry",
                   "attempt " + std::to_string(evt.attempt) + "/" +
                       std::to_string(evt.max_attempts) + ": " + evt.reason);
        } else if constexpr (std::is_same_v<T, StreamEventSeen>) {
          log_line(LogLevel::Debug, "events", "event type=" + evt.type);
        } else if constexpr (std::is_same_v<T, DecodeWarningEvent>) {
          log_line(LogLevel::Warning, "events",
                   "dropped undecodable line: " + evt.snippet + " (" + evt.reason + ")");
        } else if constexpr (std::is_same_v<T, ProcessTerminatedEvent>) {
          log_line(LogLevel::Debug, "process",
                   "terminated pid=" + std::to_string(evt.pid) +
                       " forced=" + (evt.forced ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, SessionEvent>) {
          log_line(LogLevel::Info, "sessions", evt.action + " " + evt.thread_id);
        } else if constexpr (std::is_same_v<T, LogEvent>) {
          log_line(evt.level, evt.component, evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component, evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, InvocationLatencyMetric>) {
          log_line(LogLevel::Debug, "metrics",
                   "invocation_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, EventsParsedMetric>) {
          log_line(LogLevel::Debug, "metrics", "events_parsed=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line(LogLevel::Debug, "metrics", "active_sessions=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  } else {
    std::cerr.flush();
  }
}

} // namespace codexbridge::observability
