#include "codexbridge/observability/global.hpp"

#include <mutex>

namespace codexbridge::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

void log_at(const LogLevel level, const std::string &component, const std::string &message) {
  auto *observer = get_global_observer();
  if (observer == nullptr || !observer->accepts(level)) {
    return;
  }
  observer->record_event(LogEvent{.level = level, .component = component, .message = message});
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_invocation_start(const std::string &executable, const std::string &working_directory,
                             const bool resume) {
  record_event(InvocationStartEvent{
      .executable = executable, .working_directory = working_directory, .resume = resume});
}

void record_invocation_end(std::chrono::milliseconds duration, const bool completed,
                           std::optional<int> exit_code) {
  record_event(
      InvocationEndEvent{.duration = duration, .completed = completed, .exit_code = exit_code});
  record_metric(InvocationLatencyMetric{.latency = duration});
}

void record_retry(const std::uint32_t attempt, const std::uint32_t max_attempts,
                  const std::string &reason) {
  record_event(RetryEvent{.attempt = attempt, .max_attempts = max_attempts, .reason = reason});
}

void record_stream_event(const std::string &type) { record_event(StreamEventSeen{.type = type}); }

void record_decode_warning(const std::string &snippet, const std::string &reason) {
  record_event(DecodeWarningEvent{.snippet = snippet, .reason = reason});
}

void record_process_terminated(const std::int64_t pid, const bool forced) {
  record_event(ProcessTerminatedEvent{.pid = pid, .forced = forced});
}

void record_session(const std::string &action, const std::string &thread_id) {
  record_event(SessionEvent{.action = action, .thread_id = thread_id});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void log_debug(const std::string &component, const std::string &message) {
  log_at(LogLevel::Debug, component, message);
}

void log_info(const std::string &component, const std::string &message) {
  log_at(LogLevel::Info, component, message);
}

void log_warning(const std::string &component, const std::string &message) {
  log_at(LogLevel::Warning, component, message);
}

void log_error(const std::string &component, const std::string &message) {
  log_at(LogLevel::Error, component, message);
}

} // namespace codexbridge::observability
