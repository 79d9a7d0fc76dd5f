#pragma once

#include "codexbridge/observability/observer.hpp"

#include <memory>

namespace codexbridge::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_invocation_start(const std::string &executable, const std::string &working_directory,
                             bool resume);
void record_invocation_end(std::chrono::milliseconds duration, bool completed,
                           std::optional<int> exit_code);
void record_retry(std::uint32_t attempt, std::uint32_t max_attempts, const std::string &reason);
void record_stream_event(const std::string &type);
void record_decode_warning(const std::string &snippet, const std::string &reason);
void record_process_terminated(std::int64_t pid, bool forced);
void record_session(const std::string &action, const std::string &thread_id);
void record_error(const std::string &component, const std::string &message);

void log_debug(const std::string &component, const std::string &message);
void log_info(const std::string &component, const std::string &message);
void log_warning(const std::string &component, const std::string &message);
void log_error(const std::string &component, const std::string &message);

} // namespace codexbridge::observability
