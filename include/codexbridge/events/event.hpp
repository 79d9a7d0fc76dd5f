#pragma once

#include "codexbridge/common/json_util.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codexbridge::events {

enum class EventKind {
  ThreadStarted,
  ItemCompleted,
  TurnCompleted,
  ResponseCompleted,
  Error,
  Unrecognized,
};

/// Fixed table lookup; anything outside it is Unrecognized.
[[nodiscard]] EventKind kind_from_type(std::string_view type);
[[nodiscard]] std::string_view kind_name(EventKind kind);

/// One decoded line of the child's event stream.
struct Event {
  std::string type = "unknown";
  EventKind kind = EventKind::Unrecognized;
  common::JsonValue fields;
  std::string raw_text;
};

struct ToolCall {
  std::string name;
  common::JsonValue arguments = common::JsonValue::object();
  std::string call_id;
};

struct CommandExecution {
  std::string call_id;
  std::string output;
};

/// Cumulative state of one invocation. `completed` only ever goes false -> true.
struct AggregateResult {
  std::optional<std::string> thread_id;
  std::vector<std::string> agent_messages;
  std::vector<std::string> reasoning;
  std::vector<ToolCall> tool_calls;
  std::vector<CommandExecution> command_executions;
  std::vector<std::string> errors;
  bool completed = false;
  std::vector<Event> raw_events;

  [[nodiscard]] std::string response_text() const;
  /// True when there is something worth returning even though the run failed.
  [[nodiscard]] bool has_usable_content() const {
    return !agent_messages.empty() || thread_id.has_value();
  }
};

} // namespace codexbridge::events
