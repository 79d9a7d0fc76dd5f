#include "codexbridge/events/parser.hpp"

#include "codexbridge/common/fs.hpp"
#include "codexbridge/observability/global.hpp"

#include <array>
#include <utility>

namespace codexbridge::events {

namespace {

constexpr std::size_t SNIPPET_LIMIT = 100;

struct KindEntry {
  std::string_view type;
  EventKind kind;
};

constexpr std::array<KindEntry, 5> KIND_TABLE = {{
    {"thread.started", EventKind::ThreadStarted},
    {"item.completed", EventKind::ItemCompleted},
    {"turn.completed", EventKind::TurnCompleted},
    {"response.completed", EventKind::ResponseCompleted},
    {"error", EventKind::Error},
}};

std::string snippet_of(const std::string &line) {
  if (line.size() <= SNIPPET_LIMIT) {
    return line;
  }
  return line.substr(0, SNIPPET_LIMIT) + "...";
}

void append_if_present(std::vector<std::string> &target, const std::string &text) {
  if (!text.empty()) {
    target.push_back(text);
  }
}

void fold_message(const common::JsonValue &item, AggregateResult &result) {
  if (item.get_string("role") != "assistant") {
    return;
  }
  const auto *content = item.find("content");
  if (content == nullptr || !content->is_array()) {
    return;
  }
  for (const auto &part : content->as_array()) {
    if (part.is_string()) {
      append_if_present(result.agent_messages, part.as_string());
      continue;
    }
    if (!part.is_object()) {
      continue;
    }
    const std::string part_type = part.get_string("type");
    if (part_type == "text") {
      append_if_present(result.agent_messages, part.get_string("text"));
    } else if (part_type == "reasoning") {
      std::string text = part.get_string("text");
      if (text.empty()) {
        text = part.get_string("content");
      }
      append_if_present(result.reasoning, text);
    }
  }
}

void fold_item(const Event &event, AggregateResult &result) {
  const auto *item = event.fields.find("item");
  if (item == nullptr || !item->is_object()) {
    return;
  }
  const std::string item_type = item->get_string("type");
  if (item_type == "message") {
    fold_message(*item, result);
  } else if (item_type == "agent_message") {
    append_if_present(result.agent_messages, item->get_string("text"));
  } else if (item_type == "reasoning") {
    append_if_present(result.reasoning, item->get_string("text"));
  } else if (item_type == "function_call") {
    ToolCall call;
    call.name = item->get_string("name");
    call.call_id = item->get_string("call_id");
    if (const auto *args = item->find("arguments"); args != nullptr) {
      call.arguments = *args;
    }
    result.tool_calls.push_back(std::move(call));
  } else if (item_type == "function_call_output") {
    const std::string call_id = item->get_string("call_id");
    const std::string output = item->get_string("output");
    if (!call_id.empty() && !output.empty()) {
      result.command_executions.push_back({.call_id = call_id, .output = output});
    }
  }
}

// Nulls, false, zero, empty strings and empty containers carry no detail.
bool has_detail(const common::JsonValue &value) {
  switch (value.type()) {
  case common::JsonValue::Type::Null:
    return false;
  case common::JsonValue::Type::Bool:
    return value.as_bool();
  case common::JsonValue::Type::Number:
    return value.as_number() != 0.0;
  case common::JsonValue::Type::String:
    return !value.as_string().empty();
  case common::JsonValue::Type::Array:
  case common::JsonValue::Type::Object:
    return value.size() > 0;
  }
  return false;
}

void fold_error(const Event &event, AggregateResult &result) {
  std::string message = event.fields.get_string("message");
  if (message.empty()) {
    if (const auto *error = event.fields.find("error"); error != nullptr && has_detail(*error)) {
      message = error->is_string() ? error->as_string() : error->dump();
    }
  }
  if (message.empty()) {
    message = event.fields.dump();
  }
  observability::log_warning("events", "codex error: " + message);
  result.errors.push_back(std::move(message));
}

} // namespace

EventKind kind_from_type(const std::string_view type) {
  for (const auto &entry : KIND_TABLE) {
    if (entry.type == type) {
      return entry.kind;
    }
  }
  return EventKind::Unrecognized;
}

std::string_view kind_name(const EventKind kind) {
  for (const auto &entry : KIND_TABLE) {
    if (entry.kind == kind) {
      return entry.type;
    }
  }
  return "unrecognized";
}

std::string AggregateResult::response_text() const {
  std::string out;
  for (std::size_t i = 0; i < agent_messages.size(); ++i) {
    if (i > 0) {
      out += "\n\n";
    }
    out += agent_messages[i];
  }
  return out;
}

std::optional<Event> decode_line(const std::string_view line) {
  std::string trimmed = common::trim(std::string(line));
  if (trimmed.empty()) {
    return std::nullopt;
  }

  auto parsed = common::parse_json(trimmed);
  if (!parsed.ok()) {
    observability::record_decode_warning(snippet_of(trimmed), parsed.error());
    return std::nullopt;
  }
  if (!parsed.value().is_object()) {
    observability::record_decode_warning(snippet_of(trimmed), "top-level value is not an object");
    return std::nullopt;
  }

  Event event;
  event.fields = std::move(parsed.value());
  if (const auto *type = event.fields.find("type"); type != nullptr && type->is_string()) {
    event.type = type->as_string();
  }
  event.kind = kind_from_type(event.type);
  event.raw_text = std::move(trimmed);
  return event;
}

void fold(const Event &event, AggregateResult &result) {
  result.raw_events.push_back(event);
  observability::record_stream_event(event.type);

  switch (event.kind) {
  case EventKind::ThreadStarted: {
    std::string id = event.fields.get_string("thread_id");
    if (id.empty()) {
      id = event.fields.get_string("threadId");
    }
    if (!id.empty()) {
      result.thread_id = id;
      observability::log_info("events", "thread started: " + id);
    }
    break;
  }
  case EventKind::ItemCompleted:
    fold_item(event, result);
    break;
  case EventKind::TurnCompleted:
  case EventKind::ResponseCompleted:
    result.completed = true;
    break;
  case EventKind::Error:
    fold_error(event, result);
    break;
  case EventKind::Unrecognized:
    observability::log_debug("events", "no handler for event type: " + event.type);
    break;
  }
}

std::optional<Event> EventParser::parse_line(const std::string_view line) {
  auto event = decode_line(line);
  if (event.has_value()) {
    fold(*event, result_);
  }
  return event;
}

AggregateResult EventParser::take_result() { return std::exchange(result_, AggregateResult{}); }

} // namespace codexbridge::events
