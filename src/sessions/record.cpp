#include "codexbridge/sessions/record.hpp"

namespace codexbridge::sessions {

namespace {

common::Result<common::Timestamp> read_timestamp(const common::JsonValue &json,
                                                 const std::string &key) {
  const auto *value = json.find(key);
  if (value == nullptr || !value->is_string()) {
    return common::Result<common::Timestamp>::failure("missing " + key);
  }
  auto parsed = common::parse_rfc3339(value->as_string());
  if (!parsed.ok()) {
    return common::Result<common::Timestamp>::failure(key + ": " + parsed.error());
  }
  return parsed;
}

} // namespace

void append_turn(SessionRecord &record, const std::string &role, const std::string &text) {
  const auto now = std::chrono::system_clock::now();
  record.history.push_back(Turn{.role = role, .content = text, .timestamp = now});
  ++record.turn_count;
  record.last_active = now;
}

common::JsonValue encode_record(const SessionRecord &record) {
  auto json = common::JsonValue::object();
  json.set("thread_id", record.thread_id);
  json.set("created_at", common::format_rfc3339(record.created_at));
  json.set("last_active", common::format_rfc3339(record.last_active));
  json.set("cwd", record.working_directory);
  json.set("sandbox", record.sandbox_mode);
  json.set("model", record.model.has_value() ? common::JsonValue(*record.model)
                                             : common::JsonValue(nullptr));
  json.set("turn_count", static_cast<std::int64_t>(record.turn_count));

  auto history = common::JsonValue::array();
  for (const auto &turn : record.history) {
    auto entry = common::JsonValue::object();
    entry.set("role", turn.role);
    entry.set("content", turn.content);
    entry.set("timestamp", common::format_rfc3339(turn.timestamp));
    history.push_back(std::move(entry));
  }
  json.set("history", std::move(history));
  return json;
}

common::Result<SessionRecord> decode_record(const common::JsonValue &json) {
  using R = common::Result<SessionRecord>;
  if (!json.is_object()) {
    return R::failure("session record is not an object");
  }

  SessionRecord record;
  record.thread_id = json.get_string("thread_id");
  if (record.thread_id.empty()) {
    return R::failure("missing thread_id");
  }

  auto created = read_timestamp(json, "created_at");
  if (!created.ok()) {
    return R::failure(created.error());
  }
  record.created_at = created.value();
  auto last_active = read_timestamp(json, "last_active");
  if (!last_active.ok()) {
    return R::failure(last_active.error());
  }
  record.last_active = last_active.value();

  record.working_directory = json.get_string("cwd");
  record.sandbox_mode = json.get_string("sandbox", "read-only");
  if (const auto *model = json.find("model"); model != nullptr && model->is_string()) {
    record.model = model->as_string();
  }
  if (const auto *count = json.find("turn_count"); count != nullptr && count->is_number()) {
    const auto value = count->as_int();
    record.turn_count = value > 0 ? static_cast<std::uint64_t>(value) : 0;
  }

  if (const auto *history = json.find("history"); history != nullptr && history->is_array()) {
    for (const auto &entry : history->as_array()) {
      if (!entry.is_object()) {
        continue;
      }
      Turn turn;
      turn.role = entry.get_string("role");
      turn.content = entry.get_string("content");
      auto stamp = common::parse_rfc3339(entry.get_string("timestamp"));
      turn.timestamp = stamp.ok() ? stamp.value() : record.last_active;
      record.history.push_back(std::move(turn));
    }
  }
  return R::success(std::move(record));
}

} // namespace codexbridge::sessions
