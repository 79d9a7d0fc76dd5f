#pragma once

#include "codexbridge/common/json_util.hpp"
#include "codexbridge/common/result.hpp"
#include "codexbridge/common/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codexbridge::sessions {

struct Turn {
  std::string role;
  std::string content;
  common::Timestamp timestamp;
};

struct SessionRecord {
  std::string thread_id;
  common::Timestamp created_at;
  common::Timestamp last_active;
  std::string working_directory;
  std::string sandbox_mode = "read-only";
  std::optional<std::string> model;
  std::uint64_t turn_count = 0;
  std::vector<Turn> history;
};

/// Append a history entry stamped now, count it and bump `last_active`. Does not persist.
void append_turn(SessionRecord &record, const std::string &role, const std::string &text);

[[nodiscard]] common::JsonValue encode_record(const SessionRecord &record);
[[nodiscard]] common::Result<SessionRecord> decode_record(const common::JsonValue &json);

} // namespace codexbridge::sessions
