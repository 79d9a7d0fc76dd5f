#pragma once

#include "codexbridge/common/result.hpp"

#include <chrono>
#include <string>

namespace codexbridge::common {

using Timestamp = std::chrono::system_clock::time_point;

/// UTC, millisecond precision: 2026-01-31T12:00:00.123Z
[[nodiscard]] std::string format_rfc3339(Timestamp when);
[[nodiscard]] std::string now_rfc3339();
/// Accepts the format above, with or without the fractional part.
[[nodiscard]] Result<Timestamp> parse_rfc3339(const std::string &value);

} // namespace codexbridge::common
