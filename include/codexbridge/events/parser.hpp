#pragma once

#include "codexbridge/events/event.hpp"

#include <optional>
#include <string_view>

namespace codexbridge::events {

/// Decode one line. Blank lines, malformed JSON and non-object documents yield nothing;
/// the latter two are reported as decode warnings. Never throws.
[[nodiscard]] std::optional<Event> decode_line(std::string_view line);

/// Append `event` to `result.raw_events` and apply its effect on the aggregate.
void fold(const Event &event, AggregateResult &result);

/// Line-at-a-time decoder that owns the aggregate for a single invocation.
class EventParser {
public:
  std::optional<Event> parse_line(std::string_view line);

  [[nodiscard]] const AggregateResult &result() const { return result_; }
  [[nodiscard]] AggregateResult take_result();
  [[nodiscard]] bool completed() const { return result_.completed; }

private:
  AggregateResult result_;
};

} // namespace codexbridge::events
