#pragma once

#include "codexbridge/events/parser.hpp"
#include "codexbridge/process/line_channel.hpp"

#include <atomic>
#include <cstdint>
#include <chrono>
#include <mutex>
#include <string>

namespace codexbridge::process {

struct DrainOutcome {
  std::string secondary_text;
  std::string primary_text;
  bool stopped_on_completion = false;
  bool cancelled = false;
};

/// Drains the event stream (primary) and the diagnostic stream (secondary) on two threads,
/// folding every primary line into the parser. Returns once both loops have stopped.
class StreamReader {
public:
  explicit StreamReader(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));

  DrainOutcome drain(LineChannel &primary, LineChannel &secondary, events::EventParser &parser,
                     const std::atomic<bool> &cancel);

  /// Primary text read so far. Safe to call while drain() is running.
  [[nodiscard]] std::string primary_snapshot() const;

private:
  void read_primary(LineChannel &primary, events::EventParser &parser,
                    const std::atomic<bool> &cancel, std::atomic<bool> &finished,
                    DrainOutcome &outcome);
  void read_secondary(LineChannel &secondary, const std::atomic<bool> &cancel,
                      const std::atomic<bool> &finished, DrainOutcome &outcome);

  std::chrono::milliseconds poll_interval_;
  mutable std::mutex primary_mutex_;
  std::string primary_text_;
};

} // namespace codexbridge::process
