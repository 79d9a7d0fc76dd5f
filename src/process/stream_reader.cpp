#include "codexbridge/process/stream_reader.hpp"

#include "codexbridge/observability/global.hpp"

#include <thread>

namespace codexbridge::process {

StreamReader::StreamReader(const std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval) {}

std::string StreamReader::primary_snapshot() const {
  std::lock_guard<std::mutex> lock(primary_mutex_);
  return primary_text_;
}

void StreamReader::read_primary(LineChannel &primary, events::EventParser &parser,
                                const std::atomic<bool> &cancel, std::atomic<bool> &finished,
                                DrainOutcome &outcome) {
  std::uint64_t lines = 0;
  while (!cancel.load()) {
    auto read = primary.read_line(poll_interval_);
    if (read.status == ReadStatus::Timeout) {
      continue;
    }
    if (read.status != ReadStatus::Line) {
      if (read.status == ReadStatus::Error) {
        observability::log_warning("stream", "read error on event stream");
      }
      break;
    }

    {
      std::lock_guard<std::mutex> lock(primary_mutex_);
      primary_text_ += read.line;
    }
    ++lines;
    (void)parser.parse_line(read.line);
    if (parser.completed()) {
      observability::log_info("stream", "turn completed, stopping stream read");
      outcome.stopped_on_completion = true;
      break;
    }
  }
  if (cancel.load()) {
    outcome.cancelled = true;
  }
  observability::record_metric(observability::EventsParsedMetric{.count = lines});
  finished.store(true);
}

void StreamReader::read_secondary(LineChannel &secondary, const std::atomic<bool> &cancel,
                                  const std::atomic<bool> &finished, DrainOutcome &outcome) {
  while (!cancel.load()) {
    // Once the event stream is done, collect whatever is already buffered and stop.
    const bool last_pass = finished.load();
    auto read = secondary.read_line(last_pass ? std::chrono::milliseconds(0) : poll_interval_);
    if (read.status == ReadStatus::Timeout) {
      if (last_pass) {
        break;
      }
      continue;
    }
    if (read.status != ReadStatus::Line) {
      break;
    }
    outcome.secondary_text += read.line;
  }
}

DrainOutcome StreamReader::drain(LineChannel &primary, LineChannel &secondary,
                                 events::EventParser &parser, const std::atomic<bool> &cancel) {
  {
    std::lock_guard<std::mutex> lock(primary_mutex_);
    primary_text_.clear();
  }
  DrainOutcome outcome;
  std::atomic<bool> finished{false};

  std::thread secondary_thread(
      [this, &secondary, &cancel, &finished, &outcome] {
        read_secondary(secondary, cancel, finished, outcome);
      });
  std::thread primary_thread([this, &primary, &parser, &cancel, &finished, &outcome] {
    read_primary(primary, parser, cancel, finished, outcome);
  });
  primary_thread.join();
  secondary_thread.join();

  outcome.primary_text = primary_snapshot();
  if (cancel.load()) {
    outcome.cancelled = true;
  }
  return outcome;
}

} // namespace codexbridge::process
