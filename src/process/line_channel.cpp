#include "codexbridge/process/line_channel.hpp"

#include <utility>

namespace codexbridge::process {

std::optional<std::string> BufferedLineChannel::take_line() {
  const auto newline = buffer_.find('\n');
  if (newline == std::string::npos) {
    return std::nullopt;
  }
  std::string line = buffer_.substr(0, newline + 1);
  buffer_.erase(0, newline + 1);
  return line;
}

ReadResult BufferedLineChannel::read_line(const std::optional<std::chrono::milliseconds> timeout) {
  const auto deadline =
      timeout.has_value()
          ? std::optional<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now() +
                                                                 *timeout)
          : std::nullopt;

  bool attempted = false;
  while (true) {
    if (auto line = take_line(); line.has_value()) {
      return ReadResult{.status = ReadStatus::Line, .line = std::move(*line)};
    }
    if (eof_) {
      if (!buffer_.empty()) {
        return ReadResult{.status = ReadStatus::Line, .line = std::exchange(buffer_, {})};
      }
      return ReadResult{.status = ReadStatus::EndOfStream, .line = {}};
    }

    std::optional<std::chrono::milliseconds> remaining;
    if (deadline.has_value()) {
      const auto now = std::chrono::steady_clock::now();
      if (now >= *deadline) {
        // A zero timeout still gets one non-blocking read.
        if (attempted) {
          return ReadResult{.status = ReadStatus::Timeout, .line = {}};
        }
        remaining = std::chrono::milliseconds(0);
      } else {
        remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now);
      }
    }

    attempted = true;
    switch (read_chunk(buffer_, remaining)) {
    case ChunkStatus::Data:
      break;
    case ChunkStatus::Timeout:
      return ReadResult{.status = ReadStatus::Timeout, .line = {}};
    case ChunkStatus::EndOfStream:
      eof_ = true;
      break;
    case ChunkStatus::Error:
      return ReadResult{.status = ReadStatus::Error, .line = {}};
    }
  }
}

} // namespace codexbridge::process
