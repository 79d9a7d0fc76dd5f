#include "codexbridge/process/line_channel.hpp"

#include <array>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace codexbridge::process {

FdLineChannel::FdLineChannel(const int fd, const bool owns_fd) : fd_(fd), owns_fd_(owns_fd) {}

FdLineChannel::~FdLineChannel() {
  if (owns_fd_ && fd_ >= 0) {
    close(fd_);
  }
}

BufferedLineChannel::ChunkStatus
FdLineChannel::read_chunk(std::string &out, const std::optional<std::chrono::milliseconds> timeout) {
  if (fd_ < 0) {
    return ChunkStatus::EndOfStream;
  }

  struct pollfd pfd {
    .fd = fd_, .events = POLLIN, .revents = 0,
  };
  const int wait_ms = timeout.has_value() ? static_cast<int>(timeout->count()) : -1;
  const int ready = poll(&pfd, 1, wait_ms);
  if (ready < 0) {
    return errno == EINTR ? ChunkStatus::Timeout : ChunkStatus::Error;
  }
  if (ready == 0) {
    return ChunkStatus::Timeout;
  }

  std::array<char, 4096> buffer{};
  const ssize_t bytes = read(fd_, buffer.data(), buffer.size());
  if (bytes > 0) {
    out.append(buffer.data(), static_cast<std::size_t>(bytes));
    return ChunkStatus::Data;
  }
  if (bytes == 0) {
    return ChunkStatus::EndOfStream;
  }
  if (errno == EINTR || errno == EAGAIN) {
    return ChunkStatus::Timeout;
  }
  return ChunkStatus::Error;
}

} // namespace codexbridge::process
