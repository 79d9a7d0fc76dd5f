#include "codexbridge/process/line_channel.hpp"

#include <array>
#include <thread>

namespace codexbridge::process {

namespace {

constexpr auto PEEK_INTERVAL = std::chrono::milliseconds(20);

} // namespace

HandleLineChannel::HandleLineChannel(HANDLE handle, const bool owns_handle)
    : handle_(handle), owns_handle_(owns_handle) {}

HandleLineChannel::~HandleLineChannel() {
  if (owns_handle_ && handle_ != nullptr && handle_ != INVALID_HANDLE_VALUE) {
    CloseHandle(handle_);
  }
}

BufferedLineChannel::ChunkStatus
HandleLineChannel::read_chunk(std::string &out,
                              const std::optional<std::chrono::milliseconds> timeout) {
  if (handle_ == nullptr || handle_ == INVALID_HANDLE_VALUE) {
    return ChunkStatus::EndOfStream;
  }

  const auto started = std::chrono::steady_clock::now();
  while (true) {
    DWORD available = 0;
    if (PeekNamedPipe(handle_, nullptr, 0, nullptr, &available, nullptr) == 0) {
      const DWORD error = GetLastError();
      return error == ERROR_BROKEN_PIPE ? ChunkStatus::EndOfStream : ChunkStatus::Error;
    }
    if (available > 0) {
      std::array<char, 4096> buffer{};
      const DWORD to_read = available < buffer.size() ? available : static_cast<DWORD>(buffer.size());
      DWORD read_bytes = 0;
      if (ReadFile(handle_, buffer.data(), to_read, &read_bytes, nullptr) == 0) {
        return GetLastError() == ERROR_BROKEN_PIPE ? ChunkStatus::EndOfStream : ChunkStatus::Error;
      }
      if (read_bytes == 0) {
        return ChunkStatus::EndOfStream;
      }
      out.append(buffer.data(), read_bytes);
      return ChunkStatus::Data;
    }
    if (timeout.has_value() && std::chrono::steady_clock::now() - started >= *timeout) {
      return ChunkStatus::Timeout;
    }
    std::this_thread::sleep_for(PEEK_INTERVAL);
  }
}

} // namespace codexbridge::process
