#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#ifdef _WIN32
#include <windows.h>
#endif

namespace codexbridge::process {

enum class ReadStatus { Line, Timeout, EndOfStream, Error };

struct ReadResult {
  ReadStatus status = ReadStatus::EndOfStream;
  /// The line including its trailing newline, when one was present.
  std::string line;
};

/// Line-oriented view of one end of a pipe.
class LineChannel {
public:
  virtual ~LineChannel() = default;

  /// Wait up to `timeout` for a complete line; std::nullopt waits indefinitely. A final
  /// unterminated line is returned before EndOfStream.
  [[nodiscard]] virtual ReadResult read_line(std::optional<std::chrono::milliseconds> timeout) = 0;
};

/// Splits raw chunks into lines. Backends supply `read_chunk`.
class BufferedLineChannel : public LineChannel {
public:
  ReadResult read_line(std::optional<std::chrono::milliseconds> timeout) override;

protected:
  enum class ChunkStatus { Data, Timeout, EndOfStream, Error };

  virtual ChunkStatus read_chunk(std::string &out,
                                 std::optional<std::chrono::milliseconds> timeout) = 0;

private:
  std::optional<std::string> take_line();

  std::string buffer_;
  bool eof_ = false;
};

#ifndef _WIN32

/// Reads from a POSIX file descriptor using poll(2).
class FdLineChannel final : public BufferedLineChannel {
public:
  explicit FdLineChannel(int fd, bool owns_fd = true);
  ~FdLineChannel() override;

  FdLineChannel(const FdLineChannel &) = delete;
  FdLineChannel &operator=(const FdLineChannel &) = delete;

  [[nodiscard]] int fd() const { return fd_; }

protected:
  ChunkStatus read_chunk(std::string &out,
                         std::optional<std::chrono::milliseconds> timeout) override;

private:
  int fd_;
  bool owns_fd_;
};

#else

/// Reads from an anonymous pipe HANDLE, polling with PeekNamedPipe.
class HandleLineChannel final : public BufferedLineChannel {
public:
  explicit HandleLineChannel(HANDLE handle, bool owns_handle = true);
  ~HandleLineChannel() override;

  HandleLineChannel(const HandleLineChannel &) = delete;
  HandleLineChannel &operator=(const HandleLineChannel &) = delete;

protected:
  ChunkStatus read_chunk(std::string &out,
                         std::optional<std::chrono::milliseconds> timeout) override;

private:
  HANDLE handle_;
  bool owns_handle_;
};

#endif

} // namespace codexbridge::process
