#pragma once

#include "codexbridge/common/result.hpp"
#include "codexbridge/process/line_channel.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace codexbridge::process {

struct SpawnOptions {
  std::vector<std::string> argv;
  std::string working_directory;
  /// Added to (or replacing entries of) the parent's environment.
  std::vector<std::pair<std::string, std::string>> environment;
};

/// A child running in its own process group (POSIX) or Job Object (Windows) with all three
/// standard streams piped. Destruction terminates the whole tree, reaps it and closes every
/// handle.
class ChildProcess {
  struct Impl;
  /// Only `spawn` can name this, so only `spawn` can construct.
  struct Token {
    explicit Token() = default;
  };

public:
  [[nodiscard]] static common::Result<std::unique_ptr<ChildProcess>>
  spawn(const SpawnOptions &options);

  ChildProcess(Token, std::unique_ptr<Impl> impl);
  ~ChildProcess();

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  /// Write everything, then close stdin. A reader that went away early is not an error.
  [[nodiscard]] common::Status write_input(const std::string &payload);
  void close_input();

  [[nodiscard]] LineChannel &stdout_channel();
  [[nodiscard]] LineChannel &stderr_channel();

  [[nodiscard]] std::int64_t pid() const;

  /// Wait up to `timeout` for the child to exit on its own. Returns the exit code once
  /// reaped. Death by signal N is reported as -N.
  std::optional<int> wait_for_exit(std::chrono::milliseconds timeout);
  [[nodiscard]] std::optional<int> exit_code() const;

  /// Graceful stop of the whole tree, escalating after `grace`. Safe to call repeatedly.
  void terminate_tree(std::chrono::milliseconds grace);
  /// True when the exit was caused by terminate_tree.
  [[nodiscard]] bool terminated_by_us() const;

private:
  std::unique_ptr<Impl> impl_;
};

} // namespace codexbridge::process
