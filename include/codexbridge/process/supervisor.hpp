#pragma once

#include "codexbridge/broker/types.hpp"
#include "codexbridge/common/result.hpp"
#include "codexbridge/events/event.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace codexbridge::process {

struct ProcessSpec {
  std::vector<std::string> argv;
  std::string working_directory;
  std::vector<std::pair<std::string, std::string>> environment;
  std::string input_payload;
  std::chrono::milliseconds timeout{std::chrono::seconds(600)};
  bool resume = false;
};

struct SupervisorOptions {
  std::chrono::milliseconds terminate_grace{500};
  /// How often the reader loops re-check for completion or cancellation. Must stay below 1 s.
  std::chrono::milliseconds poll_interval{500};
};

/// `exec` argument vector for the codex CLI. The prompt is always read from stdin.
[[nodiscard]] std::vector<std::string> build_codex_command(const std::string &executable,
                                                           const broker::InvocationRequest &request);

/// Runs one child to completion (or deadline) and folds its event stream.
class ProcessSupervisor {
public:
  explicit ProcessSupervisor(SupervisorOptions options = {});

  [[nodiscard]] common::Result<events::AggregateResult, broker::BrokerError>
  run(const ProcessSpec &spec) const;

  [[nodiscard]] const SupervisorOptions &options() const { return options_; }

private:
  SupervisorOptions options_;
};

} // namespace codexbridge::process
