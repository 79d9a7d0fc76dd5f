#pragma once

#include "codexbridge/broker/types.hpp"
#include "codexbridge/common/result.hpp"
#include "codexbridge/events/event.hpp"
#include "codexbridge/process/supervisor.hpp"

#include <string>
#include <utility>
#include <vector>

namespace codexbridge::broker {

using AttemptResult = common::Result<events::AggregateResult, BrokerError>;

/// One attempt at an invocation. The retry loop and tests substitute their own.
class InvocationRunner {
public:
  virtual ~InvocationRunner() = default;

  [[nodiscard]] virtual AttemptResult run(const InvocationRequest &request) = 0;
};

/// Spawns the codex CLI under a ProcessSupervisor.
class CodexRunner final : public InvocationRunner {
public:
  CodexRunner(std::string executable, process::SupervisorOptions options,
              std::vector<std::pair<std::string, std::string>> environment = {});

  [[nodiscard]] AttemptResult run(const InvocationRequest &request) override;

private:
  std::string executable_;
  process::ProcessSupervisor supervisor_;
  std::vector<std::pair<std::string, std::string>> environment_;
};

} // namespace codexbridge::broker
