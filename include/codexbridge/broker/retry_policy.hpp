#pragma once

#include "codexbridge/broker/runner.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace codexbridge::broker {

struct RetryOptions {
  std::uint32_t max_retries = 3;
  std::chrono::milliseconds delay{2000};
};

/// Case-insensitive match of any error against the known disconnection messages.
[[nodiscard]] bool is_transient(const std::vector<std::string> &errors);

/// Runs up to max_retries + 1 attempts. Transient disconnections and execution failures are
/// retried; timeouts and validation failures are returned at once. When every attempt has
/// been used, a remembered partial result with agent text or a thread id wins over the
/// last failure.
class RetryPolicy {
public:
  RetryPolicy(std::shared_ptr<InvocationRunner> runner, RetryOptions options = {});

  [[nodiscard]] AttemptResult execute(const InvocationRequest &request) const;

  [[nodiscard]] const RetryOptions &options() const { return options_; }

private:
  std::shared_ptr<InvocationRunner> runner_;
  RetryOptions options_;
};

} // namespace codexbridge::broker
