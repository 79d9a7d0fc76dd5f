#include "codexbridge/broker/retry_policy.hpp"

#include "codexbridge/common/fs.hpp"
#include "codexbridge/observability/global.hpp"

#include <array>
#include <optional>
#include <thread>

namespace codexbridge::broker {

namespace {

constexpr std::array<const char *, 6> TRANSIENT_PATTERNS = {
    "reconnecting",      "stream disconnected", "stream closed",
    "connection reset", "connection refused",  "network error",
};

std::string join_errors(const std::vector<std::string> &errors) {
  std::string out;
  for (const auto &error : errors) {
    if (!out.empty()) {
      out += "; ";
    }
    out += error;
  }
  return out;
}

} // namespace

bool is_transient(const std::vector<std::string> &errors) {
  for (const auto &error : errors) {
    for (const char *pattern : TRANSIENT_PATTERNS) {
      if (common::contains_ci(error, pattern)) {
        return true;
      }
    }
  }
  return false;
}

RetryPolicy::RetryPolicy(std::shared_ptr<InvocationRunner> runner, RetryOptions options)
    : runner_(std::move(runner)), options_(options) {}

AttemptResult RetryPolicy::execute(const InvocationRequest &request) const {
  if (runner_ == nullptr) {
    return AttemptResult::failure(BrokerError::execution("no invocation runner configured"));
  }

  const std::uint32_t attempts = options_.max_retries + 1;
  std::optional<events::AggregateResult> last_partial;
  std::optional<BrokerError> last_error;

  for (std::uint32_t attempt = 0; attempt < attempts; ++attempt) {
    if (attempt > 0) {
      observability::log_info("retry", "retry attempt " + std::to_string(attempt) + "/" +
                                           std::to_string(options_.max_retries) + " after " +
                                           std::to_string(options_.delay.count()) + "ms");
      std::this_thread::sleep_for(options_.delay);
    }

    auto outcome = runner_->run(request);
    if (outcome.ok()) {
      auto &result = outcome.value();
      if (!result.completed && is_transient(result.errors)) {
        const std::string joined = join_errors(result.errors);
        observability::record_retry(attempt + 1, attempts, joined);
        last_error = BrokerError::execution("retryable error: " + joined);
        last_partial = std::move(result);
        continue;
      }
      return outcome;
    }

    const BrokerError &error = outcome.error();
    switch (error.kind) {
    case BrokerError::Kind::Timeout:
    case BrokerError::Kind::InvalidSandboxMode:
    case BrokerError::Kind::SessionNotFound:
      return outcome;
    case BrokerError::Kind::Execution:
      observability::record_retry(attempt + 1, attempts, error.to_string());
      last_error = error;
      break;
    }
  }

  if (last_partial.has_value() && last_partial->has_usable_content()) {
    observability::log_warning("retry", "returning partial result after retries exhausted");
    return AttemptResult::success(std::move(*last_partial));
  }
  if (last_error.has_value()) {
    return AttemptResult::failure(std::move(*last_error));
  }
  return AttemptResult::failure(BrokerError::execution("all retry attempts failed"));
}

} // namespace codexbridge::broker
