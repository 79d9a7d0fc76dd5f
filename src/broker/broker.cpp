#include "codexbridge/broker/broker.hpp"

#include "codexbridge/common/fs.hpp"
#include "codexbridge/observability/global.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>

namespace codexbridge::broker {

namespace {

RetryOptions retry_options_from(const config::Config &config) {
  return RetryOptions{.max_retries = config.reliability.max_retries,
                      .delay = std::chrono::milliseconds(config.reliability.retry_delay_ms)};
}

} // namespace

InvocationResult to_invocation_result(const events::AggregateResult &aggregate) {
  InvocationResult result;
  result.success = true;
  result.thread_id = aggregate.thread_id;
  result.agent_messages = aggregate.response_text();
  result.reasoning = aggregate.reasoning;
  result.completed = aggregate.completed;
  result.errors = aggregate.errors;
  return result;
}

Broker::Broker(config::Config config, sessions::SessionStore &store,
               std::shared_ptr<InvocationRunner> runner)
    : config_(std::move(config)), store_(store),
      retry_(std::move(runner), retry_options_from(config_)) {}

std::string Broker::resolve_working_directory(const std::optional<std::string> &dir) const {
  if (dir.has_value() && !common::trim(*dir).empty()) {
    return common::expand_path(*dir);
  }
  if (!config_.codex.default_working_directory.empty()) {
    return config_.codex.default_working_directory;
  }
  std::error_code ec;
  return std::filesystem::current_path(ec).string();
}

std::chrono::seconds Broker::resolve_timeout(const std::optional<std::chrono::seconds> t) const {
  if (t.has_value() && t->count() > 0) {
    return std::min(*t, MAX_INVOCATION_TIMEOUT);
  }
  if (config_.codex.default_timeout_secs >=
      static_cast<std::uint64_t>(MAX_INVOCATION_TIMEOUT.count())) {
    return MAX_INVOCATION_TIMEOUT;
  }
  return std::chrono::seconds(config_.codex.default_timeout_secs);
}

void Broker::record_turns(const std::string &thread_id, const std::string &prompt,
                          const std::string &response) {
  auto updated = store_.modify(thread_id, [&](sessions::SessionRecord &record) {
    sessions::append_turn(record, "user", prompt);
    sessions::append_turn(record, "assistant", response);
  });
  if (!updated.ok()) {
    observability::log_warning("broker", "could not record turns: " + updated.error().to_string());
  }
}

BrokerResult Broker::start(const NewSessionRequest &request) {
  const std::string sandbox_text =
      request.sandbox.empty() ? config_.codex.default_sandbox : request.sandbox;
  auto sandbox = parse_sandbox_mode(sandbox_text);
  if (!sandbox.ok()) {
    return BrokerResult::failure(sandbox.error());
  }

  InvocationRequest invocation;
  invocation.prompt = request.prompt;
  invocation.working_directory = resolve_working_directory(request.working_directory);
  invocation.sandbox_mode = sandbox.value();
  invocation.model = request.model;
  invocation.timeout = resolve_timeout(request.timeout);

  auto outcome = retry_.execute(invocation);
  if (!outcome.ok()) {
    return BrokerResult::failure(outcome.error());
  }
  InvocationResult result = to_invocation_result(outcome.value());

  if (result.thread_id.has_value()) {
    auto created = store_.create(*result.thread_id, invocation.working_directory,
                                 std::string(to_string(invocation.sandbox_mode)), invocation.model);
    if (created.ok()) {
      record_turns(*result.thread_id, request.prompt, result.agent_messages);
    } else {
      observability::log_warning("broker", "could not create session: " + created.error());
    }
  }
  return BrokerResult::success(std::move(result));
}

BrokerResult Broker::reply(const ReplyRequest &request) {
  if (common::trim(request.thread_id).empty()) {
    return BrokerResult::failure(BrokerError::session_not_found(request.thread_id));
  }

  InvocationRequest invocation;
  invocation.prompt = request.prompt;
  invocation.continuation_id = request.thread_id;
  invocation.timeout = resolve_timeout(request.timeout);

  std::string sandbox_text = config_.codex.default_sandbox;
  const bool known = store_.exists(request.thread_id);
  if (known) {
    auto stored = store_.get(request.thread_id);
    if (stored.ok()) {
      invocation.working_directory = resolve_working_directory(stored.value().working_directory);
      sandbox_text = stored.value().sandbox_mode;
      invocation.model = stored.value().model;
    }
  } else {
    observability::log_info("broker", "no stored session for " + request.thread_id +
                                          ", resuming with defaults");
  }
  if (invocation.working_directory.empty()) {
    invocation.working_directory = resolve_working_directory(std::nullopt);
  }

  auto sandbox = parse_sandbox_mode(sandbox_text);
  if (!sandbox.ok()) {
    return BrokerResult::failure(sandbox.error());
  }
  invocation.sandbox_mode = sandbox.value();

  auto outcome = retry_.execute(invocation);
  if (!outcome.ok()) {
    return BrokerResult::failure(outcome.error());
  }
  InvocationResult result = to_invocation_result(outcome.value());

  if (known) {
    record_turns(request.thread_id, request.prompt, result.agent_messages);
  } else if (result.thread_id.has_value()) {
    auto created = store_.create(*result.thread_id, invocation.working_directory,
                                 std::string(to_string(invocation.sandbox_mode)), invocation.model);
    if (created.ok()) {
      record_turns(*result.thread_id, request.prompt, result.agent_messages);
    } else {
      observability::log_warning("broker", "could not create session: " + created.error());
    }
  }

  if (!result.thread_id.has_value()) {
    result.thread_id = request.thread_id;
  }
  return BrokerResult::success(std::move(result));
}

} // namespace codexbridge::broker
