#pragma once

#include "codexbridge/broker/retry_policy.hpp"
#include "codexbridge/broker/types.hpp"
#include "codexbridge/config/schema.hpp"
#include "codexbridge/sessions/store.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace codexbridge::broker {

struct NewSessionRequest {
  std::string prompt;
  std::optional<std::string> working_directory;
  /// Empty means the configured default.
  std::string sandbox;
  std::optional<std::string> model;
  std::optional<std::chrono::seconds> timeout;
};

struct ReplyRequest {
  std::string thread_id;
  std::string prompt;
  std::optional<std::chrono::seconds> timeout;
};

using BrokerResult = common::Result<InvocationResult, BrokerError>;

/// Entry point for callers: validates requests, runs them through the retry policy and keeps
/// the session store in step with every turn.
class Broker {
public:
  Broker(config::Config config, sessions::SessionStore &store,
         std::shared_ptr<InvocationRunner> runner);

  [[nodiscard]] BrokerResult start(const NewSessionRequest &request);
  [[nodiscard]] BrokerResult reply(const ReplyRequest &request);

  [[nodiscard]] sessions::SessionStore &sessions() { return store_; }
  [[nodiscard]] const config::Config &config() const { return config_; }

private:
  [[nodiscard]] std::string resolve_working_directory(const std::optional<std::string> &dir) const;
  [[nodiscard]] std::chrono::seconds resolve_timeout(std::optional<std::chrono::seconds> t) const;
  void record_turns(const std::string &thread_id, const std::string &prompt,
                    const std::string &response);

  config::Config config_;
  sessions::SessionStore &store_;
  RetryPolicy retry_;
};

[[nodiscard]] InvocationResult to_invocation_result(const events::AggregateResult &aggregate);

} // namespace codexbridge::broker
