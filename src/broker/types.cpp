#include "codexbridge/broker/types.hpp"

#include "codexbridge/common/fs.hpp"

namespace codexbridge::broker {

BrokerError BrokerError::execution(std::string message, std::optional<int> exit_code,
                                   std::string stderr_text) {
  BrokerError error;
  error.kind = Kind::Execution;
  error.message = std::move(message);
  error.exit_code = exit_code;
  error.stderr_text = std::move(stderr_text);
  return error;
}

BrokerError BrokerError::timed_out(const std::chrono::seconds timeout,
                                   std::string partial_output) {
  BrokerError error;
  error.kind = Kind::Timeout;
  error.timeout = timeout;
  error.partial_output = std::move(partial_output);
  error.message = "Codex execution timed out after " + std::to_string(timeout.count()) + " seconds";
  return error;
}

BrokerError BrokerError::session_not_found(std::string thread_id) {
  BrokerError error;
  error.kind = Kind::SessionNotFound;
  error.message = "Session not found: " + thread_id;
  error.thread_id = std::move(thread_id);
  return error;
}

BrokerError BrokerError::invalid_sandbox_mode(std::string value) {
  BrokerError error;
  error.kind = Kind::InvalidSandboxMode;
  error.valid_values = valid_sandbox_modes();
  std::string joined;
  for (const auto &mode : error.valid_values) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += mode;
  }
  error.message = "Invalid sandbox mode: " + value + ". Valid modes: " + joined;
  error.invalid_value = std::move(value);
  return error;
}

std::string BrokerError::to_string() const {
  if (!message.empty()) {
    return message;
  }
  switch (kind) {
  case Kind::Execution:
    return exit_code.has_value() ? "Codex exited with code " + std::to_string(*exit_code)
                                 : "Codex execution failed";
  case Kind::Timeout:
    return "Codex execution timed out after " + std::to_string(timeout.count()) + " seconds";
  case Kind::SessionNotFound:
    return "Session not found: " + thread_id;
  case Kind::InvalidSandboxMode:
    return "Invalid sandbox mode: " + invalid_value;
  }
  return "unknown error";
}

std::string_view kind_name(const BrokerError::Kind kind) {
  switch (kind) {
  case BrokerError::Kind::Execution:
    return "execution";
  case BrokerError::Kind::Timeout:
    return "timeout";
  case BrokerError::Kind::SessionNotFound:
    return "session_not_found";
  case BrokerError::Kind::InvalidSandboxMode:
    return "invalid_sandbox_mode";
  }
  return "execution";
}

std::string_view to_string(const SandboxMode mode) {
  switch (mode) {
  case SandboxMode::ReadOnly:
    return "read-only";
  case SandboxMode::WorkspaceWrite:
    return "workspace-write";
  case SandboxMode::DangerFullAccess:
    return "danger-full-access";
  }
  return "read-only";
}

const std::vector<std::string> &valid_sandbox_modes() {
  // Sorted, matching the order shown in error messages.
  static const std::vector<std::string> modes = {"danger-full-access", "read-only",
                                                 "workspace-write"};
  return modes;
}

common::Result<SandboxMode, BrokerError> parse_sandbox_mode(const std::string_view value) {
  using R = common::Result<SandboxMode, BrokerError>;
  if (value == "read-only") {
    return R::success(SandboxMode::ReadOnly);
  }
  if (value == "workspace-write") {
    return R::success(SandboxMode::WorkspaceWrite);
  }
  if (value == "danger-full-access") {
    return R::success(SandboxMode::DangerFullAccess);
  }
  return R::failure(BrokerError::invalid_sandbox_mode(std::string(value)));
}

common::JsonValue to_json(const InvocationResult &result) {
  auto out = common::JsonValue::object();
  out.set("success", result.success);
  out.set("threadId", result.thread_id.has_value() ? common::JsonValue(*result.thread_id)
                                                   : common::JsonValue(nullptr));
  out.set("agent_messages", result.agent_messages);
  auto reasoning = common::JsonValue::array();
  for (const auto &entry : result.reasoning) {
    reasoning.push_back(entry);
  }
  out.set("reasoning", std::move(reasoning));
  out.set("completed", result.completed);
  if (!result.errors.empty()) {
    auto errors = common::JsonValue::array();
    for (const auto &entry : result.errors) {
      errors.push_back(entry);
    }
    out.set("errors", std::move(errors));
  }
  return out;
}

} // namespace codexbridge::broker
