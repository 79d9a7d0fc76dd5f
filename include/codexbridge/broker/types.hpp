#pragma once

#include "codexbridge/common/json_util.hpp"
#include "codexbridge/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codexbridge::broker {

enum class SandboxMode { ReadOnly, WorkspaceWrite, DangerFullAccess };

/// Upper bound on a single invocation's wall-clock budget. Larger values are rejected or clamped.
inline constexpr std::chrono::seconds MAX_INVOCATION_TIMEOUT{7 * 24 * 60 * 60};

/// Failure taxonomy surfaced to callers. Only the payload fields of `kind` are meaningful.
struct BrokerError {
  enum class Kind { Execution, Timeout, SessionNotFound, InvalidSandboxMode };

  Kind kind = Kind::Execution;
  std::string message;

  // Execution
  std::optional<int> exit_code;
  std::string stderr_text;

  // Timeout
  std::chrono::seconds timeout{0};
  std::string partial_output;

  // SessionNotFound
  std::string thread_id;

  // InvalidSandboxMode
  std::string invalid_value;
  std::vector<std::string> valid_values;

  [[nodiscard]] static BrokerError execution(std::string message,
                                             std::optional<int> exit_code = std::nullopt,
                                             std::string stderr_text = "");
  [[nodiscard]] static BrokerError timed_out(std::chrono::seconds timeout,
                                             std::string partial_output);
  [[nodiscard]] static BrokerError session_not_found(std::string thread_id);
  [[nodiscard]] static BrokerError invalid_sandbox_mode(std::string value);

  [[nodiscard]] bool is(Kind other) const { return kind == other; }
  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] std::string_view kind_name(BrokerError::Kind kind);

[[nodiscard]] std::string_view to_string(SandboxMode mode);
[[nodiscard]] const std::vector<std::string> &valid_sandbox_modes();
[[nodiscard]] common::Result<SandboxMode, BrokerError> parse_sandbox_mode(std::string_view value);

struct InvocationRequest {
  std::string prompt;
  std::string working_directory;
  SandboxMode sandbox_mode = SandboxMode::ReadOnly;
  std::optional<std::string> model;
  std::chrono::seconds timeout{600};
  /// Present: resume that thread. Absent: start a new one.
  std::optional<std::string> continuation_id;

  [[nodiscard]] bool is_resume() const { return continuation_id.has_value(); }
};

struct InvocationResult {
  bool success = true;
  std::optional<std::string> thread_id;
  std::string agent_messages;
  std::vector<std::string> reasoning;
  bool completed = false;
  std::vector<std::string> errors;
};

[[nodiscard]] common::JsonValue to_json(const InvocationResult &result);

} // namespace codexbridge::broker
