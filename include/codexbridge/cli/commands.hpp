#pragma once

#include "codexbridge/broker/types.hpp"

#include <string>

namespace codexbridge::cli {

/// Human-readable rendering of a successful invocation.
[[nodiscard]] std::string format_result_text(const broker::InvocationResult &result);
/// Human-readable rendering of a failed invocation. Timeout output is capped at 1000 chars.
[[nodiscard]] std::string format_error_text(const broker::BrokerError &error);
[[nodiscard]] std::string format_error_json(const broker::BrokerError &error);

void print_help();
int run_cli(int argc, char **argv);

} // namespace codexbridge::cli
