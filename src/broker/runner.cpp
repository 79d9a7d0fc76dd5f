#include "codexbridge/broker/runner.hpp"

#include "codexbridge/observability/global.hpp"

#include <algorithm>
#include <filesystem>

namespace codexbridge::broker {

CodexRunner::CodexRunner(std::string executable, process::SupervisorOptions options,
                         std::vector<std::pair<std::string, std::string>> environment)
    : executable_(std::move(executable)), supervisor_(options),
      environment_(std::move(environment)) {}

AttemptResult CodexRunner::run(const InvocationRequest &request) {
  process::ProcessSpec spec;
  spec.argv = process::build_codex_command(executable_, request);
  spec.working_directory = request.working_directory;
  if (spec.working_directory.empty()) {
    std::error_code ec;
    spec.working_directory = std::filesystem::current_path(ec).string();
  }
  spec.environment = environment_;
  spec.input_payload = request.prompt;
  spec.timeout = std::min(request.timeout, MAX_INVOCATION_TIMEOUT);
  spec.resume = request.is_resume();

  observability::log_debug("process", "prompt (first 200 chars): " + request.prompt.substr(0, 200));
  return supervisor_.run(spec);
}

} // namespace codexbridge::broker
