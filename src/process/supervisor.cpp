#include "codexbridge/process/supervisor.hpp"

#include "codexbridge/observability/global.hpp"
#include "codexbridge/process/child_process.hpp"
#include "codexbridge/process/stream_reader.hpp"

#include <atomic>
#include <future>

namespace codexbridge::process {

namespace {

using RunResult = common::Result<events::AggregateResult, broker::BrokerError>;

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               started);
}

} // namespace

std::vector<std::string> build_codex_command(const std::string &executable,
                                             const broker::InvocationRequest &request) {
  std::vector<std::string> argv = {executable, "exec"};
  if (request.continuation_id.has_value()) {
    // Resumed threads keep the sandbox and model they were started with.
    argv.insert(argv.end(),
                {"resume", "--json", "--skip-git-repo-check", *request.continuation_id, "-"});
    return argv;
  }

  argv.insert(argv.end(), {"-", "--json", "--skip-git-repo-check"});
  argv.insert(argv.end(), {"--sandbox", std::string(broker::to_string(request.sandbox_mode))});
  if (request.model.has_value() && !request.model->empty()) {
    argv.insert(argv.end(), {"--model", *request.model});
  }
  return argv;
}

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options) : options_(options) {}

RunResult ProcessSupervisor::run(const ProcessSpec &spec) const {
  const auto started = std::chrono::steady_clock::now();
  const std::string executable = spec.argv.empty() ? std::string() : spec.argv.front();
  observability::record_invocation_start(executable, spec.working_directory, spec.resume);

  try {
    auto spawned = ChildProcess::spawn(SpawnOptions{.argv = spec.argv,
                                                    .working_directory = spec.working_directory,
                                                    .environment = spec.environment});
    if (!spawned.ok()) {
      observability::record_error("process", spawned.error());
      return RunResult::failure(broker::BrokerError::execution(spawned.error()));
    }
    std::unique_ptr<ChildProcess> child = std::move(spawned.value());

    if (auto written = child->write_input(spec.input_payload); !written.ok()) {
      child->terminate_tree(options_.terminate_grace);
      return RunResult::failure(broker::BrokerError::execution(written.error()));
    }

    events::EventParser parser;
    StreamReader reader(options_.poll_interval);
    std::atomic<bool> cancel{false};
    auto draining = std::async(std::launch::async, [&] {
      return reader.drain(child->stdout_channel(), child->stderr_channel(), parser, cancel);
    });

    if (draining.wait_for(spec.timeout) == std::future_status::timeout) {
      cancel.store(true);
      std::string partial = reader.primary_snapshot();
      child->terminate_tree(options_.terminate_grace);
      (void)draining.get();
      observability::record_invocation_end(elapsed_since(started), parser.completed(),
                                           child->exit_code());
      const auto timeout = std::chrono::duration_cast<std::chrono::seconds>(spec.timeout);
      auto error = broker::BrokerError::timed_out(timeout, std::move(partial));
      observability::record_error("process", error.to_string());
      return RunResult::failure(std::move(error));
    }

    DrainOutcome outcome = draining.get();
    if (!outcome.stopped_on_completion) {
      (void)child->wait_for_exit(options_.terminate_grace);
    }
    child->terminate_tree(options_.terminate_grace);

    const int exit_code = child->exit_code().value_or(-1);
    events::AggregateResult result = parser.take_result();
    observability::record_invocation_end(elapsed_since(started), result.completed, exit_code);

    if (exit_code == 0 || (result.completed && child->terminated_by_us())) {
      return RunResult::success(std::move(result));
    }

    observability::log_error("process", "codex exited with code " + std::to_string(exit_code) +
                                            ": " + outcome.secondary_text);
    if (result.has_usable_content()) {
      observability::log_warning("process", "returning partial output despite exit code " +
                                                std::to_string(exit_code));
      return RunResult::success(std::move(result));
    }
    return RunResult::failure(broker::BrokerError::execution(
        "Codex exited with code " + std::to_string(exit_code), exit_code,
        std::move(outcome.secondary_text)));
  } catch (const std::exception &ex) {
    observability::record_error("process", ex.what());
    return RunResult::failure(broker::BrokerError::execution(ex.what()));
  }
}

} // namespace codexbridge::process
