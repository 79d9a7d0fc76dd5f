#include "test_framework.hpp"

#ifndef _WIN32

#include "codexbridge/broker/runner.hpp"
#include "codexbridge/common/fs.hpp"
#include "codexbridge/process/supervisor.hpp"

#include "helpers/test_helpers.hpp"

#include <cerrno>
#include <csignal>
#include <fstream>
#include <sys/types.h>
#include <thread>

namespace {

namespace b = codexbridge::broker;
namespace p = codexbridge::process;
namespace t = codexbridge::testing;

constexpr const char *THREAD_STARTED = R"(echo '{"type":"thread.started","thread_id":"th-1"}')";
constexpr const char *TURN_COMPLETED = R"(echo '{"type":"turn.completed"}')";

std::string agent_message(const std::string &text) {
  return R"(echo '{"type":"item.completed","item":{"type":"agent_message","text":")" + text +
         R"("}}')";
}

p::SupervisorOptions fast_options() {
  return p::SupervisorOptions{.terminate_grace = std::chrono::milliseconds(200),
                              .poll_interval = std::chrono::milliseconds(50)};
}

p::ProcessSpec spec_for(const std::filesystem::path &script, const t::TempWorkspace &ws,
                        const std::chrono::milliseconds timeout = std::chrono::seconds(20)) {
  p::ProcessSpec spec;
  spec.argv = {script.string(), "exec", "-", "--json"};
  spec.working_directory = ws.path().string();
  spec.input_payload = "prompt text\n";
  spec.timeout = timeout;
  return spec;
}

std::string read_or_empty(const std::filesystem::path &path) {
  auto content = codexbridge::common::read_file(path);
  return content.ok() ? content.value() : std::string();
}

std::string background_sleeper(const std::filesystem::path &pid_file) {
  return "sleep 60 &\necho $! > '" + pid_file.string() + "'\n";
}

/// Orphans are not always reaped in containers, so a zombie counts as dead.
bool process_gone(const pid_t pid) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (true) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!stat || !std::getline(stat, line)) {
      return true;
    }
    const auto paren = line.rfind(')');
    if (paren != std::string::npos && paren + 2 < line.size()) {
      const char state = line[paren + 2];
      if (state == 'Z' || state == 'X') {
        return true;
      }
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

pid_t read_pid(const std::filesystem::path &pid_file) {
  const auto text = codexbridge::common::trim(read_or_empty(pid_file));
  return text.empty() ? 0 : static_cast<pid_t>(std::stol(text));
}

} // namespace

void register_supervisor_tests(std::vector<codexbridge::tests::TestCase> &tests) {
  using codexbridge::tests::require;

  tests.push_back({"supervisor_command_for_new_session", [] {
                     b::InvocationRequest request;
                     request.prompt = "hi";
                     request.sandbox_mode = b::SandboxMode::WorkspaceWrite;
                     request.model = "gpt-5-codex";
                     const auto argv = p::build_codex_command("codex", request);
                     const std::vector<std::string> expected = {
                         "codex",     "exec",           "-",
                         "--json",    "--skip-git-repo-check", "--sandbox",
                         "workspace-write", "--model",  "gpt-5-codex"};
                     require(argv == expected, "new-session argv mismatch");

                     request.model = std::string();
                     const auto no_model = p::build_codex_command("codex", request);
                     require(no_model.size() == 7, "empty model should be omitted");
                   }});

  tests.push_back({"supervisor_command_for_resume", [] {
                     b::InvocationRequest request;
                     request.prompt = "again";
                     request.sandbox_mode = b::SandboxMode::DangerFullAccess;
                     request.model = "ignored";
                     request.continuation_id = "th-9";
                     const auto argv = p::build_codex_command("/bin/codex", request);
                     const std::vector<std::string> expected = {
                         "/bin/codex", "exec", "resume", "--json", "--skip-git-repo-check",
                         "th-9",       "-"};
                     require(argv == expected, "resume argv mismatch");
                   }});

  tests.push_back({"supervisor_successful_run_collects_events", [] {
                     t::TempWorkspace ws;
                     const auto script = ws.write_fake_codex(
                         "codex.sh", "cat > /dev/null\n" + std::string(THREAD_STARTED) + "\n" +
                                         agent_message("first") + "\n" + agent_message("second") +
                                         "\n" + TURN_COMPLETED + "\n");
                     p::ProcessSupervisor supervisor(fast_options());
                     auto result = supervisor.run(spec_for(script, ws));
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     require(result.value().thread_id == std::optional<std::string>("th-1"),
                             "thread id expected");
                     require(result.value().response_text() == "first\n\nsecond",
                             "response text mismatch");
                     require(result.value().completed, "completion expected");
                   }});

  tests.push_back({"supervisor_passes_prompt_on_stdin_and_cwd", [] {
                     t::TempWorkspace ws;
                     const auto prompt_file = ws.path() / "prompt.txt";
                     const auto cwd_file = ws.path() / "cwd.txt";
                     const auto script = ws.write_fake_codex(
                         "codex.sh", "cat > '" + prompt_file.string() + "'\npwd > '" +
                                         cwd_file.string() + "'\n" + TURN_COMPLETED + "\n");
                     auto spec = spec_for(script, ws);
                     spec.input_payload = "line one\n\"quoted\" $HOME `tick`\n";
                     p::ProcessSupervisor supervisor(fast_options());
                     auto result = supervisor.run(spec);
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     require(read_or_empty(prompt_file) == spec.input_payload,
                             "prompt must arrive verbatim on stdin");
                     const auto cwd = codexbridge::common::trim(read_or_empty(cwd_file));
                     require(std::filesystem::equivalent(cwd, ws.path()),
                             "child should run in the requested directory");
                   }});

  tests.push_back({"supervisor_nonzero_exit_with_content_is_best_effort", [] {
                     t::TempWorkspace ws;
                     const auto script = ws.write_fake_codex(
                         "codex.sh", "cat > /dev/null\n" + agent_message("partial answer") +
                                         "\necho 'boom' >&2\nexit 3\n");
                     p::ProcessSupervisor supervisor(fast_options());
                     auto result = supervisor.run(spec_for(script, ws));
                     require(result.ok(), "usable content should beat the exit code");
                     require(result.value().response_text() == "partial answer",
                             "partial text expected");
                     require(!result.value().completed, "run did not complete");
                   }});

  tests.push_back({"supervisor_nonzero_exit_without_content_fails", [] {
                     t::TempWorkspace ws;
                     const auto script = ws.write_fake_codex(
                         "codex.sh", "cat > /dev/null\necho 'fatal: not logged in' >&2\nexit 2\n");
                     p::ProcessSupervisor supervisor(fast_options());
                     auto result = supervisor.run(spec_for(script, ws));
                     require(!result.ok(), "empty failing run should be an error");
                     const auto &error = result.error();
                     require(error.is(b::BrokerError::Kind::Execution), "execution error expected");
                     require(error.exit_code == std::optional<int>(2), "exit code expected");
                     require(error.message == "Codex exited with code 2", "message mismatch");
                     require(error.stderr_text.find("fatal: not logged in") != std::string::npos,
                             "stderr text should be carried: " + error.stderr_text);
                   }});

  tests.push_back({"supervisor_timeout_kills_child_and_keeps_partial", [] {
                     t::TempWorkspace ws;
                     const auto pid_file = ws.path() / "pid.txt";
                     const auto script = ws.write_fake_codex(
                         "codex.sh", "echo $$ > '" + pid_file.string() + "'\ncat > /dev/null\n" +
                                         agent_message("halfway") + "\nsleep 30\n");
                     p::ProcessSupervisor supervisor(fast_options());
                     const auto started = std::chrono::steady_clock::now();
                     auto result = supervisor.run(spec_for(script, ws, std::chrono::seconds(1)));
                     const auto elapsed = std::chrono::steady_clock::now() - started;

                     require(!result.ok(), "timeout should fail");
                     const auto &error = result.error();
                     require(error.is(b::BrokerError::Kind::Timeout), "timeout kind expected");
                     require(error.timeout == std::chrono::seconds(1), "timeout seconds");
                     require(error.message == "Codex execution timed out after 1 seconds",
                             "timeout message mismatch: " + error.message);
                     require(error.partial_output.find("halfway") != std::string::npos,
                             "partial output expected");
                     require(elapsed < std::chrono::seconds(10), "timeout must not wait for sleep");

                     const auto pid_text = codexbridge::common::trim(read_or_empty(pid_file));
                     require(!pid_text.empty(), "script should record its pid");
                     const pid_t pid = static_cast<pid_t>(std::stol(pid_text));
                     require(kill(pid, 0) != 0 && errno == ESRCH,
                             "child must not outlive the deadline");
                   }});

  tests.push_back({"supervisor_child_lingering_after_completion_is_success", [] {
                     t::TempWorkspace ws;
                     const auto script = ws.write_fake_codex(
                         "codex.sh", "cat > /dev/null\n" + std::string(THREAD_STARTED) + "\n" +
                                         agent_message("done") + "\n" + TURN_COMPLETED +
                                         "\nsleep 30\n");
                     p::ProcessSupervisor supervisor(fast_options());
                     const auto started = std::chrono::steady_clock::now();
                     auto result = supervisor.run(spec_for(script, ws));
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     require(result.value().completed, "completion expected");
                     require(elapsed < std::chrono::seconds(10),
                             "reader must stop at completion, not at stream close");
                   }});

  tests.push_back({"supervisor_timeout_kills_grandchildren", [] {
                     t::TempWorkspace ws;
                     const auto pid_file = ws.path() / "grandchild.txt";
                     const auto script = ws.write_fake_codex(
                         "codex.sh", "cat > /dev/null\n" + background_sleeper(pid_file) +
                                         agent_message("working") + "\nsleep 30\n");
                     p::ProcessSupervisor supervisor(fast_options());
                     auto result = supervisor.run(spec_for(script, ws, std::chrono::seconds(1)));
                     require(!result.ok() && result.error().is(b::BrokerError::Kind::Timeout),
                             "timeout expected");
                     const pid_t grandchild = read_pid(pid_file);
                     require(grandchild > 0, "script should record the background pid");
                     require(process_gone(grandchild),
                             "background process must die with the tree");
                   }});

  tests.push_back({"supervisor_completion_kills_lingering_grandchildren", [] {
                     t::TempWorkspace ws;
                     const auto pid_file = ws.path() / "grandchild.txt";
                     const auto script = ws.write_fake_codex(
                         "codex.sh", "cat > /dev/null\n" + background_sleeper(pid_file) +
                                         agent_message("done") + "\n" + TURN_COMPLETED +
                                         "\nsleep 30\n");
                     p::ProcessSupervisor supervisor(fast_options());
                     auto result = supervisor.run(spec_for(script, ws));
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     const pid_t grandchild = read_pid(pid_file);
                     require(grandchild > 0, "script should record the background pid");
                     require(process_gone(grandchild),
                             "background process must not outlive a completed run");
                   }});

  tests.push_back({"supervisor_codex_runner_caps_huge_timeouts", [] {
                     t::TempWorkspace ws;
                     const auto script = ws.write_fake_codex(
                         "codex.sh", "cat > /dev/null\n" + agent_message("quick") + "\n" +
                                         TURN_COMPLETED + "\n");
                     b::CodexRunner runner(script.string(), fast_options(), {});
                     b::InvocationRequest request;
                     request.prompt = "hi";
                     request.working_directory = ws.path().string();
                     request.timeout = std::chrono::seconds(9223372036854775LL);
                     auto result = runner.run(request);
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     require(result.value().response_text() == "quick", "response expected");
                   }});

  tests.push_back({"supervisor_missing_executable_is_execution_error", [] {
                     t::TempWorkspace ws;
                     p::ProcessSupervisor supervisor(fast_options());
                     auto result = supervisor.run(spec_for(ws.path() / "no-such-codex", ws));
                     require(!result.ok(), "missing executable should fail");
                     require(result.error().is(b::BrokerError::Kind::Execution),
                             "execution error expected");
                   }});

  tests.push_back({"supervisor_bad_working_directory_is_execution_error", [] {
                     t::TempWorkspace ws;
                     const auto script = ws.write_fake_codex("codex.sh", TURN_COMPLETED);
                     auto spec = spec_for(script, ws);
                     spec.working_directory = (ws.path() / "missing-dir").string();
                     p::ProcessSupervisor supervisor(fast_options());
                     auto result = supervisor.run(spec);
                     require(!result.ok(), "bad cwd should fail");
                     require(result.error().is(b::BrokerError::Kind::Execution),
                             "execution error expected");
                   }});

  tests.push_back({"supervisor_codex_runner_builds_resume_invocation", [] {
                     t::TempWorkspace ws;
                     const auto args_file = ws.path() / "args.txt";
                     const auto script = ws.write_fake_codex(
                         "codex.sh", "printf '%s\\n' \"$@\" > '" + args_file.string() +
                                         "'\ncat > /dev/null\n" + TURN_COMPLETED + "\n");
                     b::CodexRunner runner(script.string(), fast_options(),
                                           {{"CODEXBRIDGE_TEST_MARK", "1"}});
                     b::InvocationRequest request;
                     request.prompt = "continue";
                     request.working_directory = ws.path().string();
                     request.timeout = std::chrono::seconds(20);
                     request.continuation_id = "th-42";
                     auto result = runner.run(request);
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     require(read_or_empty(args_file) ==
                                 "exec\nresume\n--json\n--skip-git-repo-check\nth-42\n-\n",
                             "resume arguments mismatch: " + read_or_empty(args_file));
                   }});
}

#else

void register_supervisor_tests(std::vector<codexbridge::tests::TestCase> &) {}

#endif
