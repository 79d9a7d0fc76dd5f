#include "helpers/test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <random>

namespace codexbridge::testing {

config::Config mock_config() {
  config::Config config;
  config.codex.executable = "codex";
  config.codex.default_timeout_secs = 30;
  config.reliability.max_retries = 3;
  config.reliability.retry_delay_ms = 0;
  config.process.terminate_grace_ms = 200;
  config.process.stderr_poll_ms = 50;
  config.observability.backend = "none";
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("codexbridge-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

std::filesystem::path TempWorkspace::write_fake_codex(const std::string &name,
                                                      const std::string &body) const {
  create_file(name, "#!/bin/sh\n" + body);
  const auto script = path_ / name;
  std::filesystem::permissions(script,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec,
                               std::filesystem::perm_options::replace);
  return script;
}

config::Config temp_config(const TempWorkspace &workspace) {
  auto config = mock_config();
  config.sessions.storage_dir = (workspace.path() / "sessions").string();
  config.codex.default_working_directory = workspace.path().string();
  return config;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

void ScriptedRunner::push(broker::AttemptResult outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  outcomes_.push_back(std::move(outcome));
}

broker::AttemptResult ScriptedRunner::run(const broker::InvocationRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(request);
  if (outcomes_.empty()) {
    return broker::AttemptResult::failure(
        broker::BrokerError::execution("scripted runner exhausted"));
  }
  auto next = std::move(outcomes_.front());
  outcomes_.pop_front();
  return next;
}

std::size_t ScriptedRunner::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.size();
}

std::vector<broker::InvocationRequest> ScriptedRunner::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

events::AggregateResult aggregate_with_messages(const std::vector<std::string> &messages,
                                                std::optional<std::string> thread_id,
                                                const bool completed) {
  events::AggregateResult result;
  result.agent_messages = messages;
  result.thread_id = std::move(thread_id);
  result.completed = completed;
  return result;
}

} // namespace codexbridge::testing
