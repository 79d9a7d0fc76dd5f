#include "codexbridge/cli/commands.hpp"

#include "codexbridge/common/fs.hpp"
#include "codexbridge/common/time.hpp"
#include "codexbridge/config/config.hpp"
#include "codexbridge/observability/global.hpp"
#include "codexbridge/runtime/app.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace codexbridge::cli {

namespace {

constexpr std::size_t PARTIAL_OUTPUT_LIMIT = 1000;

std::string version_string() {
#ifdef CODEXBRIDGE_VERSION
  return std::string("codexbridge ") + CODEXBRIDGE_VERSION;
#else
  return "codexbridge 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

std::string prompt_from(const std::vector<std::string> &args) {
  if (args.size() == 1 && args[0] == "-") {
    return read_stdin_all();
  }
  return join_tokens(args);
}

common::Result<std::optional<std::chrono::seconds>> parse_timeout(const std::string &raw) {
  using R = common::Result<std::optional<std::chrono::seconds>>;
  if (raw.empty()) {
    return R::success(std::nullopt);
  }
  try {
    std::size_t used = 0;
    const long long value = std::stoll(raw, &used);
    if (used != raw.size() || value <= 0) {
      return R::failure("invalid timeout: " + raw);
    }
    if (value > broker::MAX_INVOCATION_TIMEOUT.count()) {
      return R::failure("timeout must not exceed " +
                        std::to_string(broker::MAX_INVOCATION_TIMEOUT.count()) + " seconds");
    }
    return R::success(std::chrono::seconds(value));
  } catch (const std::exception &) {
    return R::failure("invalid timeout: " + raw);
  }
}

int report(const broker::BrokerResult &outcome, const bool json) {
  if (!outcome.ok()) {
    if (json) {
      std::cout << format_error_json(outcome.error()) << "\n";
    } else {
      std::cerr << format_error_text(outcome.error()) << "\n";
    }
    return 1;
  }
  if (json) {
    std::cout << broker::to_json(outcome.value()).dump() << "\n";
  } else {
    std::cout << format_result_text(outcome.value()) << "\n";
  }
  return 0;
}

common::Result<std::unique_ptr<runtime::App>> open_app() {
  auto app = runtime::App::from_disk();
  if (!app.ok()) {
    std::cerr << app.error() << "\n";
  }
  return app;
}

int run_exec(std::vector<std::string> args) {
  std::string cwd;
  std::string sandbox;
  std::string model;
  std::string timeout_raw;
  (void)take_option(args, "--cwd", cwd);
  (void)take_option(args, "--sandbox", sandbox);
  (void)take_option(args, "--model", model);
  (void)take_option(args, "--timeout", timeout_raw);
  const bool json = take_flag(args, "--json");

  if (args.empty()) {
    std::cerr << "usage: codexbridge exec [--cwd DIR] [--sandbox MODE] [--model NAME] "
                 "[--timeout SECS] [--json] <prompt...|->\n";
    return 1;
  }
  auto timeout = parse_timeout(timeout_raw);
  if (!timeout.ok()) {
    std::cerr << timeout.error() << "\n";
    return 1;
  }

  auto app = open_app();
  if (!app.ok()) {
    return 1;
  }

  broker::NewSessionRequest request;
  request.prompt = prompt_from(args);
  if (!cwd.empty()) {
    request.working_directory = cwd;
  }
  request.sandbox = sandbox;
  if (!model.empty()) {
    request.model = model;
  }
  request.timeout = timeout.value();
  return report(app.value()->broker().start(request), json);
}

int run_reply(std::vector<std::string> args) {
  std::string timeout_raw;
  (void)take_option(args, "--timeout", timeout_raw);
  const bool json = take_flag(args, "--json");

  if (args.size() < 2) {
    std::cerr << "usage: codexbridge reply <thread-id> [--timeout SECS] [--json] <prompt...|->\n";
    return 1;
  }
  auto timeout = parse_timeout(timeout_raw);
  if (!timeout.ok()) {
    std::cerr << timeout.error() << "\n";
    return 1;
  }

  auto app = open_app();
  if (!app.ok()) {
    return 1;
  }

  broker::ReplyRequest request;
  request.thread_id = args[0];
  request.prompt = prompt_from(std::vector<std::string>(args.begin() + 1, args.end()));
  request.timeout = timeout.value();
  return report(app.value()->broker().reply(request), json);
}

int run_sessions(std::vector<std::string> args) {
  std::string max_age_raw;
  (void)take_option(args, "--max-age-hours", max_age_raw);

  auto app = open_app();
  if (!app.ok()) {
    return 1;
  }
  auto &store = app.value()->sessions();
  const std::string action = args.empty() ? "list" : args[0];

  if (action == "list") {
    const auto records = store.list();
    if (records.empty()) {
      std::cout << "No sessions.\n";
      return 0;
    }
    for (const auto &record : records) {
      std::cout << record.thread_id << "  " << common::format_rfc3339(record.last_active)
                << "  turns=" << record.turn_count << "  sandbox=" << record.sandbox_mode
                << "  cwd=" << record.working_directory << "\n";
    }
    return 0;
  }

  if (action == "show") {
    if (args.size() < 2) {
      std::cerr << "usage: codexbridge sessions show <thread-id>\n";
      return 1;
    }
    auto record = store.get(args[1]);
    if (!record.ok()) {
      std::cerr << record.error().to_string() << "\n";
      return 1;
    }
    std::cout << sessions::encode_record(record.value()).dump_pretty() << "\n";
    return 0;
  }

  if (action == "delete") {
    if (args.size() < 2) {
      std::cerr << "usage: codexbridge sessions delete <thread-id>\n";
      return 1;
    }
    if (!store.exists(args[1])) {
      std::cerr << broker::BrokerError::session_not_found(args[1]).to_string() << "\n";
      return 1;
    }
    auto removed = store.remove(args[1]);
    if (!removed.ok()) {
      std::cerr << removed.error() << "\n";
      return 1;
    }
    std::cout << "Deleted session " << args[1] << "\n";
    return 0;
  }

  if (action == "sweep") {
    std::uint64_t hours = app.value()->config().sessions.max_age_hours;
    if (!max_age_raw.empty()) {
      try {
        hours = std::stoull(max_age_raw);
      } catch (const std::exception &) {
        std::cerr << "invalid --max-age-hours: " << max_age_raw << "\n";
        return 1;
      }
    }
    const std::size_t removed = store.sweep(std::chrono::hours(static_cast<long>(hours)));
    std::cout << "Removed " << removed << " session(s) idle for " << hours << "h or more\n";
    return 0;
  }

  std::cerr << "unknown sessions command: " << action << "\n";
  return 1;
}

int run_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  if (auto path = config::config_path(); path.ok()) {
    std::cout << "# " << path.value().string() << "\n";
  }
  std::cout << config::render_config(cfg.value());
  const auto problems = config::validate_config(cfg.value());
  for (const auto &problem : problems) {
    std::cerr << "warning: " << problem << "\n";
  }
  return problems.empty() ? 0 : 1;
}

} // namespace

std::string format_result_text(const broker::InvocationResult &result) {
  std::string out = result.agent_messages;
  if (!result.errors.empty()) {
    out += "\n\nErrors:";
    for (const auto &error : result.errors) {
      out += "\n" + error;
    }
  }
  if (result.thread_id.has_value() && !result.thread_id->empty()) {
    out += "\n\n---\nThread ID: " + *result.thread_id;
  }
  if (out.empty()) {
    return "No response from Codex.";
  }
  return out;
}

std::string format_error_text(const broker::BrokerError &error) {
  switch (error.kind) {
  case broker::BrokerError::Kind::Timeout: {
    std::string out = "Timeout Error: " + error.to_string() + ".";
    if (!error.partial_output.empty()) {
      out += "\n\nPartial Output:\n" + error.partial_output.substr(0, PARTIAL_OUTPUT_LIMIT);
      if (error.partial_output.size() > PARTIAL_OUTPUT_LIMIT) {
        out += "...";
      }
    }
    return out;
  }
  case broker::BrokerError::Kind::SessionNotFound:
    return "Session Not Found: Thread ID '" + error.thread_id +
           "' not found. Start a new session with 'codexbridge exec'.";
  case broker::BrokerError::Kind::Execution: {
    std::string out = "Execution Error: " + error.to_string();
    if (!error.stderr_text.empty()) {
      out += "\n\nStderr:\n" + error.stderr_text;
    }
    return out;
  }
  case broker::BrokerError::Kind::InvalidSandboxMode:
    return "Error: " + error.to_string();
  }
  return "Error: " + error.to_string();
}

std::string format_error_json(const broker::BrokerError &error) {
  auto detail = common::JsonValue::object();
  detail.set("kind", std::string(broker::kind_name(error.kind)));
  detail.set("message", error.to_string());
  switch (error.kind) {
  case broker::BrokerError::Kind::Execution:
    if (error.exit_code.has_value()) {
      detail.set("exit_code", *error.exit_code);
    }
    detail.set("stderr", error.stderr_text);
    break;
  case broker::BrokerError::Kind::Timeout:
    detail.set("timeout_secs", static_cast<std::int64_t>(error.timeout.count()));
    detail.set("partial_output", error.partial_output);
    break;
  case broker::BrokerError::Kind::SessionNotFound:
    detail.set("thread_id", error.thread_id);
    break;
  case broker::BrokerError::Kind::InvalidSandboxMode: {
    detail.set("value", error.invalid_value);
    auto valid = common::JsonValue::array();
    for (const auto &mode : error.valid_values) {
      valid.push_back(mode);
    }
    detail.set("valid_modes", std::move(valid));
    break;
  }
  }
  auto out = common::JsonValue::object();
  out.set("success", false);
  out.set("error", std::move(detail));
  return out.dump();
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  codexbridge [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  exec [--cwd DIR] [--sandbox MODE] [--model NAME] [--timeout SECS] [--json] "
               "<prompt...|->\n";
  std::cout << "                 Start a new codex thread\n";
  std::cout << "  reply <thread-id> [--timeout SECS] [--json] <prompt...|->\n";
  std::cout << "                 Continue an existing thread\n";
  std::cout << "  sessions list | show <id> | delete <id> | sweep [--max-age-hours H]\n";
  std::cout << "                 Inspect and prune stored sessions\n";
  std::cout << "  config         Print the effective configuration\n";
  std::cout << "  version        Show version\n\n";
  std::cout << "Sandbox modes: ";
  const auto &modes = broker::valid_sandbox_modes();
  std::cout << join_tokens(modes) << "\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  int code = 1;
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    code = 0;
  } else if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    code = 0;
  } else if (subcommand == "exec") {
    code = run_exec(std::move(args));
  } else if (subcommand == "reply") {
    code = run_reply(std::move(args));
  } else if (subcommand == "sessions") {
    code = run_sessions(std::move(args));
  } else if (subcommand == "config") {
    code = run_config();
  } else {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_help();
  }

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

} // namespace codexbridge::cli
