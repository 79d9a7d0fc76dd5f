#include "codexbridge/config/config.hpp"

#include "codexbridge/broker/types.hpp"
#include "codexbridge/common/fs.hpp"
#include "codexbridge/common/toml.hpp"

#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>

namespace codexbridge::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".codexbridge";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CODEXBRIDGE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

bool is_known_log_level(const std::string &level) {
  const std::string normalized = common::to_lower(common::trim(level));
  return normalized == "debug" || normalized == "info" || normalized == "warning" ||
         normalized == "warn" || normalized == "error";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.codex.executable =
      expand_config_value(doc.get_string("codex.executable", config.codex.executable));
  config.codex.default_timeout_secs =
      doc.get_u64("codex.default_timeout_secs", config.codex.default_timeout_secs);
  config.codex.default_sandbox = doc.get_string("codex.default_sandbox", config.codex.default_sandbox);
  config.codex.default_working_directory = expand_config_value(
      doc.get_string("codex.default_working_directory", config.codex.default_working_directory));

  config.reliability.max_retries = static_cast<std::uint32_t>(
      doc.get_u64("reliability.max_retries", config.reliability.max_retries));
  config.reliability.retry_delay_ms =
      doc.get_u64("reliability.retry_delay_ms", config.reliability.retry_delay_ms);

  config.process.terminate_grace_ms =
      doc.get_u64("process.terminate_grace_ms", config.process.terminate_grace_ms);
  config.process.stderr_poll_ms =
      doc.get_u64("process.stderr_poll_ms", config.process.stderr_poll_ms);

  config.sessions.storage_dir =
      doc.get_string("sessions.storage_dir", config.sessions.storage_dir);
  config.sessions.max_age_hours =
      doc.get_u64("sessions.max_age_hours", config.sessions.max_age_hours);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);
  config.observability.log_file =
      expand_config_value(doc.get_string("observability.log_file", config.observability.log_file));

  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (const char *exe = std::getenv("CODEX_EXE_PATH"); exe != nullptr && *exe != '\0') {
    config.codex.executable = common::expand_path(exe);
  }
  if (const char *level = std::getenv("CODEXBRIDGE_LOG_LEVEL"); level != nullptr && *level != '\0') {
    config.observability.log_level = level;
  }
  if (const char *dir = std::getenv("CODEXBRIDGE_SESSIONS_DIR"); dir != nullptr && *dir != '\0') {
    config.sessions.storage_dir = dir;
  }
}

common::Result<Config> load_config() {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.error());
  }

  const auto &path = path_result.value();
  Config config;
  if (std::filesystem::exists(path)) {
    auto text = common::read_file(path);
    if (!text.ok()) {
      return common::Result<Config>::failure("Unable to open config file: " + path.string());
    }
    auto parsed = parse_config(text.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  config.sessions.storage_dir = expand_config_path(config.sessions.storage_dir);
  return common::Result<Config>::success(std::move(config));
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> errors;
  if (common::trim(config.codex.executable).empty()) {
    errors.emplace_back("codex.executable must not be empty");
  }
  if (config.codex.default_timeout_secs == 0) {
    errors.emplace_back("codex.default_timeout_secs must be greater than zero");
  } else if (config.codex.default_timeout_secs >
             static_cast<std::uint64_t>(broker::MAX_INVOCATION_TIMEOUT.count())) {
    errors.push_back("codex.default_timeout_secs must not exceed " +
                     std::to_string(broker::MAX_INVOCATION_TIMEOUT.count()));
  }
  if (auto mode = broker::parse_sandbox_mode(config.codex.default_sandbox); !mode.ok()) {
    errors.push_back("codex.default_sandbox: " + mode.error().to_string());
  }
  if (config.process.stderr_poll_ms == 0 || config.process.stderr_poll_ms >= 1000) {
    errors.emplace_back("process.stderr_poll_ms must be between 1 and 999");
  }
  if (common::trim(config.sessions.storage_dir).empty()) {
    errors.emplace_back("sessions.storage_dir must not be empty");
  }
  if (!is_known_log_level(config.observability.log_level)) {
    errors.push_back("observability.log_level: unknown level '" + config.observability.log_level +
                     "'");
  }
  return errors;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[codex]\n";
  out << "executable = " << common::quote_toml_string(config.codex.executable) << "\n";
  out << "default_timeout_secs = " << config.codex.default_timeout_secs << "\n";
  out << "default_sandbox = " << common::quote_toml_string(config.codex.default_sandbox) << "\n";
  out << "default_working_directory = "
      << common::quote_toml_string(config.codex.default_working_directory) << "\n\n";
  out << "[reliability]\n";
  out << "max_retries = " << config.reliability.max_retries << "\n";
  out << "retry_delay_ms = " << config.reliability.retry_delay_ms << "\n\n";
  out << "[process]\n";
  out << "terminate_grace_ms = " << config.process.terminate_grace_ms << "\n";
  out << "stderr_poll_ms = " << config.process.stderr_poll_ms << "\n\n";
  out << "[sessions]\n";
  out << "storage_dir = " << common::quote_toml_string(config.sessions.storage_dir) << "\n";
  out << "max_age_hours = " << config.sessions.max_age_hours << "\n\n";
  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "log_level = " << common::quote_toml_string(config.observability.log_level) << "\n";
  out << "log_file = " << common::quote_toml_string(config.observability.log_file) << "\n";
  return out.str();
}

} // namespace codexbridge::config
