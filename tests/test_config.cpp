#include "test_framework.hpp"

#include "codexbridge/config/config.hpp"

#include "helpers/test_helpers.hpp"

#include <algorithm>

namespace {

bool has_error_containing(const std::vector<std::string> &errors, const std::string &needle) {
  return std::any_of(errors.begin(), errors.end(), [&](const std::string &error) {
    return error.find(needle) != std::string::npos;
  });
}

} // namespace

void register_config_tests(std::vector<codexbridge::tests::TestCase> &tests) {
  using codexbridge::tests::require;
  namespace cfg = codexbridge::config;
  namespace t = codexbridge::testing;

  tests.push_back({"config_defaults_are_valid", [] {
                     cfg::Config config;
                     require(config.codex.executable == "codex", "default executable mismatch");
                     require(config.codex.default_timeout_secs == 600, "default timeout mismatch");
                     require(config.codex.default_sandbox == "read-only",
                             "default sandbox mismatch");
                     require(config.reliability.max_retries == 3, "default retries mismatch");
                     require(config.reliability.retry_delay_ms == 2000, "default delay mismatch");
                     require(config.sessions.max_age_hours == 24, "default max age mismatch");
                     const auto errors = cfg::validate_config(config);
                     require(errors.empty(), "defaults should validate");
                   }});

  tests.push_back({"config_parse_reads_all_sections", [] {
                     const std::string text = "[codex]\n"
                                              "executable = \"/usr/local/bin/codex\"\n"
                                              "default_timeout_secs = 90\n"
                                              "default_sandbox = \"workspace-write\"\n"
                                              "[reliability]\n"
                                              "max_retries = 5\n"
                                              "retry_delay_ms = 10\n"
                                              "[process]\n"
                                              "terminate_grace_ms = 250\n"
                                              "stderr_poll_ms = 100\n"
                                              "[sessions]\n"
                                              "storage_dir = \"/tmp/cb-sessions\"\n"
                                              "max_age_hours = 48\n"
                                              "[observability]\n"
                                              "backend = \"none\"\n"
                                              "log_level = \"debug\"\n";
                     auto parsed = cfg::parse_config(text);
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.codex.executable == "/usr/local/bin/codex", "executable");
                     require(config.codex.default_timeout_secs == 90, "timeout");
                     require(config.codex.default_sandbox == "workspace-write", "sandbox");
                     require(config.reliability.max_retries == 5, "retries");
                     require(config.reliability.retry_delay_ms == 10, "delay");
                     require(config.process.terminate_grace_ms == 250, "grace");
                     require(config.process.stderr_poll_ms == 100, "poll");
                     require(config.sessions.storage_dir == "/tmp/cb-sessions", "storage dir");
                     require(config.sessions.max_age_hours == 48, "max age");
                     require(config.observability.backend == "none", "backend");
                     require(config.observability.log_level == "debug", "log level");
                   }});

  tests.push_back({"config_parse_rejects_malformed_toml", [] {
                     auto parsed = cfg::parse_config("[codex\nexecutable = \"x\"\n");
                     require(!parsed.ok(), "broken section header should fail");
                   }});

  tests.push_back({"config_validate_reports_each_problem", [] {
                     cfg::Config config;
                     config.codex.default_sandbox = "root";
                     config.codex.default_timeout_secs = 0;
                     config.process.stderr_poll_ms = 1000;
                     config.observability.log_level = "chatty";
                     const auto errors = cfg::validate_config(config);
                     require(errors.size() == 4, "expected four errors, got " +
                                                     std::to_string(errors.size()));
                     require(has_error_containing(errors, "Invalid sandbox mode: root"),
                             "sandbox error should list the bad value");
                     require(has_error_containing(errors, "default_timeout_secs"),
                             "timeout error expected");
                     require(has_error_containing(errors, "stderr_poll_ms"), "poll error expected");
                     require(has_error_containing(errors, "chatty"), "log level error expected");
                   }});

  tests.push_back({"config_validate_caps_default_timeout", [] {
                     cfg::Config config;
                     config.codex.default_timeout_secs = 7 * 24 * 60 * 60;
                     require(cfg::validate_config(config).empty(), "seven days is allowed");
                     config.codex.default_timeout_secs = 7 * 24 * 60 * 60 + 1;
                     const auto errors = cfg::validate_config(config);
                     require(errors.size() == 1 &&
                                 has_error_containing(errors, "must not exceed 604800"),
                             "oversized timeout should be rejected");
                   }});

  tests.push_back({"config_render_parse_round_trip", [] {
                     cfg::Config config;
                     config.codex.executable = "/opt/codex \"beta\"";
                     config.codex.default_working_directory = "/work";
                     config.reliability.max_retries = 1;
                     config.observability.log_file = "/var/log/codexbridge.log";
                     auto parsed = cfg::parse_config(cfg::render_config(config));
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().codex.executable == config.codex.executable,
                             "executable should survive");
                     require(parsed.value().codex.default_working_directory == "/work",
                             "working directory should survive");
                     require(parsed.value().reliability.max_retries == 1, "retries should survive");
                     require(parsed.value().observability.log_file == config.observability.log_file,
                             "log file should survive");
                   }});

  tests.push_back({"config_env_overrides_win", [] {
                     t::EnvGuard exe("CODEX_EXE_PATH", "/custom/codex");
                     t::EnvGuard dir("CODEXBRIDGE_SESSIONS_DIR", "/custom/sessions");
                     t::EnvGuard level("CODEXBRIDGE_LOG_LEVEL", "error");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.codex.executable == "/custom/codex", "exe override");
                     require(config.sessions.storage_dir == "/custom/sessions", "dir override");
                     require(config.observability.log_level == "error", "level override");
                   }});

  tests.push_back({"config_env_empty_values_are_ignored", [] {
                     t::EnvGuard exe("CODEX_EXE_PATH", std::string());
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.codex.executable == "codex", "empty override should be ignored");
                   }});

  tests.push_back({"config_load_from_override_path", [] {
                     t::TempWorkspace ws;
                     t::EnvGuard exe("CODEX_EXE_PATH", std::nullopt);
                     t::EnvGuard dir("CODEXBRIDGE_SESSIONS_DIR", std::nullopt);
                     t::EnvGuard level("CODEXBRIDGE_LOG_LEVEL", std::nullopt);
                     ws.create_file("config.toml", "[codex]\n"
                                                   "default_timeout_secs = 42\n"
                                                   "[sessions]\n"
                                                   "storage_dir = \"" +
                                                       (ws.path() / "store").string() + "\"\n");
                     cfg::set_config_path_override(ws.path() / "config.toml");
                     auto loaded = cfg::load_config();
                     auto path = cfg::config_path();
                     cfg::clear_config_path_override();

                     require(loaded.ok(), loaded.error());
                     require(loaded.value().codex.default_timeout_secs == 42,
                             "file value should be loaded");
                     require(loaded.value().sessions.storage_dir == (ws.path() / "store").string(),
                             "storage dir should be loaded");
                     require(path.ok() && path.value() == ws.path() / "config.toml",
                             "override path should be reported");
                   }});

  tests.push_back({"config_load_missing_file_uses_defaults", [] {
                     t::TempWorkspace ws;
                     t::EnvGuard exe("CODEX_EXE_PATH", std::nullopt);
                     cfg::set_config_path_override(ws.path() / "absent.toml");
                     auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().codex.executable == "codex",
                             "defaults expected without a file");
                   }});

  tests.push_back({"config_expands_env_in_paths", [] {
                     t::EnvGuard root("CODEXBRIDGE_TEST_ROOT", "/srv/cb");
                     require(cfg::expand_config_path("${CODEXBRIDGE_TEST_ROOT}/sessions") ==
                                 "/srv/cb/sessions",
                             "braced variable should expand");
                     require(cfg::expand_config_path("$CODEXBRIDGE_TEST_ROOT/x") == "/srv/cb/x",
                             "bare variable should expand");
                   }});
}
