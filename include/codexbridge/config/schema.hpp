#pragma once

#include <cstdint>
#include <string>

namespace codexbridge::config {

struct CodexConfig {
  std::string executable = "codex";
  std::uint64_t default_timeout_secs = 600;
  std::string default_sandbox = "read-only";
  std::string default_working_directory;
};

struct ReliabilityConfig {
  std::uint32_t max_retries = 3;
  std::uint64_t retry_delay_ms = 2000;
};

struct ProcessConfig {
  std::uint64_t terminate_grace_ms = 500;
  std::uint64_t stderr_poll_ms = 500;
};

struct SessionsConfig {
  std::string storage_dir = "~/.codexbridge/sessions";
  std::uint64_t max_age_hours = 24;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
  std::string log_file;
};

struct Config {
  CodexConfig codex;
  ReliabilityConfig reliability;
  ProcessConfig process;
  SessionsConfig sessions;
  ObservabilityConfig observability;
};

} // namespace codexbridge::config
