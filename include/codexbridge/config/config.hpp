#pragma once

#include "codexbridge/common/result.hpp"
#include "codexbridge/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codexbridge::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] std::string expand_config_path(const std::string &path);

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] std::string render_config(const Config &config);

/// Empty on success; otherwise one message per invalid setting.
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace codexbridge::config
