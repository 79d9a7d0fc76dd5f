#pragma once

#include "codexbridge/common/result.hpp"

#include <filesystem>
#include <string>

namespace codexbridge::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] bool contains_ci(const std::string &haystack, const std::string &needle);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

/// Write `content` to `<path>.tmp`, then rename it over `path`.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace codexbridge::common
