#pragma once

#include "codexbridge/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace codexbridge::common {

/// Flat view of a TOML file: `[section]` headers are folded into dotted keys and values
/// are kept as their raw literal text until a typed getter reads them.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace codexbridge::common
