#pragma once

#include "codexbridge/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace codexbridge::common {

struct JsonMember;

/// Owned JSON document node. Objects keep member insertion order.
class JsonValue {
public:
  using Array = std::vector<JsonValue>;
  using Object = std::vector<JsonMember>;

  enum class Type { Null, Bool, Number, String, Array, Object };

  JsonValue();
  JsonValue(std::nullptr_t);
  JsonValue(bool value);
  JsonValue(int value);
  JsonValue(std::int64_t value);
  JsonValue(double value);
  JsonValue(std::string value);
  JsonValue(const char *value);
  JsonValue(Array value);
  JsonValue(Object value);

  [[nodiscard]] static JsonValue object();
  [[nodiscard]] static JsonValue array();

  [[nodiscard]] Type type() const;
  [[nodiscard]] bool is_null() const { return type() == Type::Null; }
  [[nodiscard]] bool is_bool() const { return type() == Type::Bool; }
  [[nodiscard]] bool is_number() const { return type() == Type::Number; }
  [[nodiscard]] bool is_string() const { return type() == Type::String; }
  [[nodiscard]] bool is_array() const { return type() == Type::Array; }
  [[nodiscard]] bool is_object() const { return type() == Type::Object; }

  [[nodiscard]] bool as_bool(bool fallback = false) const;
  [[nodiscard]] double as_number(double fallback = 0.0) const;
  [[nodiscard]] std::int64_t as_int(std::int64_t fallback = 0) const;
  /// Empty string when the node is not a string.
  [[nodiscard]] const std::string &as_string() const;
  [[nodiscard]] const Array &as_array() const;
  [[nodiscard]] const Object &as_object() const;

  /// Member lookup; nullptr when absent or when this node is not an object.
  [[nodiscard]] const JsonValue *find(std::string_view key) const;
  [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }
  /// String member, or `fallback` when absent or not a string.
  [[nodiscard]] std::string get_string(std::string_view key,
                                       const std::string &fallback = "") const;

  /// Insert or replace a member. A null node becomes an object first.
  void set(std::string key, JsonValue value);
  /// Append to an array. A null node becomes an array first.
  void push_back(JsonValue value);
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::string dump() const;
  /// Two-space indented rendering for files humans read.
  [[nodiscard]] std::string dump_pretty() const;

  friend bool operator==(const JsonValue &lhs, const JsonValue &rhs);

private:
  void dump_to(std::string &out, int indent, int depth) const;

  std::variant<std::nullptr_t, bool, double, std::string, Array, Object> value_;
};

struct JsonMember {
  std::string key;
  JsonValue value;
};

bool operator==(const JsonMember &lhs, const JsonMember &rhs);

/// Strict RFC 8259 parse of a complete document. Trailing non-whitespace is an error.
[[nodiscard]] Result<JsonValue> parse_json(std::string_view text);

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

} // namespace codexbridge::common
