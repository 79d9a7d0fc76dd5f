#include "codexbridge/common/json_util.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace codexbridge::common {

namespace {

constexpr std::size_t kMaxDepth = 256;

const std::string &empty_string() {
  static const std::string value;
  return value;
}

const JsonValue::Array &empty_array() {
  static const JsonValue::Array value;
  return value;
}

const JsonValue::Object &empty_object() {
  static const JsonValue::Object value;
  return value;
}

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::string format_number(const double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  if (std::floor(value) == value && std::fabs(value) < 9.007199254740992e15) {
    return std::to_string(static_cast<long long>(value));
  }
  std::ostringstream out;
  out.precision(17);
  out << value;
  return out.str();
}

class Parser {
public:
  explicit Parser(std::string_view text) : text_(text) {}

  Result<JsonValue> parse_document() {
    skip_ws();
    JsonValue value;
    if (!parse_value(value, 0)) {
      return Result<JsonValue>::failure(error_ + " at offset " + std::to_string(pos_));
    }
    skip_ws();
    if (pos_ != text_.size()) {
      return Result<JsonValue>::failure("trailing characters at offset " + std::to_string(pos_));
    }
    return Result<JsonValue>::success(std::move(value));
  }

private:
  bool fail(std::string message) {
    error_ = std::move(message);
    return false;
  }

  void skip_ws() {
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') {
        break;
      }
      ++pos_;
    }
  }

  bool consume_literal(std::string_view literal) {
    if (text_.substr(pos_, literal.size()) != literal) {
      return fail("invalid literal");
    }
    pos_ += literal.size();
    return true;
  }

  bool parse_value(JsonValue &out, std::size_t depth) {
    if (depth > kMaxDepth) {
      return fail("nesting too deep");
    }
    if (pos_ >= text_.size()) {
      return fail("unexpected end of input");
    }
    switch (text_[pos_]) {
    case '{':
      return parse_object(out, depth);
    case '[':
      return parse_array(out, depth);
    case '"': {
      std::string s;
      if (!parse_string(s)) {
        return false;
      }
      out = JsonValue(std::move(s));
      return true;
    }
    case 't':
      out = JsonValue(true);
      return consume_literal("true");
    case 'f':
      out = JsonValue(false);
      return consume_literal("false");
    case 'n':
      out = JsonValue(nullptr);
      return consume_literal("null");
    default:
      return parse_number(out);
    }
  }

  bool parse_object(JsonValue &out, std::size_t depth) {
    ++pos_; // {
    JsonValue::Object members;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      out = JsonValue(std::move(members));
      return true;
    }
    while (true) {
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        return fail("expected object key");
      }
      std::string key;
      if (!parse_string(key)) {
        return false;
      }
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return fail("expected ':'");
      }
      ++pos_;
      skip_ws();
      JsonValue value;
      if (!parse_value(value, depth + 1)) {
        return false;
      }
      members.push_back(JsonMember{std::move(key), std::move(value)});
      skip_ws();
      if (pos_ >= text_.size()) {
        return fail("unterminated object");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        break;
      }
      return fail("expected ',' or '}'");
    }
    out = JsonValue(std::move(members));
    return true;
  }

  bool parse_array(JsonValue &out, std::size_t depth) {
    ++pos_; // [
    JsonValue::Array items;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      out = JsonValue(std::move(items));
      return true;
    }
    while (true) {
      skip_ws();
      JsonValue value;
      if (!parse_value(value, depth + 1)) {
        return false;
      }
      items.push_back(std::move(value));
      skip_ws();
      if (pos_ >= text_.size()) {
        return fail("unterminated array");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        break;
      }
      return fail("expected ',' or ']'");
    }
    out = JsonValue(std::move(items));
    return true;
  }

  bool parse_hex4(std::uint32_t &out) {
    if (pos_ + 4 > text_.size()) {
      return fail("truncated unicode escape");
    }
    out = 0;
    for (int i = 0; i < 4; ++i) {
      const char ch = text_[pos_++];
      out <<= 4;
      if (ch >= '0' && ch <= '9') {
        out |= static_cast<std::uint32_t>(ch - '0');
      } else if (ch >= 'a' && ch <= 'f') {
        out |= static_cast<std::uint32_t>(ch - 'a' + 10);
      } else if (ch >= 'A' && ch <= 'F') {
        out |= static_cast<std::uint32_t>(ch - 'A' + 10);
      } else {
        return fail("invalid unicode escape");
      }
    }
    return true;
  }

  bool parse_string(std::string &out) {
    ++pos_; // opening quote
    while (pos_ < text_.size()) {
      const char ch = text_[pos_++];
      if (ch == '"') {
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) {
        return fail("control character in string");
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (pos_ >= text_.size()) {
        break;
      }
      const char esc = text_[pos_++];
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parse_hex4(cp)) {
          return false;
        }
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          std::uint32_t low = 0;
          if (text_.substr(pos_, 2) != "\\u") {
            return fail("unpaired surrogate");
          }
          pos_ += 2;
          if (!parse_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
            return fail("invalid low surrogate");
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          return fail("unpaired surrogate");
        }
        append_utf8(out, cp);
        break;
      }
      default:
        return fail("invalid escape");
      }
    }
    return fail("unterminated string");
  }

  bool parse_number(JsonValue &out) {
    const std::size_t start = pos_;
    auto digits = [this]() {
      const std::size_t begin = pos_;
      while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
        ++pos_;
      }
      return pos_ - begin;
    };

    if (pos_ < text_.size() && text_[pos_] == '-') {
      ++pos_;
    }
    if (pos_ < text_.size() && text_[pos_] == '0') {
      ++pos_;
    } else if (digits() == 0) {
      return fail("invalid value");
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      if (digits() == 0) {
        return fail("invalid fraction");
      }
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
        ++pos_;
      }
      if (digits() == 0) {
        return fail("invalid exponent");
      }
    }

    const std::string literal(text_.substr(start, pos_ - start));
    try {
      out = JsonValue(std::stod(literal));
    } catch (const std::out_of_range &) {
      out = JsonValue(literal.front() == '-' ? -HUGE_VAL : HUGE_VAL);
    } catch (const std::invalid_argument &) {
      return fail("invalid number");
    }
    return true;
  }

  std::string_view text_;
  std::size_t pos_ = 0;
  std::string error_;
};

} // namespace

JsonValue::JsonValue() : value_(std::in_place_index<0>, nullptr) {}
JsonValue::JsonValue(std::nullptr_t) : value_(std::in_place_index<0>, nullptr) {}
JsonValue::JsonValue(const bool value) : value_(std::in_place_index<1>, value) {}
JsonValue::JsonValue(const int value) : value_(std::in_place_index<2>, static_cast<double>(value)) {}
JsonValue::JsonValue(const std::int64_t value)
    : value_(std::in_place_index<2>, static_cast<double>(value)) {}
JsonValue::JsonValue(const double value) : value_(std::in_place_index<2>, value) {}
JsonValue::JsonValue(std::string value) : value_(std::in_place_index<3>, std::move(value)) {}
JsonValue::JsonValue(const char *value) : value_(std::in_place_index<3>, value) {}
JsonValue::JsonValue(Array value) : value_(std::in_place_index<4>, std::move(value)) {}
JsonValue::JsonValue(Object value) : value_(std::in_place_index<5>, std::move(value)) {}

JsonValue JsonValue::object() { return JsonValue(Object{}); }
JsonValue JsonValue::array() { return JsonValue(Array{}); }

JsonValue::Type JsonValue::type() const {
  switch (value_.index()) {
  case 1:
    return Type::Bool;
  case 2:
    return Type::Number;
  case 3:
    return Type::String;
  case 4:
    return Type::Array;
  case 5:
    return Type::Object;
  default:
    return Type::Null;
  }
}

bool JsonValue::as_bool(const bool fallback) const {
  if (const auto *v = std::get_if<bool>(&value_)) {
    return *v;
  }
  return fallback;
}

double JsonValue::as_number(const double fallback) const {
  if (const auto *v = std::get_if<double>(&value_)) {
    return *v;
  }
  return fallback;
}

std::int64_t JsonValue::as_int(const std::int64_t fallback) const {
  if (const auto *v = std::get_if<double>(&value_); v != nullptr && std::isfinite(*v)) {
    return static_cast<std::int64_t>(*v);
  }
  return fallback;
}

const std::string &JsonValue::as_string() const {
  if (const auto *v = std::get_if<std::string>(&value_)) {
    return *v;
  }
  return empty_string();
}

const JsonValue::Array &JsonValue::as_array() const {
  if (const auto *v = std::get_if<Array>(&value_)) {
    return *v;
  }
  return empty_array();
}

const JsonValue::Object &JsonValue::as_object() const {
  if (const auto *v = std::get_if<Object>(&value_)) {
    return *v;
  }
  return empty_object();
}

const JsonValue *JsonValue::find(const std::string_view key) const {
  const auto *members = std::get_if<Object>(&value_);
  if (members == nullptr) {
    return nullptr;
  }
  for (const auto &member : *members) {
    if (member.key == key) {
      return &member.value;
    }
  }
  return nullptr;
}

std::string JsonValue::get_string(const std::string_view key, const std::string &fallback) const {
  const JsonValue *member = find(key);
  if (member == nullptr || !member->is_string()) {
    return fallback;
  }
  return member->as_string();
}

void JsonValue::set(std::string key, JsonValue value) {
  if (is_null()) {
    value_.emplace<5>();
  }
  auto *members = std::get_if<Object>(&value_);
  if (members == nullptr) {
    throw std::logic_error("JsonValue::set on non-object");
  }
  for (auto &member : *members) {
    if (member.key == key) {
      member.value = std::move(value);
      return;
    }
  }
  members->push_back(JsonMember{std::move(key), std::move(value)});
}

void JsonValue::push_back(JsonValue value) {
  if (is_null()) {
    value_.emplace<4>();
  }
  auto *items = std::get_if<Array>(&value_);
  if (items == nullptr) {
    throw std::logic_error("JsonValue::push_back on non-array");
  }
  items->push_back(std::move(value));
}

std::size_t JsonValue::size() const {
  if (const auto *items = std::get_if<Array>(&value_)) {
    return items->size();
  }
  if (const auto *members = std::get_if<Object>(&value_)) {
    return members->size();
  }
  return 0;
}

void JsonValue::dump_to(std::string &out, const int indent, const int depth) const {
  const auto newline = [&](int level) {
    if (indent <= 0) {
      return;
    }
    out.push_back('\n');
    out.append(static_cast<std::size_t>(indent * level), ' ');
  };

  switch (type()) {
  case Type::Null:
    out += "null";
    break;
  case Type::Bool:
    out += as_bool() ? "true" : "false";
    break;
  case Type::Number:
    out += format_number(as_number());
    break;
  case Type::String:
    out.push_back('"');
    out += json_escape(as_string());
    out.push_back('"');
    break;
  case Type::Array: {
    const auto &items = as_array();
    out.push_back('[');
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (i > 0) {
        out.push_back(',');
      }
      newline(depth + 1);
      items[i].dump_to(out, indent, depth + 1);
    }
    if (!items.empty()) {
      newline(depth);
    }
    out.push_back(']');
    break;
  }
  case Type::Object: {
    const auto &members = as_object();
    out.push_back('{');
    for (std::size_t i = 0; i < members.size(); ++i) {
      if (i > 0) {
        out.push_back(',');
      }
      newline(depth + 1);
      out.push_back('"');
      out += json_escape(members[i].key);
      out += indent > 0 ? "\": " : "\":";
      members[i].value.dump_to(out, indent, depth + 1);
    }
    if (!members.empty()) {
      newline(depth);
    }
    out.push_back('}');
    break;
  }
  }
}

std::string JsonValue::dump() const {
  std::string out;
  dump_to(out, 0, 0);
  return out;
}

std::string JsonValue::dump_pretty() const {
  std::string out;
  dump_to(out, 2, 0);
  return out;
}

bool operator==(const JsonValue &lhs, const JsonValue &rhs) { return lhs.value_ == rhs.value_; }

bool operator==(const JsonMember &lhs, const JsonMember &rhs) {
  return lhs.key == rhs.key && lhs.value == rhs.value;
}

Result<JsonValue> parse_json(const std::string_view text) { return Parser(text).parse_document(); }

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

} // namespace codexbridge::common
