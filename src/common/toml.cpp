#include "codexbridge/common/toml.hpp"

#include "codexbridge/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace codexbridge::common {

namespace {

// Position of the first '#' that is not inside a quoted string, or npos.
std::size_t comment_start(const std::string &line) {
  char quote = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote == '"' && ch == '\\') {
      ++i;
      continue;
    }
    if (quote != 0) {
      if (ch == quote) {
        quote = 0;
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '#') {
      return i;
    }
  }
  return std::string::npos;
}

std::string decode_basic_string(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (ch != '\\' || i + 1 >= body.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = body[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return decode_basic_string(value.substr(1, value.size() - 2));
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

// TOML allows '_' between digits.
std::string strip_digit_separators(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    if (ch != '_') {
      out.push_back(ch);
    }
  }
  return out;
}

template <typename Int> bool parse_integer(const std::string &raw, Int &out) {
  const std::string normalized = strip_digit_separators(trim(raw));
  const char *first = normalized.data();
  const char *last = first + normalized.size();
  if (first != last && *first == '+') {
    ++first;
  }
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && first != last;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = trim(it->second);
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  std::uint64_t parsed = 0;
  if (it == values.end() || !parse_integer(it->second, parsed)) {
    return fallback;
  }
  return parsed;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    if (const auto hash = comment_start(line); hash != std::string::npos) {
      line.erase(hash);
    }
    const std::string clean = trim(line);
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (clean.back() != ']' || clean.size() < 3) {
        return Result<TomlDocument>::failure("malformed section header at line " +
                                             std::to_string(line_number));
      }
      section = trim(clean.substr(1, clean.size() - 2));
      continue;
    }

    const auto eq = clean.find('=');
    if (eq == std::string::npos) {
      return Result<TomlDocument>::failure("expected key = value at line " +
                                           std::to_string(line_number));
    }
    const std::string key = unquote(clean.substr(0, eq));
    if (key.empty()) {
      return Result<TomlDocument>::failure("missing key at line " + std::to_string(line_number));
    }
    const std::string value = trim(clean.substr(eq + 1));
    if (value.empty()) {
      return Result<TomlDocument>::failure("missing value for '" + key + "' at line " +
                                           std::to_string(line_number));
    }
    document.values[section.empty() ? key : section + "." + key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string quoted = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
    case '\\':
      quoted.push_back('\\');
      quoted.push_back(ch);
      break;
    case '\n':
      quoted += "\\n";
      break;
    case '\t':
      quoted += "\\t";
      break;
    default:
      quoted.push_back(ch);
      break;
    }
  }
  quoted.push_back('"');
  return quoted;
}

} // namespace codexbridge::common
