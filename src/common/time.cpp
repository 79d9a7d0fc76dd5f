#include "codexbridge/common/time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace codexbridge::common {

std::string format_rfc3339(const Timestamp when) {
  const auto t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          when.time_since_epoch()) %
                      1000;

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (millis.count() < 0 ? millis.count() + 1000 : millis.count()) << 'Z';
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

Result<Timestamp> parse_rfc3339(const std::string &value) {
  std::tm tm{};
  std::istringstream in(value);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return Result<Timestamp>::failure("invalid timestamp: " + value);
  }

  int millis = 0;
  if (in.peek() == '.') {
    in.get();
    std::string digits;
    while (std::isdigit(in.peek()) != 0) {
      digits.push_back(static_cast<char>(in.get()));
    }
    if (digits.empty()) {
      return Result<Timestamp>::failure("invalid timestamp fraction: " + value);
    }
    digits.resize(3, '0');
    millis = std::stoi(digits.substr(0, 3));
  }
  if (in.peek() == 'Z') {
    in.get();
  }

#ifdef _WIN32
  const std::time_t seconds = _mkgmtime(&tm);
#else
  const std::time_t seconds = timegm(&tm);
#endif
  if (seconds == static_cast<std::time_t>(-1)) {
    return Result<Timestamp>::failure("timestamp out of range: " + value);
  }
  return Result<Timestamp>::success(std::chrono::system_clock::from_time_t(seconds) +
                                    std::chrono::milliseconds(millis));
}

} // namespace codexbridge::common
