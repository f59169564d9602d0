#include "gatewayd/common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace gatewayd::common {

Clock system_clock() {
  return [] { return std::chrono::system_clock::now(); };
}

std::string format_rfc3339(const std::chrono::system_clock::time_point tp) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
  const auto fraction = static_cast<int>(millis % 1000);

  std::tm tm{};
  gmtime_r(&seconds, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << fraction << 'Z';
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string &value) {
  if (value.size() < 20) {
    return std::nullopt;
  }
  std::tm tm{};
  std::istringstream in(value.substr(0, 19));
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  int millis = 0;
  std::size_t pos = 19;
  if (value[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < value.size() && value[pos] >= '0' && value[pos] <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (value[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    for (; digits < 3; ++digits) {
      millis *= 10;
    }
  }
  if (pos >= value.size() || value[pos] != 'Z') {
    return std::nullopt;
  }

  const std::time_t seconds = timegm(&tm);
  return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

std::int64_t to_unix_millis(const std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace gatewayd::common
