#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace gatewayd::common {

using Clock = std::function<std::chrono::system_clock::time_point()>;

/// Default clock backed by std::chrono::system_clock.
[[nodiscard]] Clock system_clock();

/// RFC 3339 UTC with milliseconds, e.g. 2026-01-02T03:04:05.678Z.
[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point tp);
[[nodiscard]] std::string now_rfc3339();

/// Accepts the output of format_rfc3339 and the seconds-only form.
[[nodiscard]] std::optional<std::chrono::system_clock::time_point>
parse_rfc3339(const std::string &value);

[[nodiscard]] std::int64_t to_unix_millis(std::chrono::system_clock::time_point tp);

} // namespace gatewayd::common
