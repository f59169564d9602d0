#pragma once

#include "gatewayd/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gatewayd::common {

/// Flat view of a TOML file: `[section]` headers fold into dotted keys, so
/// `port` under `[gateway]` is stored as `gateway.port`. Arrays and inline
/// tables are not supported.
class TomlDocument {
public:
  struct Entry {
    std::string raw;
    std::size_t line = 0;
  };

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  /// nullopt when the key is absent; Validation when the value is not an
  /// integer.
  [[nodiscard]] Result<std::optional<std::int64_t>> get_integer(const std::string &key) const;
  /// Line the key was defined on, 0 when absent.
  [[nodiscard]] std::size_t line_of(const std::string &key) const;
  /// Keys defined under `section.`, in no particular order.
  [[nodiscard]] std::vector<std::string> keys_in(const std::string &section) const;

private:
  friend Result<TomlDocument> parse_toml(const std::string &content);

  std::unordered_map<std::string, Entry> entries_;
};

/// Validation error naming the line for malformed headers, lines without
/// `=`, unterminated strings and duplicate keys.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace gatewayd::common
