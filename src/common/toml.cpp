#include "gatewayd/common/toml.hpp"

#include "gatewayd/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace gatewayd::common {

namespace {

std::string at_line(const std::string &message, const std::size_t line) {
  return message + " at line " + std::to_string(line);
}

/// Position of the `#` starting a comment, ignoring ones inside strings.
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

/// Basic strings get their escapes decoded; literal strings are verbatim;
/// bare values come back trimmed.
std::optional<std::string> decode_value(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.empty() || (value.front() != '"' && value.front() != '\'')) {
    return value;
  }
  const char quote = value.front();
  if (value.size() < 2 || value.back() != quote) {
    return std::nullopt;
  }
  if (quote == '\'') {
    return value.substr(1, value.size() - 2);
  }

  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    if (value[i] != '\\') {
      out.push_back(value[i]);
      continue;
    }
    if (i + 2 >= value.size()) {
      return std::nullopt;
    }
    switch (value[++i]) {
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
      out.push_back(value[i]);
      break;
    }
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return entries_.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return fallback;
  }
  return decode_value(it->second.raw).value_or(fallback);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return fallback;
  }
  const std::string value = to_lower(trim(it->second.raw));
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  return fallback;
}

Result<std::optional<std::int64_t>> TomlDocument::get_integer(const std::string &key) const {
  using IntResult = Result<std::optional<std::int64_t>>;
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return IntResult::success(std::nullopt);
  }

  std::string digits = trim(it->second.raw);
  std::erase(digits, '_');
  if (!digits.empty() && digits.front() == '+') {
    digits.erase(0, 1);
  }
  std::int64_t value = 0;
  const auto *first = digits.data();
  const auto *last = first + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (digits.empty() || ec != std::errc() || ptr != last) {
    return IntResult::failure(ErrorCode::Validation,
                              at_line(key + " must be an integer", it->second.line));
  }
  return IntResult::success(value);
}

std::size_t TomlDocument::line_of(const std::string &key) const {
  const auto it = entries_.find(key);
  return it == entries_.end() ? 0 : it->second.line;
}

std::vector<std::string> TomlDocument::keys_in(const std::string &section) const {
  const std::string prefix = section + ".";
  std::vector<std::string> keys;
  for (const auto &[key, entry] : entries_) {
    (void)entry;
    if (starts_with(key, prefix)) {
      keys.push_back(key);
    }
  }
  return keys;
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
      line.resize(hash);
    }
    line = trim(line);
    if (line.empty()) {
      continue;
    }

    if (line.front() == '[') {
      if (line.back() != ']' || line.size() < 3) {
        return Result<TomlDocument>::failure(ErrorCode::Validation,
                                             at_line("Invalid section header", line_number));
      }
      section = trim(line.substr(1, line.size() - 2));
      continue;
    }

    const auto equals = line.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorCode::Validation,
                                           at_line("Expected key = value", line_number));
    }
    const std::string key = trim(line.substr(0, equals));
    const std::string raw = trim(line.substr(equals + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorCode::Validation,
                                           at_line("Missing key", line_number));
    }
    if (!decode_value(raw).has_value()) {
      return Result<TomlDocument>::failure(ErrorCode::Validation,
                                           at_line("Unterminated string", line_number));
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (document.entries_.contains(full_key)) {
      return Result<TomlDocument>::failure(
          ErrorCode::Validation, at_line("Duplicate key " + full_key, line_number));
    }
    document.entries_.emplace(full_key, TomlDocument::Entry{.raw = raw, .line = line_number});
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace gatewayd::common
