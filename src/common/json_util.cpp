#include "gatewayd/common/json_util.hpp"

#include <cctype>
#include <cstdio>

namespace gatewayd::common {

namespace {

void append_utf8(std::string &out, unsigned int cp) {
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

bool parse_hex4(const std::string &raw, std::size_t pos, unsigned int &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<unsigned int>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<unsigned int>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<unsigned int>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

std::size_t json_find_key(const std::string &json, const std::string &key) {
  const std::string quoted = "\"" + key + "\"";
  return json.find(quoted);
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

// Recursive-descent validator. Returns the position after the value, or npos.
constexpr std::size_t kMaxDepth = 64;

std::size_t validate_value(const std::string &s, std::size_t pos, std::size_t depth);

std::size_t validate_string(const std::string &s, std::size_t pos) {
  if (pos >= s.size() || s[pos] != '"') {
    return std::string::npos;
  }
  ++pos;
  while (pos < s.size()) {
    const auto ch = static_cast<unsigned char>(s[pos]);
    if (ch == '"') {
      return pos + 1;
    }
    if (ch < 0x20) {
      return std::string::npos;
    }
    if (ch == '\\') {
      if (pos + 1 >= s.size()) {
        return std::string::npos;
      }
      const char esc = s[pos + 1];
      if (esc == 'u') {
        unsigned int ignored = 0;
        if (!parse_hex4(s, pos + 2, ignored)) {
          return std::string::npos;
        }
        pos += 6;
        continue;
      }
      if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' && esc != 'n' &&
          esc != 'r' && esc != 't') {
        return std::string::npos;
      }
      pos += 2;
      continue;
    }
    ++pos;
  }
  return std::string::npos;
}

std::size_t validate_number(const std::string &s, std::size_t pos) {
  const std::size_t start = pos;
  if (pos < s.size() && s[pos] == '-') {
    ++pos;
  }
  const auto digits = [&]() {
    const std::size_t begin = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])) != 0) {
      ++pos;
    }
    return pos > begin;
  };
  if (!digits()) {
    return std::string::npos;
  }
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    if (!digits()) {
      return std::string::npos;
    }
  }
  if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
    ++pos;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
      ++pos;
    }
    if (!digits()) {
      return std::string::npos;
    }
  }
  return pos > start ? pos : std::string::npos;
}

std::size_t validate_literal(const std::string &s, std::size_t pos, const char *literal) {
  const std::string lit(literal);
  if (s.compare(pos, lit.size(), lit) != 0) {
    return std::string::npos;
  }
  return pos + lit.size();
}

std::size_t validate_container(const std::string &s, std::size_t pos, std::size_t depth,
                               const bool object) {
  const char close = object ? '}' : ']';
  ++pos;
  pos = json_skip_ws(s, pos);
  if (pos < s.size() && s[pos] == close) {
    return pos + 1;
  }
  while (pos < s.size()) {
    if (object) {
      pos = validate_string(s, pos);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(s, pos);
      if (pos >= s.size() || s[pos] != ':') {
        return std::string::npos;
      }
      pos = json_skip_ws(s, pos + 1);
    }
    pos = validate_value(s, pos, depth + 1);
    if (pos == std::string::npos) {
      return pos;
    }
    pos = json_skip_ws(s, pos);
    if (pos >= s.size()) {
      return std::string::npos;
    }
    if (s[pos] == close) {
      return pos + 1;
    }
    if (s[pos] != ',') {
      return std::string::npos;
    }
    pos = json_skip_ws(s, pos + 1);
  }
  return std::string::npos;
}

std::size_t validate_value(const std::string &s, std::size_t pos, std::size_t depth) {
  if (depth > kMaxDepth) {
    return std::string::npos;
  }
  pos = json_skip_ws(s, pos);
  if (pos >= s.size()) {
    return std::string::npos;
  }
  switch (s[pos]) {
  case '{':
    return validate_container(s, pos, depth, true);
  case '[':
    return validate_container(s, pos, depth, false);
  case '"':
    return validate_string(s, pos);
  case 't':
    return validate_literal(s, pos, "true");
  case 'f':
    return validate_literal(s, pos, "false");
  case 'n':
    return validate_literal(s, pos, "null");
  default:
    return validate_number(s, pos);
  }
}

} // namespace

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
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned int cp = 0;
      if (!parse_hex4(raw, i + 1, cp)) {
        out.push_back(esc);
        break;
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        unsigned int low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}


std::string json_get_string(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos || end <= pos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] == '"') {
    return "";
  }
  const std::size_t start = pos;
  while (pos < json.size()) {
    const char ch = json[pos];
    if (ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      break;
    }
    ++pos;
  }
  if (pos <= start) {
    return "";
  }
  return json.substr(start, pos - start);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '{') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '{', '}');
  if (end == std::string::npos || end < pos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '[') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '[', ']');
  if (end == std::string::npos || end < pos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

bool json_is_valid(const std::string &text) {
  const auto end = validate_value(text, 0, 0);
  return end != std::string::npos && json_skip_ws(text, end) == text.size();
}

bool json_is_object(const std::string &text) {
  const auto start = json_skip_ws(text, 0);
  return start < text.size() && text[start] == '{' && json_is_valid(text);
}

std::vector<std::pair<std::string, std::string>> json_object_members(const std::string &json) {
  std::vector<std::pair<std::string, std::string>> members;
  std::size_t pos = json_skip_ws(json, 0);
  if (json.size() < pos + 2 || json[pos] != '{') {
    return members;
  }

  ++pos; // skip opening {
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }

    // expect key
    if (json[pos] != '"') {
      ++pos;
      continue;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = key_end + 1;

    // expect colon
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    ++pos;
    pos = json_skip_ws(json, pos);
    if (pos >= json.size()) {
      break;
    }

    // read value
    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      members.emplace_back(std::move(key), json.substr(pos, val_end - pos + 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        break;
      }
      members.emplace_back(std::move(key), json.substr(pos, end - pos + 1));
      pos = end + 1;
    } else {
      // number, true/false/null
      const std::size_t start = pos;
      while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
             std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
        ++pos;
      }
      members.emplace_back(std::move(key), json.substr(start, pos - start));
    }
  }

  return members;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  for (auto &[key, raw] : json_object_members(json)) {
    if (raw == "null") {
      continue;
    }
    if (!raw.empty() && raw.front() == '"') {
      result[key] = json_unescape(raw.substr(1, raw.size() - 2));
    } else {
      result[key] = std::move(raw);
    }
  }
  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

} // namespace gatewayd::common
