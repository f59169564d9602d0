#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gatewayd::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape, producing a complete JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body (handles \n, \t, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a numeric field value (as string) from a JSON document.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Extract a nested JSON object field (including braces) from a JSON document.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Extract a nested JSON array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// True when `text` is one syntactically valid JSON value.
[[nodiscard]] bool json_is_valid(const std::string &text);

/// True when `text` is a valid JSON value whose top level is an object.
[[nodiscard]] bool json_is_object(const std::string &text);

/// Top-level members of a JSON object in document order, values verbatim
/// (strings keep their quotes).
[[nodiscard]] std::vector<std::pair<std::string, std::string>>
json_object_members(const std::string &json);

/// Parse a flat JSON object into a key→value map (top-level only). String
/// values are unescaped; objects, arrays and literals are kept verbatim.
/// Members whose value is the literal `null` are omitted, so a present key
/// always carries a value (the string "null" included).
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace gatewayd::common
