#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace teledrop::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string, decoding \uXXXX escapes to UTF-8.
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Field extraction. Each returns an empty string when the field is absent or has another type.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::optional<bool> json_get_bool(const std::string &json, const std::string &field);

/// Top-level members of a JSON object. String values are unescaped; numbers, booleans,
/// nested objects and arrays are kept as raw text. Members whose value is null are omitted.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] std::optional<JsonFlatMap> json_parse_flat(const std::string &json);

} // namespace teledrop::common
