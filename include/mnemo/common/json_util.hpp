#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mnemo::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode the body of a JSON string literal, including \uXXXX escapes (emitted as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Raw text of the value stored under `field` in a JSON object (first match, any depth).
[[nodiscard]] std::optional<std::string> json_get_raw(const std::string &json,
                                                      const std::string &field);

[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Top-level members of one JSON object. String values are unescaped, everything else is raw.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array into the raw text of its elements.
[[nodiscard]] std::vector<std::string> json_split_array(const std::string &array_json);

/// Parse `[1, 2.5, -3e-2]`. Returns nullopt on any non-numeric element.
[[nodiscard]] std::optional<std::vector<float>> json_parse_float_array(const std::string &array_json);

/// First balanced `{...}` in free text, for model replies wrapped in prose or code fences.
[[nodiscard]] std::optional<std::string> json_extract_object(const std::string &text);

} // namespace mnemo::common
