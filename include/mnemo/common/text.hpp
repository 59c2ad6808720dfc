#pragma once

#include "mnemo/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace mnemo::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);

/// Collapse every run of whitespace (newlines included) into a single space and trim.
[[nodiscard]] std::string collapse_whitespace(const std::string &input);

/// Shorten text for status lines, appending "..." when cut.
[[nodiscard]] std::string truncate_preview(const std::string &text, std::size_t max_chars);

/// Lowercase hex SHA-256 of the input.
[[nodiscard]] std::string sha256_hex(std::string_view text);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] std::string now_rfc3339();
/// strftime-style formatting of a UTC time point.
[[nodiscard]] std::string format_utc(std::chrono::system_clock::time_point when,
                                     const char *pattern);

} // namespace mnemo::common
