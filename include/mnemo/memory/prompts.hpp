#pragma once

#include "mnemo/memory/types.hpp"
#include "mnemo/providers/traits.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace mnemo::memory {

[[nodiscard]] const std::string &consolidation_system_prompt();
[[nodiscard]] std::string rerank_system_prompt(std::size_t max_returned);

/// `{"ops":[{"operation","id","content"}]}`
[[nodiscard]] const providers::OutputSchema &consolidation_schema();
/// `{"ids":[...]}`
[[nodiscard]] const providers::OutputSchema &rerank_schema();

/// "Monday January 06 2025 at 14:03:09 UTC"
[[nodiscard]] std::string format_prompt_datetime(std::chrono::system_clock::time_point when);

/// Short date for an RFC 3339 timestamp ("Jan 06 2025"). Unparseable input is returned as-is.
[[nodiscard]] std::string format_noted_date(const std::string &timestamp);

/// `[id:<id>] <content> [noted at <date>]`, one line per result.
[[nodiscard]] std::vector<std::string> format_memory_lines(const std::vector<SimilarityResult> &results,
                                                           std::size_t max_content_chars);

} // namespace mnemo::memory
