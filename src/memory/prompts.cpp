#include "mnemo/memory/prompts.hpp"

#include "mnemo/common/text.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mnemo::memory {

namespace {

constexpr const char *kConsolidationPrompt = R"(You maintain a small set of first-person memory statements about one user.

Read the user's message together with the existing memories listed below and decide which
changes keep that set accurate.

Operations:
- CREATE: record a new, lasting personal fact. Leave "id" empty.
- UPDATE: rewrite an existing memory, for example to enrich it or to turn a superseded fact
  into a dated past-tense statement. "id" must be one of the listed memory ids.
- DELETE: remove a memory the user explicitly retracts or that the message contradicts.
  "id" must be one of the listed memory ids and "content" must be empty.

Rules:
- Store only significant facts about the user's life, identity, relationships, work, health,
  home, preferences and plans. Ignore questions, passing moods, trivia and general knowledge.
- When the message is mainly a request to write, rewrite, translate, proofread, calculate or
  explain something, personal details inside that request are material for the task and are
  not stored.
- Prefer updating a related memory over creating a near-copy. Combine facts about the same
  person, event or period into one memory; never merge unrelated facts.
- Turn relative dates ("last month", "yesterday") into absolute ones using the current date.
  Do not invent dates for ongoing states.
- Name people together with their relationship to the user ("my sister Ana").
- Write every memory in English, in the first person, as one self-contained sentence.
- When nothing is worth storing, return an empty list.

Example
Message: "My wife Sarah loves hiking. I started rock climbing last month."
Existing memories: []
Result: {"ops":[{"operation":"CREATE","id":"","content":"My wife Sarah loves hiking"},{"operation":"CREATE","id":"","content":"I started rock climbing in August 2025"}]}

Example
Message: "We moved from Madrid to Barcelona last month. Any tapas places you recommend?"
Existing memories: [id:mem-5] I live in Madrid Spain [noted at Jun 12 2025]
Result: {"ops":[{"operation":"UPDATE","id":"mem-5","content":"I lived in Madrid Spain until August 2025"},{"operation":"CREATE","id":"","content":"I moved to Barcelona Spain in August 2025"}]}

Example
Message: "I'm stressed about a presentation on Friday, any relaxation tips?"
Existing memories: []
Result: {"ops":[]}

Respond with a JSON object of the form {"ops":[{"operation":"CREATE|UPDATE|DELETE","id":"...","content":"..."}]}.)";

constexpr const char *kRerankPromptHead = R"(You pick which stored facts about a user help answer their message.

Each candidate memory is listed as [id:<id>] <content> [noted at <date>].

Selection:
- First, memories directly about the topic, people or place in the message.
- Then, personal context that changes what a good answer looks like (diet, budget, location,
  family situation).
- Prefer current facts over historical ones unless the message concerns the past.
- Leave out memories that would not change the answer. An empty list is a valid answer.
- Order the ids from most to least relevant and return at most )";

constexpr const char *kRerankPromptTail = R"( ids.

Respond with a JSON object of the form {"ids":["<id>", ...]} using only ids from the list.)";

providers::OutputSchema make_consolidation_schema() {
  return providers::OutputSchema{
      .name = "memory_consolidation",
      .schema_json =
          R"({"type":"object","properties":{"ops":{"type":"array","items":{"type":"object",)"
          R"("properties":{"operation":{"type":"string","enum":["CREATE","UPDATE","DELETE"]},)"
          R"("id":{"type":"string"},"content":{"type":"string"}},)"
          R"("required":["operation","id","content"],"additionalProperties":false}}},)"
          R"("required":["ops"],"additionalProperties":false})",
      .required_keys = {"ops"},
  };
}

providers::OutputSchema make_rerank_schema() {
  return providers::OutputSchema{
      .name = "memory_selection",
      .schema_json = R"({"type":"object","properties":{"ids":{"type":"array","items":)"
                     R"({"type":"string"}}},"required":["ids"],"additionalProperties":false})",
      .required_keys = {"ids"},
  };
}

} // namespace

const std::string &consolidation_system_prompt() {
  static const std::string prompt = kConsolidationPrompt;
  return prompt;
}

std::string rerank_system_prompt(const std::size_t max_returned) {
  return std::string(kRerankPromptHead) + std::to_string(max_returned) + kRerankPromptTail;
}

const providers::OutputSchema &consolidation_schema() {
  static const providers::OutputSchema schema = make_consolidation_schema();
  return schema;
}

const providers::OutputSchema &rerank_schema() {
  static const providers::OutputSchema schema = make_rerank_schema();
  return schema;
}

std::string format_prompt_datetime(const std::chrono::system_clock::time_point when) {
  return common::format_utc(when, "%A %B %d %Y at %H:%M:%S UTC");
}

std::string format_noted_date(const std::string &timestamp) {
  std::tm tm{};
  std::istringstream input(timestamp);
  input >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (input.fail()) {
    input.clear();
    input.str(timestamp);
    input >> std::get_time(&tm, "%Y-%m-%d");
    if (input.fail()) {
      return timestamp;
    }
  }
  std::ostringstream out;
  out << std::put_time(&tm, "%b %d %Y");
  return out.str();
}

std::vector<std::string> format_memory_lines(const std::vector<SimilarityResult> &results,
                                             const std::size_t max_content_chars) {
  std::vector<std::string> lines;
  lines.reserve(results.size());
  for (const auto &result : results) {
    std::string line = "[id:" + result.memory_id + "] " +
                       common::truncate_preview(result.content, max_content_chars);
    const auto &noted = result.updated_at.has_value() ? result.updated_at : result.created_at;
    if (noted.has_value() && !noted->empty()) {
      line += " [noted at " + format_noted_date(*noted) + "]";
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

} // namespace mnemo::memory
