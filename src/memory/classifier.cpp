#include "mnemo/memory/classifier.hpp"

#include "mnemo/common/text.hpp"
#include "mnemo/memory/reference_categories.hpp"
#include "mnemo/memory/similarity.hpp"
#include "mnemo/observability/global.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <vector>

namespace mnemo::memory {

namespace {

bool is_continuation(const unsigned char byte) { return (byte & 0xC0U) == 0x80U; }

// Non-ASCII lead bytes count as letters so that non-Latin prose is not mistaken for symbols.
bool is_alnum_unit(const unsigned char byte) { return byte >= 0xC0U || std::isalnum(byte) != 0; }

bool is_space_unit(const unsigned char byte) { return byte < 0x80U && std::isspace(byte) != 0; }

bool all_alnum(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  return std::all_of(value.begin(), value.end(), [](const char ch) {
    const auto byte = static_cast<unsigned char>(ch);
    return is_continuation(byte) || is_alnum_unit(byte);
  });
}

std::size_t count_of(const std::string &text, const std::string_view needle) {
  std::size_t count = 0;
  std::size_t pos = text.find(needle);
  while (pos != std::string::npos) {
    ++count;
    pos = text.find(needle, pos + needle.size());
  }
  return count;
}

std::size_t count_chars(const std::string &text, const std::string_view set) {
  return static_cast<std::size_t>(std::count_if(
      text.begin(), text.end(), [&](const char ch) { return set.find(ch) != std::string_view::npos; }));
}

std::vector<std::string> split_whitespace(const std::string &text) {
  std::vector<std::string> words;
  std::string current;
  for (const char ch : text) {
    if (is_space_unit(static_cast<unsigned char>(ch))) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(ch);
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    const auto end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

std::string strip_chars(const std::string &value, const std::string_view chars) {
  const auto first = value.find_first_not_of(chars);
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(chars);
  return value.substr(first, last - first + 1);
}

std::string remove_chars(std::string value, const std::string_view chars) {
  std::erase_if(value, [&](const char ch) { return chars.find(ch) != std::string_view::npos; });
  return value;
}

bool is_indented(const std::string &line) {
  return !line.empty() && (line.front() == ' ' || line.front() == '\t');
}

bool has_url(const std::string &text) {
  return text.find("http://") != std::string::npos || text.find("https://") != std::string::npos;
}

bool is_command_line(const std::string &line) {
  static constexpr std::array<std::string_view, 6> kKnownTools = {"curl", "wget", "git",
                                                                  "npm",  "pip",  "docker"};
  if (common::starts_with(line, "$ ") && line.size() > 2) {
    const auto parts = split_whitespace(line.substr(2));
    return !parts.empty() && all_alnum(parts.front());
  }
  if (const auto dollar = line.find("$ "); dollar != std::string::npos) {
    if (dollar == 0) {
      return false;
    }
    const char before = line[dollar - 1];
    if (before != ' ' && before != ':' && before != '\t') {
      return false;
    }
    const auto parts = split_whitespace(line.substr(dollar + 2));
    if (parts.empty()) {
      return false;
    }
    return all_alnum(parts.front()) || std::find(kKnownTools.begin(), kKnownTools.end(),
                                                 parts.front()) != kKnownTools.end();
  }
  if (common::starts_with(line, "# ") && line.size() > 2) {
    const std::string rest = common::trim(line.substr(2));
    return !rest.empty() && std::isupper(static_cast<unsigned char>(rest.front())) == 0 &&
           rest.find(' ') != std::string::npos;
  }
  return false;
}

double ratio(const std::size_t part, const std::size_t whole) {
  return whole == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(whole);
}

} // namespace

std::size_t utf8_length(const std::string &text) {
  return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](const char ch) {
    return !is_continuation(static_cast<unsigned char>(ch));
  }));
}

bool detect_structural_skip(const std::string &text) {
  const std::size_t length = utf8_length(text);
  if (length == 0) {
    return false;
  }

  // Link lists.
  if (count_of(text, "http://") + count_of(text, "https://") >= 5) {
    return true;
  }

  // Tokens, hashes and base64 blobs.
  for (const auto &word : split_whitespace(text)) {
    const std::string cleaned = strip_chars(word, ".,;:!?()[]{}\"'");
    if (utf8_length(cleaned) > 80 && all_alnum(remove_chars(cleaned, "-_"))) {
      return true;
    }
  }

  // Markdown rules.
  for (const std::string_view rule : {"---", "===", "___", "***"}) {
    if (count_of(text, rule) >= 2) {
      return true;
    }
  }

  const auto lines = split_lines(text);
  std::vector<std::string> stripped;
  std::vector<std::string> non_blank;
  for (const auto &line : lines) {
    std::string trimmed = common::trim(line);
    if (!trimmed.empty()) {
      stripped.push_back(std::move(trimmed));
      non_blank.push_back(line);
    }
  }

  // Shell transcripts.
  const auto command_lines = static_cast<std::size_t>(
      std::count_if(stripped.begin(), stripped.end(), is_command_line));
  if (command_lines >= 1 && (has_url(text) || text.find(" | ") != std::string::npos)) {
    return true;
  }
  if (command_lines >= 3) {
    return true;
  }

  // Paths and dotted names.
  if (length > 30) {
    const std::size_t path_chars = count_chars(text, "/\\.");
    if (path_chars > 10 && ratio(path_chars, length) > 0.15) {
      return true;
    }
  }

  // Markup density.
  const std::size_t markup_chars = count_chars(text, "{}[]<>");
  if (markup_chars >= 6) {
    if (ratio(markup_chars, length) > 0.10) {
      return true;
    }
    if (count_chars(text, "{}") >= 10) {
      return true;
    }
  }

  const std::size_t newline_count = count_chars(text, "\n");
  const std::size_t indented_lines =
      static_cast<std::size_t>(std::count_if(non_blank.begin(), non_blank.end(), is_indented));

  // Indented key: value documents such as YAML.
  if (newline_count >= 8 && !non_blank.empty()) {
    std::size_t colon_lines = 0;
    std::size_t words_outside_pairs = 0;
    for (const auto &line : non_blank) {
      if (line.find(':') == std::string::npos) {
        words_outside_pairs += split_whitespace(line).size();
      } else if (!common::starts_with(common::trim(line), "#")) {
        ++colon_lines;
      }
    }
    if (ratio(colon_lines, non_blank.size()) > 0.4 &&
        ratio(indented_lines, non_blank.size()) > 0.5 && words_outside_pairs < 5) {
      return true;
    }
  }

  // Long structured blocks.
  if (newline_count > 15 && !non_blank.empty()) {
    const auto markup_lines = static_cast<std::size_t>(
        std::count_if(non_blank.begin(), non_blank.end(), [](const std::string &line) {
          return line.find_first_of("{}[]<>") != std::string::npos;
        }));
    if (ratio(markup_lines, non_blank.size()) > 0.3) {
      return true;
    }
    if (ratio(indented_lines, non_blank.size()) > 0.6 &&
        ratio(count_chars(text, "=+-*/<>&|!:?"), length) > 0.05) {
      return true;
    }
  }

  // Indented code blocks.
  if (newline_count >= 3 && !non_blank.empty() && ratio(indented_lines, non_blank.size()) > 0.5) {
    const auto code_endings = static_cast<std::size_t>(
        std::count_if(stripped.begin(), stripped.end(), [](const std::string &line) {
          return std::string_view("{}();").find(line.back()) != std::string_view::npos;
        }));
    if (ratio(code_endings, non_blank.size()) > 0.2) {
      return true;
    }
  }

  // Encoded data and symbol-heavy output.
  if (length > 50) {
    std::size_t special = 0;
    std::size_t alnum = 0;
    for (const char ch : text) {
      const auto byte = static_cast<unsigned char>(ch);
      if (is_continuation(byte)) {
        continue;
      }
      if (is_alnum_unit(byte)) {
        ++alnum;
      } else if (!is_space_unit(byte)) {
        ++special;
      }
    }
    if (ratio(special, length) > 0.35 && ratio(alnum, length) < 0.50) {
      return true;
    }
  }

  return false;
}

ContentClassifier::ContentClassifier(std::shared_ptr<IEmbedder> embedder,
                                     config::ClassifierConfig config,
                                     std::shared_ptr<EngineCache> cache,
                                     const std::chrono::seconds verdict_ttl)
    : embedder_(std::move(embedder)), config_(std::move(config)), cache_(std::move(cache)),
      verdict_ttl_(verdict_ttl) {}

ClassifierVerdict ContentClassifier::classify(const std::string &message,
                                              const std::string &user_id) {
  const auto started = std::chrono::steady_clock::now();
  const bool use_cache = cache_ != nullptr && !user_id.empty();
  const auto key = use_cache ? cache::make_cache_key(cache::CacheKind::Verdict, user_id, message)
                             : std::string();

  if (use_cache) {
    if (auto hit = cache_->get(user_id, cache::CacheKind::Verdict, key); hit.has_value()) {
      if (const auto *cached = std::get_if<CachedVerdict>(&*hit);
          cached != nullptr && started - cached->stored_at < verdict_ttl_) {
        return cached->verdict;
      }
    }
  }

  bool cacheable = true;
  const ClassifierVerdict verdict = evaluate(message, cacheable);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  observability::record_classification(
      verdict.allowed,
      verdict.reason.has_value() ? std::string(skip_reason_name(*verdict.reason)) : "allow",
      elapsed);

  if (use_cache && cacheable) {
    cache_->put(user_id, cache::CacheKind::Verdict, key,
                CacheValue{CachedVerdict{.verdict = verdict, .stored_at = started}});
  }
  return verdict;
}

ClassifierVerdict ContentClassifier::evaluate(const std::string &message, bool &cacheable) {
  const std::string trimmed = common::trim(message);
  const std::size_t length = utf8_length(trimmed);
  if (trimmed.empty() || length < config_.min_message_chars ||
      length > config_.max_message_chars) {
    return ClassifierVerdict::skip(SkipReason::Size);
  }

  if (detect_structural_skip(message)) {
    return ClassifierVerdict::skip(SkipReason::Structural);
  }

  if (const auto reason = semantic_skip(trimmed, cacheable); reason.has_value()) {
    return ClassifierVerdict::skip(*reason);
  }
  return ClassifierVerdict::allow();
}

std::optional<SkipReason> ContentClassifier::semantic_skip(const std::string &trimmed,
                                                           bool &cacheable) {
  auto table = ReferenceCategoryTable::shared(embedder_);
  if (!table.ok()) {
    cacheable = false;
    observability::record_error("classifier", table.error() + "; allowing message");
    return std::nullopt;
  }

  auto embedded = embedder_->embed(trimmed);
  if (!embedded.ok()) {
    cacheable = false;
    observability::record_error("classifier",
                                "message embedding failed: " + embedded.error() +
                                    "; allowing message");
    return std::nullopt;
  }
  const Embedding vector = l2_normalize(std::move(embedded.value()));

  const auto personal = table.value()->max_similarity(kPersonalCategory, vector);
  const double personal_max = personal.value_or(-1.0);

  if (config_.granularity == "multi") {
    std::optional<SkipReason> best_reason;
    double best_excess = 0.0;
    for (const auto &category : table.value()->categories()) {
      const auto reason = skip_reason_for_category(category.label);
      if (!reason.has_value()) {
        continue;
      }
      const auto similarity = table.value()->max_similarity(category.label, vector);
      if (!similarity.has_value()) {
        continue;
      }
      const double excess = *similarity - personal_max - config_.skip_margin;
      if (excess > best_excess) {
        best_excess = excess;
        best_reason = reason;
      }
    }
    return best_reason;
  }

  double non_personal_max = -1.0;
  for (const auto &category : table.value()->categories()) {
    if (!skip_reason_for_category(category.label).has_value()) {
      continue;
    }
    if (const auto similarity = table.value()->max_similarity(category.label, vector)) {
      non_personal_max = std::max(non_personal_max, *similarity);
    }
  }
  if (non_personal_max - personal_max > config_.skip_margin) {
    return SkipReason::NonPersonal;
  }
  return std::nullopt;
}

} // namespace mnemo::memory
