#include "mnemo/common/toml.hpp"

#include "mnemo/common/text.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

namespace mnemo::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch == '\\' && i + 2 < value.size()) {
      const char next = value[++i];
      out.push_back(next == 'n' ? '\n' : next == 't' ? '\t' : next);
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

template <typename T> bool parse_integral(const std::string &raw, T &out) {
  std::string normalized = trim(raw);
  std::erase(normalized, '_');
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && !normalized.empty();
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  std::uint64_t parsed = 0;
  if (it == values.end() || !parse_integral(it->second, parsed)) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = trim(it->second);
  if (normalized.empty()) {
    return fallback;
  }
  char *end = nullptr;
  const double parsed = std::strtod(normalized.c_str(), &end);
  if (end != normalized.c_str() + normalized.size()) {
    return fallback;
  }
  return parsed;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));

    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure(ErrorKind::InvalidInput,
                                             "Invalid empty section at line " +
                                                 std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorKind::InvalidInput,
                                           "Invalid key/value at line " +
                                               std::to_string(line_number));
    }

    const std::string key = unquote(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorKind::InvalidInput,
                                           "Missing key at line " + std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace mnemo::common
