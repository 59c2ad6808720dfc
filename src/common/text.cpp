#include "mnemo/common/text.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace mnemo::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string collapse_whitespace(const std::string &input) {
  std::string out;
  out.reserve(input.size());
  bool pending_space = false;
  for (const char ch : input) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(ch);
  }
  return out;
}

std::string truncate_preview(const std::string &text, const std::size_t max_chars) {
  const std::string clean = collapse_whitespace(text);
  if (clean.size() <= max_chars) {
    return clean;
  }
  std::size_t cut = max_chars;
  // Do not split a UTF-8 sequence.
  while (cut > 0 && (static_cast<unsigned char>(clean[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  return trim(clean.substr(0, cut)) + "...";
}

std::string sha256_hex(const std::string_view text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

std::string format_utc(const std::chrono::system_clock::time_point when, const char *pattern) {
  const auto t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::ostringstream out;
  out << std::put_time(&tm, pattern);
  return out.str();
}

std::string now_rfc3339() {
  return format_utc(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%SZ");
}

} // namespace mnemo::common
