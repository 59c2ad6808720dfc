#include "mnemo/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace mnemo::common {

namespace {

void append_utf8(std::string &out, std::uint32_t cp) {
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

std::optional<std::uint32_t> parse_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  const auto [ptr, ec] = std::from_chars(raw.data() + pos, raw.data() + pos + 4, value, 16);
  if (ec != std::errc() || ptr != raw.data() + pos + 4) {
    return std::nullopt;
  }
  return value;
}

// End (exclusive) of the scalar or compound value starting at pos.
std::size_t value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end;
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
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
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
      auto cp = parse_hex4(raw, i + 1);
      if (!cp.has_value()) {
        out.push_back(next);
        break;
      }
      i += 4;
      std::uint32_t code = *cp;
      if (code >= 0xD800 && code <= 0xDBFF && i + 2 < raw.size() &&
          raw.compare(i + 1, 2, "\\u") == 0) {
        if (auto low = parse_hex4(raw, i + 3);
            low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, const std::size_t quote_pos) {
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

std::size_t json_find_matching_token(const std::string &json, const std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      i = json_find_string_end(json, i);
      if (i == std::string::npos) {
        return std::string::npos;
      }
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::optional<std::string> json_get_raw(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t pos = 0;
  while (pos < json.size()) {
    const auto quote = json.find('"', pos);
    if (quote == std::string::npos) {
      return std::nullopt;
    }
    const auto end = json_find_string_end(json, quote);
    if (end == std::string::npos) {
      return std::nullopt;
    }
    // Only a string followed by ':' is a key; values are skipped whole.
    const auto after = json_skip_ws(json, end + 1);
    if (after < json.size() && json[after] == ':' &&
        json.compare(quote, end - quote + 1, quoted) == 0) {
      const auto start = json_skip_ws(json, after + 1);
      const auto stop = value_end(json, start);
      if (stop == std::string::npos || stop <= start) {
        return std::nullopt;
      }
      return json.substr(start, stop - start);
    }
    pos = end + 1;
  }
  return std::nullopt;
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto raw = json_get_raw(json, field);
  if (!raw.has_value() || raw->front() != '[') {
    return "";
  }
  return *raw;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return result;
  }
  ++pos;

  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    const auto end = value_end(json, pos);
    if (end == std::string::npos || end <= pos) {
      break;
    }
    std::string value = json.substr(pos, end - pos);
    if (value.front() == '"') {
      value = json_unescape(value.substr(1, value.size() - 2));
    }
    result[key] = std::move(value);
    pos = end;
  }

  return result;
}

std::vector<std::string> json_split_array(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const auto end = value_end(array_json, pos);
    if (end == std::string::npos || end <= pos) {
      break;
    }
    out.push_back(array_json.substr(pos, end - pos));
    pos = end;
  }
  return out;
}

std::optional<std::vector<float>> json_parse_float_array(const std::string &array_json) {
  const auto elements = json_split_array(array_json);
  if (elements.empty() && array_json.find('[') == std::string::npos) {
    return std::nullopt;
  }
  std::vector<float> values;
  values.reserve(elements.size());
  for (const auto &element : elements) {
    char *end = nullptr;
    const float parsed = std::strtof(element.c_str(), &end);
    if (end == element.c_str() || *end != '\0') {
      return std::nullopt;
    }
    values.push_back(parsed);
  }
  return values;
}

std::optional<std::string> json_extract_object(const std::string &text) {
  std::size_t pos = text.find('{');
  while (pos != std::string::npos) {
    const auto end = json_find_matching_token(text, pos, '{', '}');
    if (end != std::string::npos) {
      return text.substr(pos, end - pos + 1);
    }
    pos = text.find('{', pos + 1);
  }
  return std::nullopt;
}

} // namespace mnemo::common
