#include "hookjudge/common/toml.hpp"

#include "hookjudge/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace hookjudge::common {

namespace {

constexpr const char *kMultilineQuote = "\"\"\"";

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  bool escaped = false;
  std::string output;
  output.reserve(line.size());

  for (const char ch : line) {
    if (in_quotes) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_quotes = false;
      }
    } else if (ch == '"') {
      in_quotes = true;
    } else if (ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;
  bool escaped = false;

  for (const char ch : array_value) {
    if (in_quotes) {
      current.push_back(ch);
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_quotes = false;
      }
      continue;
    }
    if (ch == '"') {
      in_quotes = true;
      current.push_back(ch);
      continue;
    }
    if (ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

bool is_quoted(const std::string &raw) {
  return raw.size() >= 2 && raw.front() == '"' && raw.back() == '"';
}

// Exactly one basic string: the first unescaped quote after the opening one
// must be the last character.
bool is_single_string(const std::string &raw) {
  if (!is_quoted(raw)) {
    return false;
  }
  bool escaped = false;
  for (std::size_t i = 1; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (escaped) {
      escaped = false;
    } else if (ch == '\\') {
      escaped = true;
    } else if (ch == '"') {
      return i + 1 == raw.size();
    }
  }
  return false;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (!is_quoted(value)) {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  bool escaped = false;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
        continue;
      }
      out.push_back(ch);
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

// A closing quote that is itself escaped does not terminate the string.
bool has_unterminated_string(const std::string &value) {
  bool in_quotes = false;
  bool escaped = false;
  for (const char ch : value) {
    if (in_quotes) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_quotes = false;
      }
    } else if (ch == '"') {
      in_quotes = true;
    }
  }
  return in_quotes;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

bool TomlDocument::is_string(const std::string &key) const {
  const auto it = values.find(key);
  return it != values.end() && is_single_string(trim(it->second));
}

bool TomlDocument::is_string_array(const std::string &key) const {
  if (!is_array(key)) {
    return false;
  }
  const std::string raw = trim(values.at(key));
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!is_single_string(element)) {
      return false;
    }
  }
  return true;
}

bool TomlDocument::is_array(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return false;
  }
  const std::string raw = trim(it->second);
  return raw.size() >= 2 && raw.front() == '[' && raw.back() == ']';
}

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
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

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  if (!is_array(key)) {
    return fallback;
  }

  const std::string raw = trim(values.at(key));
  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

std::vector<std::string> TomlDocument::keys() const {
  std::vector<std::string> out;
  out.reserve(values.size());
  for (const auto &[key, value] : values) {
    out.push_back(key);
  }
  std::sort(out.begin(), out.end());
  return out;
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
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }
    if (value.empty()) {
      return Result<TomlDocument>::failure("Missing value for '" + key + "' at line " +
                                           std::to_string(line_number));
    }

    if (starts_with(value, kMultilineQuote)) {
      // Multi-line basic string; comments are not stripped inside it.
      const std::size_t start_line = line_number;
      const std::string raw_after = line.substr(line.find(kMultilineQuote) + 3);
      std::string body;
      bool closed = false;
      std::string segment = raw_after;
      bool first_segment = true;
      while (true) {
        const std::size_t close = segment.find(kMultilineQuote);
        if (close != std::string::npos) {
          body += segment.substr(0, close);
          closed = true;
          break;
        }
        // A newline directly after the opening delimiter is trimmed.
        if (!(first_segment && segment.empty())) {
          body += segment;
          body.push_back('\n');
        }
        first_segment = false;
        if (!std::getline(stream, segment)) {
          break;
        }
        ++line_number;
      }
      if (!closed) {
        return Result<TomlDocument>::failure("Unterminated multi-line string starting at line " +
                                             std::to_string(start_line));
      }
      value = quote_toml_string(body);
    } else if (value.front() == '"' && (has_unterminated_string(value) || value.size() < 2 ||
                                        value.back() != '"')) {
      return Result<TomlDocument>::failure("Unterminated string at line " +
                                           std::to_string(line_number));
    } else if (value.front() == '[' && value.back() != ']') {
      return Result<TomlDocument>::failure("Unterminated array at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (document.values.contains(full_key)) {
      return Result<TomlDocument>::failure("Duplicate key '" + full_key + "' at line " +
                                           std::to_string(line_number));
    }
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    switch (ch) {
    case '"':
    case '\\':
      escaped.push_back('\\');
      escaped.push_back(ch);
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\r':
      escaped += "\\r";
      break;
    default:
      escaped.push_back(ch);
      break;
    }
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace hookjudge::common
