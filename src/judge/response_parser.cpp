#include "hookjudge/judge/response_parser.hpp"

#include "hookjudge/common/fs.hpp"
#include "hookjudge/common/json_util.hpp"
#include "hookjudge/judge/types.hpp"

#include <array>
#include <optional>
#include <vector>

namespace hookjudge::judge {

namespace {

struct TextRange {
  std::size_t start = 0;
  std::size_t end = 0; // exclusive
};

struct Candidate {
  std::string text;
  bool from_fence = false;
};

struct FenceScan {
  std::vector<Candidate> bodies;
  std::vector<TextRange> ranges;
  bool unterminated = false;
};

constexpr std::array<const char *, 5> kTopLevelKeys = {"updatedInput", "continue", "stopReason",
                                                       "suppressOutput", "systemMessage"};

bool is_fence_line(const std::string &line) { return common::starts_with(common::trim(line), "```"); }

FenceScan scan_fences(const std::string &text) {
  FenceScan scan;
  bool inside = false;
  std::size_t fence_start = 0;
  std::size_t body_start = 0;
  std::size_t pos = 0;

  while (pos <= text.size()) {
    const std::size_t line_start = pos;
    std::size_t line_end = text.find('\n', pos);
    if (line_end == std::string::npos) {
      line_end = text.size();
    }
    const std::string line = text.substr(line_start, line_end - line_start);
    const std::size_t next = line_end < text.size() ? line_end + 1 : text.size();

    if (is_fence_line(line)) {
      if (!inside) {
        inside = true;
        fence_start = line_start;
        body_start = next;
      } else {
        scan.bodies.push_back(
            Candidate{.text = text.substr(body_start, line_start - body_start), .from_fence = true});
        scan.ranges.push_back(TextRange{.start = fence_start, .end = next});
        inside = false;
      }
    }

    if (line_end >= text.size()) {
      break;
    }
    pos = next;
  }

  if (inside) {
    scan.unterminated = true;
  }
  return scan;
}

std::optional<std::size_t> find_balanced_end(const std::string &text, const std::size_t start) {
  bool in_string = false;
  bool escaped = false;
  int depth = 0;

  for (std::size_t i = start; i < text.size(); ++i) {
    const char ch = text[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_string = false;
      }
      continue;
    }
    if (ch == '"') {
      in_string = true;
    } else if (ch == '{') {
      ++depth;
    } else if (ch == '}') {
      --depth;
      if (depth == 0) {
        return i + 1;
      }
    }
  }
  return std::nullopt;
}

const TextRange *range_at(const std::vector<TextRange> &ranges, const std::size_t index) {
  for (const auto &range : ranges) {
    if (index >= range.start && index < range.end) {
      return &range;
    }
  }
  return nullptr;
}

// Quotes in surrounding prose are not tracked; only the braces that open a
// candidate start string-aware scanning.
std::vector<Candidate> scan_inline_objects(const std::string &text,
                                           const std::vector<TextRange> &fenced) {
  std::vector<Candidate> out;
  bool reported_unbalanced = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (const auto *range = range_at(fenced, i); range != nullptr) {
      i = range->end - 1;
      continue;
    }
    if (text[i] != '{') {
      continue;
    }
    const auto end = find_balanced_end(text, i);
    if (!end.has_value()) {
      // Unbalanced brace: the first one is kept as a malformed candidate for the
      // diagnostic, later ones are only rescanned past.
      if (!reported_unbalanced) {
        out.push_back(Candidate{.text = text.substr(i), .from_fence = false});
        reported_unbalanced = true;
      }
      continue;
    }
    out.push_back(Candidate{.text = text.substr(i, *end - i), .from_fence = false});
    i = *end - 1;
  }
  return out;
}

std::string excerpt(const std::string &text) {
  constexpr std::size_t kMaxExcerpt = 80;
  const std::string trimmed = common::trim(text);
  if (trimmed.size() <= kMaxExcerpt) {
    return trimmed;
  }
  return trimmed.substr(0, kMaxExcerpt) + "...";
}

} // namespace

common::Result<Json::Value> extract_decision(const std::string &oracle_text) {
  const FenceScan fences = scan_fences(oracle_text);
  if (fences.unterminated) {
    return common::Result<Json::Value>::failure(
        "the response opens a ``` code fence that is never closed");
  }

  std::vector<Candidate> candidates = fences.bodies;
  for (auto &inline_candidate : scan_inline_objects(oracle_text, fences.ranges)) {
    candidates.push_back(std::move(inline_candidate));
  }

  std::vector<Json::Value> objects;
  std::optional<std::string> first_error;
  for (const auto &candidate : candidates) {
    if (common::trim(candidate.text).empty()) {
      continue;
    }
    auto parsed = common::parse_json(candidate.text);
    if (!parsed.ok()) {
      if (!first_error.has_value()) {
        first_error = "malformed JSON in " +
                      std::string(candidate.from_fence ? "code block" : "response") + " '" +
                      excerpt(candidate.text) + "': " + parsed.error();
      }
      continue;
    }
    if (!parsed.value().isObject()) {
      if (!first_error.has_value()) {
        first_error = "expected a JSON object but found " +
                      common::json_type_name(parsed.value());
      }
      continue;
    }
    objects.push_back(parsed.take());
  }

  if (objects.size() == 1) {
    return common::Result<Json::Value>::success(std::move(objects.front()));
  }
  if (objects.size() > 1) {
    return common::Result<Json::Value>::failure(
        "found " + std::to_string(objects.size()) +
        " JSON objects in the response; return exactly one");
  }
  if (first_error.has_value()) {
    return common::Result<Json::Value>::failure(*first_error);
  }
  if (common::trim(oracle_text).empty()) {
    return common::Result<Json::Value>::failure("the response is empty");
  }
  return common::Result<Json::Value>::failure("no JSON object found in the response '" +
                                              excerpt(oracle_text) + "'");
}

Json::Value normalize_decision(const Json::Value &candidate) {
  if (!candidate.isObject() || candidate.isMember("hookSpecificOutput")) {
    return candidate;
  }

  Json::Value wrapped(Json::objectValue);
  Json::Value specific(Json::objectValue);
  for (const auto &key : candidate.getMemberNames()) {
    bool top_level = false;
    for (const char *known : kTopLevelKeys) {
      top_level = top_level || key == known;
    }
    if (top_level) {
      wrapped[key] = candidate[key];
    } else {
      specific[key] = candidate[key];
    }
  }
  if (!specific.isMember("hookEventName")) {
    specific["hookEventName"] = kHookEventName;
  }
  wrapped["hookSpecificOutput"] = specific;
  return wrapped;
}

} // namespace hookjudge::judge
