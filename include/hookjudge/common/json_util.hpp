#pragma once

#include "hookjudge/common/result.hpp"

#include <json/json.h>

#include <string>

namespace hookjudge::common {

/// Strict parse: no comments, no trailing content, duplicate keys rejected.
[[nodiscard]] Result<Json::Value> parse_json(const std::string &text);

/// Single-line serialization, used for prompts and log lines.
[[nodiscard]] std::string dump_json(const Json::Value &value);

/// Two-space indented serialization with UTF-8 emitted verbatim.
[[nodiscard]] std::string dump_json_pretty(const Json::Value &value);

/// JSON Schema style type name of a value ("object", "integer", ...).
[[nodiscard]] std::string json_type_name(const Json::Value &value);

} // namespace hookjudge::common
