#include "hookjudge/schema/schema_gate.hpp"

#include "hookjudge/common/json_util.hpp"

#include <sstream>
#include <stdexcept>

namespace hookjudge::schema {

namespace {

constexpr std::string_view kRequestSchema = R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "required": ["session_id", "hook_event_name", "tool_name", "tool_parameters", "message_history"],
  "properties": {
    "session_id": {"type": "string"},
    "hook_event_name": {"type": "string", "const": "PreToolUse"},
    "tool_name": {"type": "string", "minLength": 1},
    "tool_parameters": {"type": "object"},
    "message_history": {"type": "array"},
    "transcript_path": {"type": "string"},
    "cwd": {"type": "string"},
    "permission_mode": {
      "type": "string",
      "enum": ["default", "plan", "acceptEdits", "bypassPermissions"]
    },
    "tool_use_id": {"type": "string"}
  },
  "additionalProperties": false
})";

constexpr std::string_view kResponseSchema = R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "required": ["hookSpecificOutput"],
  "properties": {
    "hookSpecificOutput": {
      "type": "object",
      "required": ["hookEventName", "permissionDecision", "permissionDecisionReason"],
      "properties": {
        "hookEventName": {"type": "string", "const": "PreToolUse"},
        "permissionDecision": {"type": "string", "enum": ["allow", "deny", "ask"]},
        "permissionDecisionReason": {"type": "string"}
      },
      "additionalProperties": false
    },
    "updatedInput": {"type": "object"},
    "continue": {"type": "boolean"},
    "stopReason": {"type": "string"},
    "suppressOutput": {"type": "boolean"},
    "systemMessage": {"type": "string"}
  },
  "additionalProperties": false
})";

Json::Value parse_schema(std::string_view text) {
  auto parsed = common::parse_json(std::string(text));
  if (!parsed.ok()) {
    throw std::logic_error("built-in schema is not valid JSON: " + parsed.error());
  }
  return parsed.take();
}

bool type_matches(const std::string &expected, const Json::Value &value) {
  if (expected == "number") {
    return value.isNumeric();
  }
  if (expected == "integer") {
    return value.isNumeric() && common::json_type_name(value) == "integer";
  }
  return common::json_type_name(value) == expected;
}

std::string describe_types(const Json::Value &type_spec) {
  if (type_spec.isString()) {
    return type_spec.asString();
  }
  std::string out;
  for (const auto &entry : type_spec) {
    if (!out.empty()) {
      out += " or ";
    }
    out += entry.asString();
  }
  return out;
}

class Validator {
public:
  std::vector<Violation> violations;

  void check(const Json::Value &schema, const Json::Value &value, const std::string &path) {
    if (!schema.isObject()) {
      return;
    }

    if (schema.isMember("type")) {
      const Json::Value &type_spec = schema["type"];
      bool matched = false;
      if (type_spec.isString()) {
        matched = type_matches(type_spec.asString(), value);
      } else if (type_spec.isArray()) {
        for (const auto &entry : type_spec) {
          matched = matched || (entry.isString() && type_matches(entry.asString(), value));
        }
      }
      if (!matched) {
        add(path, "type",
            "expected " + describe_types(type_spec) + ", got " + common::json_type_name(value));
        // Nested constraints are meaningless once the type is wrong.
        return;
      }
    }

    if (schema.isMember("const") && value != schema["const"]) {
      add(path, "const",
          "expected constant " + common::dump_json(schema["const"]) + ", got " +
              common::dump_json(value));
    }

    if (schema.isMember("enum") && schema["enum"].isArray()) {
      bool found = false;
      for (const auto &option : schema["enum"]) {
        found = found || option == value;
      }
      if (!found) {
        add(path, "enum",
            "value " + common::dump_json(value) + " is not one of " +
                common::dump_json(schema["enum"]));
      }
    }

    if (value.isString() && schema.isMember("minLength") && schema["minLength"].isUInt()) {
      const auto min_length = schema["minLength"].asUInt();
      if (value.asString().size() < min_length) {
        add(path, "minLength",
            "string is shorter than the minimum length " + std::to_string(min_length));
      }
    }

    if (value.isObject()) {
      check_object(schema, value, path);
    }

    if (value.isArray() && schema.isMember("items")) {
      for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
        check(schema["items"], value[i], path + "[" + std::to_string(i) + "]");
      }
    }
  }

private:
  void add(const std::string &path, std::string constraint, std::string message) {
    violations.push_back(
        Violation{.path = path, .constraint = std::move(constraint), .message = std::move(message)});
  }

  void check_object(const Json::Value &schema, const Json::Value &value, const std::string &path) {
    if (schema.isMember("required")) {
      for (const auto &key : schema["required"]) {
        if (key.isString() && !value.isMember(key.asString())) {
          add(path + "." + key.asString(), "required",
              "missing required property '" + key.asString() + "'");
        }
      }
    }

    const Json::Value &properties = schema["properties"];
    const bool closed =
        schema.isMember("additionalProperties") && schema["additionalProperties"].isBool() &&
        !schema["additionalProperties"].asBool();

    for (const auto &key : value.getMemberNames()) {
      const std::string child_path = path + "." + key;
      if (properties.isObject() && properties.isMember(key)) {
        check(properties[key], value[key], child_path);
      } else if (closed) {
        add(child_path, "additionalProperties", "unexpected property '" + key + "'");
      }
    }
  }
};

} // namespace

std::string Violation::to_string() const { return path + ": " + message; }

bool operator==(const Violation &lhs, const Violation &rhs) {
  return lhs.path == rhs.path && lhs.constraint == rhs.constraint && lhs.message == rhs.message;
}

bool operator==(const ValidationOutcome &lhs, const ValidationOutcome &rhs) {
  return lhs.violations_ == rhs.violations_;
}

std::string ValidationOutcome::summary() const {
  std::ostringstream out;
  for (std::size_t i = 0; i < violations_.size(); ++i) {
    if (i > 0) {
      out << "; ";
    }
    out << violations_[i].to_string();
  }
  return out.str();
}

ValidationOutcome validate_against(const Json::Value &schema, const Json::Value &value) {
  Validator validator;
  validator.check(schema, value, "$");
  if (validator.violations.empty()) {
    return ValidationOutcome::valid();
  }
  return ValidationOutcome::invalid(std::move(validator.violations));
}

ValidationOutcome validate(const Shape shape, const Json::Value &value) {
  return validate_against(schema_for(shape), value);
}

const Json::Value &schema_for(const Shape shape) {
  static const Json::Value request = parse_schema(kRequestSchema);
  static const Json::Value response = parse_schema(kResponseSchema);
  return shape == Shape::Request ? request : response;
}

std::string_view schema_text(const Shape shape) {
  return shape == Shape::Request ? kRequestSchema : kResponseSchema;
}

std::string_view shape_name(const Shape shape) {
  return shape == Shape::Request ? "request" : "response";
}

} // namespace hookjudge::schema
