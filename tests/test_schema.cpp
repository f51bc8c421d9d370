#include "test_framework.hpp"

#include "hookjudge/common/json_util.hpp"
#include "hookjudge/schema/schema_gate.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace s = hookjudge::schema;

bool has_violation(const s::ValidationOutcome &outcome, const std::string &path,
                   const std::string &constraint) {
  for (const auto &violation : outcome.violations()) {
    if (violation.path == path && violation.constraint == constraint) {
      return true;
    }
  }
  return false;
}

Json::Value valid_response() {
  return hookjudge::testing::parse_or_throw(R"({
    "hookSpecificOutput": {
      "hookEventName": "PreToolUse",
      "permissionDecision": "deny",
      "permissionDecisionReason": "drops a table"
    },
    "updatedInput": {"command": "bq query 'DROP TABLE t'"}
  })");
}

} // namespace

void register_schema_tests(std::vector<hookjudge::tests::TestCase> &tests) {
  using hookjudge::tests::require;
  using hookjudge::testing::request_document;

  tests.push_back({"schema_request_valid", [] {
                     const auto outcome = s::validate(s::Shape::Request, request_document());
                     require(outcome.ok(), outcome.summary());
                   }});

  tests.push_back({"schema_request_optional_fields_typed", [] {
                     auto request = request_document();
                     request["cwd"] = "/work";
                     request["transcript_path"] = "/tmp/t.jsonl";
                     request["permission_mode"] = "plan";
                     request["tool_use_id"] = "toolu_1";
                     require(s::validate(s::Shape::Request, request).ok(),
                             "optional fields should be accepted");
                     request["permission_mode"] = "yolo";
                     require(has_violation(s::validate(s::Shape::Request, request),
                                           "$.permission_mode", "enum"),
                             "unknown permission mode should be an enum violation");
                   }});

  tests.push_back({"schema_request_missing_tool_name", [] {
                     auto request = request_document();
                     request.removeMember("tool_name");
                     const auto outcome = s::validate(s::Shape::Request, request);
                     require(!outcome.ok(), "missing tool_name should fail");
                     require(has_violation(outcome, "$.tool_name", "required"),
                             "expected required violation: " + outcome.summary());
                   }});

  tests.push_back({"schema_request_rejects_unknown_keys", [] {
                     auto request = request_document();
                     request["tool_input"] = Json::Value(Json::objectValue);
                     const auto outcome = s::validate(s::Shape::Request, request);
                     require(has_violation(outcome, "$.tool_input", "additionalProperties"),
                             "unknown key should be rejected: " + outcome.summary());
                   }});

  tests.push_back({"schema_request_type_const_and_min_length", [] {
                     auto request = request_document();
                     request["tool_parameters"] = "rm -rf /";
                     request["hook_event_name"] = "PostToolUse";
                     request["tool_name"] = "";
                     request["message_history"] = Json::Value(Json::objectValue);
                     const auto outcome = s::validate(s::Shape::Request, request);
                     require(has_violation(outcome, "$.tool_parameters", "type"), "type");
                     require(has_violation(outcome, "$.hook_event_name", "const"), "const");
                     require(has_violation(outcome, "$.tool_name", "minLength"), "minLength");
                     require(has_violation(outcome, "$.message_history", "type"), "array type");
                     require(outcome.violations().size() == 4,
                             "all violations should be collected: " + outcome.summary());
                   }});

  tests.push_back({"schema_request_non_object_root", [] {
                     const auto outcome = s::validate(s::Shape::Request, Json::Value("text"));
                     require(outcome.violations().size() == 1, "single type violation expected");
                     require(outcome.violations()[0].path == "$", "root path expected");
                     require(outcome.violations()[0].constraint == "type", "type expected");
                   }});

  tests.push_back({"schema_response_valid", [] {
                     const auto outcome = s::validate(s::Shape::Response, valid_response());
                     require(outcome.ok(), outcome.summary());
                   }});

  tests.push_back({"schema_response_enum_and_nested_closed", [] {
                     auto response = valid_response();
                     response["hookSpecificOutput"]["permissionDecision"] = "maybe";
                     response["hookSpecificOutput"]["confidence"] = 0.9;
                     const auto outcome = s::validate(s::Shape::Response, response);
                     require(has_violation(outcome,
                                           "$.hookSpecificOutput.permissionDecision", "enum"),
                             "enum violation expected: " + outcome.summary());
                     require(has_violation(outcome, "$.hookSpecificOutput.confidence",
                                           "additionalProperties"),
                             "nested closed object expected: " + outcome.summary());
                   }});

  tests.push_back({"schema_response_missing_envelope_and_extra_top_level", [] {
                     auto response = hookjudge::testing::parse_or_throw(
                         R"({"permissionDecision": "allow", "permissionDecisionReason": "ok"})");
                     const auto outcome = s::validate(s::Shape::Response, response);
                     require(has_violation(outcome, "$.hookSpecificOutput", "required"),
                             "missing envelope should be required violation");
                     require(has_violation(outcome, "$.permissionDecision",
                                           "additionalProperties"),
                             "flat keys should be unexpected at top level");
                   }});

  tests.push_back({"schema_response_optional_top_level_fields_typed", [] {
                     auto response = valid_response();
                     response["continue"] = true;
                     response["systemMessage"] = "checked";
                     require(s::validate(s::Shape::Response, response).ok(),
                             "optional fields should pass");
                     response["suppressOutput"] = "yes";
                     require(has_violation(s::validate(s::Shape::Response, response),
                                           "$.suppressOutput", "type"),
                             "suppressOutput must be boolean");
                   }});

  tests.push_back({"schema_validation_is_idempotent", [] {
                     auto response = valid_response();
                     response["hookSpecificOutput"].removeMember("permissionDecisionReason");
                     response["extra"] = 1;
                     const auto first = s::validate(s::Shape::Response, response);
                     const auto second = s::validate(s::Shape::Response, response);
                     require(!first.ok(), "should be invalid");
                     require(first == second, "repeated validation should be identical");
                     require(first.summary() == second.summary(), "summaries should match");
                     const auto valid_first = s::validate(s::Shape::Request, request_document());
                     const auto valid_second = s::validate(s::Shape::Request, request_document());
                     require(valid_first == valid_second, "valid outcomes should be identical");
                   }});

  tests.push_back({"schema_validate_against_items_and_integer", [] {
                     const auto schema = hookjudge::testing::parse_or_throw(
                         R"({"type": "array", "items": {"type": "integer"}})");
                     const auto value = hookjudge::testing::parse_or_throw(R"([1, 2.5, "x"])");
                     const auto outcome = s::validate_against(schema, value);
                     require(outcome.violations().size() == 2, outcome.summary());
                     require(outcome.violations()[0].path == "$[1]", "index path expected");
                     require(outcome.violations()[1].path == "$[2]", "index path expected");
                   }});

  tests.push_back({"schema_texts_are_the_parsed_schemas", [] {
                     for (const auto shape : {s::Shape::Request, s::Shape::Response}) {
                       auto parsed =
                           hookjudge::common::parse_json(std::string(s::schema_text(shape)));
                       require(parsed.ok(), parsed.error());
                       require(parsed.value() == s::schema_for(shape),
                               "schema text should match parsed schema");
                     }
                     require(s::shape_name(s::Shape::Request) == "request", "shape name");
                   }});
}
