#include "test_framework.hpp"

#include "hookjudge/judge/response_parser.hpp"
#include "hookjudge/schema/schema_gate.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_response_parser_tests(std::vector<hookjudge::tests::TestCase> &tests) {
  using hookjudge::tests::require;
  namespace j = hookjudge::judge;

  tests.push_back({"parser_bare_object", [] {
                     auto result = j::extract_decision(hookjudge::testing::allow_answer());
                     require(result.ok(), result.error());
                     require(result.value()["permissionDecision"].asString() == "allow",
                             "decision mismatch");
                   }});

  tests.push_back({"parser_object_inside_prose", [] {
                     auto result = j::extract_decision(
                         "Looking at the command, it only reads.\n"
                         R"({"permissionDecision": "allow", "permissionDecisionReason": "uses {braces} in text"})"
                         "\nHope that helps.");
                     require(result.ok(), result.error());
                     require(result.value()["permissionDecisionReason"].asString() ==
                                 "uses {braces} in text",
                             "braces inside strings should not split the object");
                   }});

  tests.push_back({"parser_fenced_json_block", [] {
                     auto result = j::extract_decision("Here is my answer:\n```json\n" +
                                                       hookjudge::testing::allow_answer() +
                                                       "\n```\nDone.");
                     require(result.ok(), result.error());
                     require(result.value().isMember("permissionDecision"), "missing key");
                   }});

  tests.push_back({"parser_plain_fence_uppercase_tag", [] {
                     auto plain = j::extract_decision("```\n{\"a\": 1}\n```");
                     require(plain.ok(), plain.error());
                     auto tagged = j::extract_decision("```JSON\n{\"a\": 1}\n```");
                     require(tagged.ok(), tagged.error());
                   }});

  tests.push_back({"parser_no_object_is_error", [] {
                     auto result = j::extract_decision("I think this command is fine.");
                     require(!result.ok(), "prose only should fail");
                     require(result.error().find("no JSON object") != std::string::npos,
                             "diagnostic should say no object: " + result.error());
                   }});

  tests.push_back({"parser_empty_text_is_error", [] {
                     auto result = j::extract_decision("   \n");
                     require(!result.ok(), "empty text should fail");
                   }});

  tests.push_back({"parser_two_objects_is_ambiguous", [] {
                     auto result = j::extract_decision(
                         R"({"permissionDecision": "allow", "permissionDecisionReason": "a"} or )"
                         R"({"permissionDecision": "deny", "permissionDecisionReason": "b"})");
                     require(!result.ok(), "two objects should fail");
                     require(result.error().find("found 2 JSON objects") != std::string::npos,
                             "diagnostic should count objects: " + result.error());
                   }});

  tests.push_back({"parser_fence_and_inline_object_is_ambiguous", [] {
                     auto result = j::extract_decision("{\"a\": 1}\n```json\n{\"b\": 2}\n```");
                     require(!result.ok(), "fenced plus inline object should fail");
                   }});

  tests.push_back({"parser_unterminated_fence_is_error", [] {
                     auto result = j::extract_decision("```json\n{\"a\": 1}\n");
                     require(!result.ok(), "unterminated fence should fail");
                     require(result.error().find("never closed") != std::string::npos,
                             "diagnostic should mention the fence: " + result.error());
                   }});

  tests.push_back({"parser_malformed_object_reports_reader_error", [] {
                     auto result = j::extract_decision("{\"permissionDecision\": allow}");
                     require(!result.ok(), "malformed object should fail");
                     require(result.error().find("malformed JSON") != std::string::npos,
                             "diagnostic should quote the reader error: " + result.error());
                   }});

  tests.push_back({"parser_malformed_then_valid_counts_one", [] {
                     auto result = j::extract_decision("Draft: {oops}\nFinal: {\"a\": 1}");
                     require(result.ok(), result.error());
                     require(result.value()["a"].asInt() == 1, "valid object expected");
                   }});

  tests.push_back({"parser_unbalanced_brace_does_not_hide_object", [] {
                     auto result = j::extract_decision("```\n{\"a\": 1}\n```\nnote: {");
                     require(result.ok(), result.error());
                   }});

  tests.push_back({"parser_rejects_commented_answer", [] {
                     auto result = j::extract_decision(
                         "```json\n{\"permissionDecision\": /* sure */ \"allow\"}\n```");
                     require(!result.ok(), "commented JSON should not be accepted");
                     require(result.error().find("comments") != std::string::npos,
                             result.error());
                   }});

  tests.push_back({"parser_many_unbalanced_braces_keep_first_diagnostic", [] {
                     const std::string noise(200, '{');
                     auto failed = j::extract_decision("draft " + noise);
                     require(!failed.ok(), "unbalanced text should fail");
                     require(failed.error().find("'{{{{") != std::string::npos,
                             "diagnostic should quote the first open brace: " + failed.error());

                     auto found = j::extract_decision("{ { {\"a\": 1}");
                     require(found.ok(), found.error());
                     require(found.value()["a"].asInt() == 1, "nested valid object expected");
                   }});

  tests.push_back({"parser_array_is_not_a_decision", [] {
                     auto result = j::extract_decision("```json\n[1, 2]\n```");
                     require(!result.ok(), "array should not count");
                     require(result.error().find("array") != std::string::npos,
                             "diagnostic should name the type: " + result.error());
                   }});

  tests.push_back({"normalize_wraps_flat_answer", [] {
                     const auto flat = hookjudge::testing::parse_or_throw(
                         R"({"permissionDecision": "ask", "permissionDecisionReason": "unclear",
                             "systemMessage": "check this"})");
                     const auto wrapped = j::normalize_decision(flat);
                     require(wrapped["hookSpecificOutput"]["hookEventName"].asString() ==
                                 "PreToolUse",
                             "hookEventName should be filled");
                     require(wrapped["hookSpecificOutput"]["permissionDecision"].asString() ==
                                 "ask",
                             "decision should move into the envelope");
                     require(wrapped["systemMessage"].asString() == "check this",
                             "known top-level keys stay at the top");
                     require(!wrapped.isMember("permissionDecision"), "flat key should move");
                     require(hookjudge::schema::validate(hookjudge::schema::Shape::Response,
                                                         wrapped)
                                 .ok(),
                             "wrapped answer should validate");
                   }});

  tests.push_back({"normalize_never_invents_a_decision", [] {
                     const auto flat = hookjudge::testing::parse_or_throw(
                         R"({"permissionDecisionReason": "no decision given"})");
                     const auto wrapped = j::normalize_decision(flat);
                     require(!wrapped["hookSpecificOutput"].isMember("permissionDecision"),
                             "decision must not be defaulted");
                     require(!hookjudge::schema::validate(hookjudge::schema::Shape::Response,
                                                          wrapped)
                                  .ok(),
                             "still invalid without a decision");
                   }});

  tests.push_back({"normalize_leaves_enveloped_answer_alone", [] {
                     const auto enveloped = hookjudge::testing::parse_or_throw(
                         R"({"hookSpecificOutput": {"permissionDecision": "deny"}})");
                     require(j::normalize_decision(enveloped) == enveloped,
                             "enveloped answer should be unchanged");
                   }});
}
