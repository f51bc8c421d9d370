#include "hookjudge/judge/prompts.hpp"

#include "hookjudge/common/json_util.hpp"

#include <sstream>

namespace hookjudge::judge {

namespace {

constexpr const char *kCorrectionTail =
    "Return ONLY the corrected raw JSON object. No prose, no markdown fences, exactly one object.";

std::string attempt_line(const std::uint32_t next_attempt, const std::uint32_t max_attempts) {
  return "This is attempt " + std::to_string(next_attempt) + " of " +
         std::to_string(max_attempts) + ".";
}

} // namespace

std::string build_system_prompt(const config::DecisionConfig &config) {
  std::ostringstream out;
  out << "You are a PreToolUse hook validator. A coding agent wants to run a tool and you decide "
         "whether the call may proceed.\n"
      << "Answer with \"allow\" when the call is safe under the policy, \"deny\" when it is not, "
         "and \"ask\" when a human should confirm it.\n\n";

  out << "## Input schema\n"
      << "The tool call you are judging matches this JSON schema:\n"
      << common::dump_json_pretty(schema::schema_for(schema::Shape::Request)) << "\n\n";

  out << "## Output schema\n"
      << "Your answer must match this JSON schema:\n"
      << common::dump_json_pretty(schema::schema_for(schema::Shape::Response)) << "\n\n";

  out << "## Output rules\n"
      << "- Return ONLY raw JSON: exactly one object, no prose before or after it.\n"
      << "- Do not wrap the object in markdown fences.\n"
      << "- hookSpecificOutput.hookEventName is always \"" << kHookEventName << "\".\n"
      << "- permissionDecisionReason is one short sentence.\n\n";

  out << "# Policy\n" << config.prompt << "\n";
  return out.str();
}

std::string build_initial_turn(const DecisionRequest &request) {
  std::ostringstream out;
  out << "# Current Tool Usage\n"
      << "Session: " << request.session_id << "\n"
      << "Tool: " << request.tool_name << "\n"
      << "Input: " << common::dump_json_pretty(request.tool_parameters) << "\n\n"
      << "# Message History\n"
      << common::dump_json_pretty(request.message_history) << "\n";
  return out.str();
}

std::string build_parse_feedback(const std::string &diagnostic, const std::uint32_t next_attempt,
                                 const std::uint32_t max_attempts) {
  std::ostringstream out;
  out << "Your previous response could not be parsed as a single JSON object. Error: "
      << diagnostic << "\n"
      << attempt_line(next_attempt, max_attempts) << "\n"
      << kCorrectionTail;
  return out.str();
}

std::string build_schema_feedback(const schema::ValidationOutcome &outcome,
                                  const std::uint32_t next_attempt,
                                  const std::uint32_t max_attempts) {
  std::ostringstream out;
  out << "Your previous response did not match the required output schema. Errors:\n";
  for (const auto &violation : outcome.violations()) {
    out << "- " << violation.path << ": " << violation.message << "\n";
  }
  out << attempt_line(next_attempt, max_attempts) << "\n" << kCorrectionTail;
  return out.str();
}

} // namespace hookjudge::judge
