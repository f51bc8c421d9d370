#include "hookjudge/judge/result_synthesizer.hpp"

#include "hookjudge/common/fs.hpp"
#include "hookjudge/schema/schema_gate.hpp"

#include <type_traits>
#include <variant>

namespace hookjudge::judge {

namespace {

constexpr const char *kSafetySuffix = "; denying the tool call for safety.";

Json::Value object_or_empty(const Json::Value &value) {
  return value.isObject() ? value : Json::Value(Json::objectValue);
}

Json::Value build_envelope(const Permission permission, const std::string &reason,
                           const Json::Value &updated_input, const Json::Value &base) {
  Json::Value envelope = base.isObject() ? base : Json::Value(Json::objectValue);
  Json::Value hook(Json::objectValue);
  hook["hookEventName"] = kHookEventName;
  hook["permissionDecision"] = std::string(to_string(permission));
  hook["permissionDecisionReason"] = reason;
  envelope["hookSpecificOutput"] = hook;
  envelope["updatedInput"] = object_or_empty(updated_input);
  return envelope;
}

Json::Value deny_envelope(const std::string &reason, const Json::Value &tool_parameters) {
  return build_envelope(Permission::Deny, reason, tool_parameters, Json::Value(Json::objectValue));
}

std::string first_line(const std::string &text) {
  const auto newline = text.find('\n');
  return common::trim(newline == std::string::npos ? text : text.substr(0, newline));
}

} // namespace

DecisionOutcome to_outcome(const JudgeResult &result, const DecisionRequest &request,
                           observability::IObserver &observer) {
  switch (result.state) {
  case JudgeState::Success: {
    if (!result.candidate.has_value()) {
      return Failed{.kind = ErrorKind::Internal, .detail = "success without a candidate"};
    }
    const auto &candidate = *result.candidate;
    const auto &hook = candidate["hookSpecificOutput"];
    const auto permission = parse_permission(hook["permissionDecision"].asString());
    if (!permission.has_value()) {
      return Failed{.kind = ErrorKind::Internal, .detail = "validated candidate lost its decision"};
    }
    if (candidate.isMember("updatedInput") && candidate["updatedInput"] != request.tool_parameters) {
      observer.record_event(observability::WarningEvent{
          .component = "synthesizer",
          .message = "oracle updatedInput differs from the request tool_parameters; using the "
                     "request value"});
    }
    Decided decided;
    decided.permission = *permission;
    decided.reason = hook["permissionDecisionReason"].asString();
    decided.updated_input = object_or_empty(request.tool_parameters);
    decided.envelope = candidate;
    return decided;
  }
  case JudgeState::Exhausted:
    return Failed{.kind = ErrorKind::RetriesExhausted, .detail = result.detail};
  case JudgeState::Fatal:
    if (result.fatal_cause == FatalCause::Deadline) {
      return Failed{.kind = ErrorKind::DeadlineExceeded, .detail = result.detail};
    }
    return Failed{.kind = ErrorKind::Communication, .detail = result.detail};
  case JudgeState::Init:
  case JudgeState::AwaitOracle:
  case JudgeState::Parse:
  case JudgeState::Validate:
  case JudgeState::Feedback:
    break;
  }
  return Failed{.kind = ErrorKind::Internal,
                .detail = "orchestrator stopped in non-terminal state " +
                          std::string(to_string(result.state))};
}

std::string deny_reason(const Failed &failed) {
  switch (failed.kind) {
  case ErrorKind::RequestValidation:
    return "Input validation error: " + first_line(failed.detail);
  case ErrorKind::Configuration:
    return "Configuration error: " + first_line(failed.detail);
  case ErrorKind::Communication:
    return std::string("The decision oracle was unavailable or returned no response") +
           kSafetySuffix;
  case ErrorKind::DeadlineExceeded:
    return std::string("The decision oracle did not answer within the time limit") + kSafetySuffix;
  case ErrorKind::RetriesExhausted:
    if (common::starts_with(failed.detail, "schema:")) {
      return std::string("The decision oracle exhausted its retries without a response matching "
                         "the required schema") +
             kSafetySuffix;
    }
    return std::string("The decision oracle exhausted its retries without returning valid JSON") +
           kSafetySuffix;
  case ErrorKind::Internal:
    break;
  }
  return std::string("An unexpected internal error occurred while judging the tool call") +
         kSafetySuffix;
}

Json::Value synthesize(const DecisionOutcome &outcome, const Json::Value &tool_parameters) {
  Json::Value envelope = std::visit(
      [&tool_parameters](auto &&value) -> Json::Value {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Decided>) {
          return build_envelope(value.permission, value.reason,
                                value.updated_input.value_or(tool_parameters), value.envelope);
        } else {
          return deny_envelope(deny_reason(value), tool_parameters);
        }
      },
      outcome);

  if (!schema::validate(schema::Shape::Response, envelope).ok()) {
    return deny_envelope(deny_reason(Failed{.kind = ErrorKind::Internal, .detail = ""}),
                         tool_parameters);
  }
  return envelope;
}

} // namespace hookjudge::judge
