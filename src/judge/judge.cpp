#include "hookjudge/judge/judge.hpp"

#include "hookjudge/common/json_util.hpp"
#include "hookjudge/judge/result_synthesizer.hpp"
#include "hookjudge/schema/schema_gate.hpp"

#include <exception>
#include <utility>
#include <variant>

namespace hookjudge::judge {

namespace {

std::string outcome_name(const DecisionOutcome &outcome) {
  if (const auto *failed = std::get_if<Failed>(&outcome); failed != nullptr) {
    return std::string(to_string(failed->kind));
  }
  return "decided";
}

/// tool_parameters of a request that passes the request schema, otherwise null.
Json::Value usable_tool_parameters(const std::string &raw_request) {
  auto parsed = common::parse_json(raw_request);
  if (!parsed.ok() || !schema::validate(schema::Shape::Request, parsed.value()).ok()) {
    return Json::Value();
  }
  return parsed.value()["tool_parameters"];
}

} // namespace

Judge::Judge(std::shared_ptr<oracle::DecisionOracle> oracle, observability::IObserver &observer,
             JudgeOptions options)
    : oracle_(std::move(oracle)), observer_(observer), options_(std::move(options)) {}

std::chrono::steady_clock::time_point Judge::now() const {
  return options_.now ? options_.now() : std::chrono::steady_clock::now();
}

Json::Value Judge::decide(const std::string &raw_request, const config::DecisionConfig &config) {
  return evaluate(raw_request, config).envelope;
}

Verdict Judge::evaluate(const std::string &raw_request, const config::DecisionConfig &config) {
  try {
    return evaluate_unguarded(raw_request, config);
  } catch (const std::exception &ex) {
    observer_.record_event(
        observability::ErrorEvent{.component = "judge", .message = std::string(ex.what())});
    Failed failed{.kind = ErrorKind::Internal, .detail = ex.what()};
    Verdict verdict{.envelope = synthesize(failed), .outcome = failed};
    return verdict;
  }
}

Json::Value Judge::reject_configuration(const std::string &message,
                                        const std::string &raw_request) {
  observer_.record_event(observability::ErrorEvent{.component = "config", .message = message});
  return finish(Failed{.kind = ErrorKind::Configuration, .detail = message},
                usable_tool_parameters(raw_request), 0, {}, now())
      .envelope;
}

Verdict Judge::evaluate_unguarded(const std::string &raw_request,
                                  const config::DecisionConfig &config) {
  const auto started = now();

  auto parsed = common::parse_json(raw_request);
  if (!parsed.ok()) {
    return finish(Failed{.kind = ErrorKind::RequestValidation,
                         .detail = "request is not valid JSON: " + parsed.error()},
                  Json::Value(), 0, {}, started);
  }
  const auto gate = schema::validate(schema::Shape::Request, parsed.value());
  if (!gate.ok()) {
    return finish(Failed{.kind = ErrorKind::RequestValidation, .detail = gate.summary()},
                  Json::Value(), 0, {}, started);
  }
  const auto request = DecisionRequest::from_validated(parsed.value());

  const auto config_status = config::validate_decision_config(config);
  if (!config_status.ok()) {
    return finish(Failed{.kind = ErrorKind::Configuration, .detail = config_status.error()},
                  request.tool_parameters, 0, {}, started);
  }
  if (oracle_ == nullptr) {
    return finish(Failed{.kind = ErrorKind::Communication, .detail = "no decision oracle"},
                  request.tool_parameters, 0, {}, started);
  }

  observer_.record_event(observability::JudgeStartEvent{
      .session_id = request.session_id, .tool_name = request.tool_name, .oracle = oracle_->name()});
  if (config.allowed_tools.has_value() && !config.allowed_tools->empty() &&
      !oracle_->supports_tools()) {
    observer_.record_event(observability::WarningEvent{
        .component = "oracle",
        .message = "allowed_tools is set but oracle '" + oracle_->name() +
                   "' cannot run tools; the list is ignored"});
  }

  RetryOrchestrator orchestrator(
      *oracle_, observer_,
      OrchestratorOptions{.max_attempts = options_.max_attempts,
                          .deadline = options_.deadline,
                          .now = options_.now});
  auto result = orchestrator.run(request, config);
  auto outcome = to_outcome(result, request, observer_);
  return finish(std::move(outcome), request.tool_parameters, result.oracle_calls,
                std::move(result.trace), started);
}

Verdict Judge::finish(DecisionOutcome outcome, const Json::Value &tool_parameters,
                      const std::uint32_t oracle_calls, std::vector<JudgeState> trace,
                      const std::chrono::steady_clock::time_point started) {
  if (const auto *failed = std::get_if<Failed>(&outcome); failed != nullptr) {
    observer_.record_event(observability::ErrorEvent{
        .component = "judge",
        .message = std::string(to_string(failed->kind)) + ": " + failed->detail});
  }

  Verdict verdict;
  verdict.envelope = synthesize(outcome, tool_parameters);
  verdict.oracle_calls = oracle_calls;
  verdict.trace = std::move(trace);

  observer_.record_event(observability::DecisionEvent{
      .permission = verdict.envelope["hookSpecificOutput"]["permissionDecision"].asString(),
      .outcome = outcome_name(outcome),
      .oracle_calls = oracle_calls});
  observer_.record_metric(observability::DecisionLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(now() - started)});
  observer_.record_metric(observability::OracleCallsMetric{.calls = oracle_calls});
  observer_.flush();

  verdict.outcome = std::move(outcome);
  return verdict;
}

} // namespace hookjudge::judge
