#include "hookjudge/judge/retry_orchestrator.hpp"

#include "hookjudge/common/fs.hpp"
#include "hookjudge/judge/prompts.hpp"
#include "hookjudge/judge/response_parser.hpp"
#include "hookjudge/schema/schema_gate.hpp"

#include <algorithm>
#include <utility>

namespace hookjudge::judge {

namespace {

struct ConversationState {
  oracle::OracleRequest request;
  std::uint32_t invalid_answers = 0;
  std::string last_text;
  Json::Value candidate;
};

} // namespace

std::string_view to_string(const JudgeState state) {
  switch (state) {
  case JudgeState::Init:
    return "init";
  case JudgeState::AwaitOracle:
    return "await_oracle";
  case JudgeState::Parse:
    return "parse";
  case JudgeState::Validate:
    return "validate";
  case JudgeState::Feedback:
    return "feedback";
  case JudgeState::Success:
    return "success";
  case JudgeState::Exhausted:
    return "exhausted";
  case JudgeState::Fatal:
    return "fatal";
  }
  return "fatal";
}

bool is_terminal(const JudgeState state) {
  return state == JudgeState::Success || state == JudgeState::Exhausted ||
         state == JudgeState::Fatal;
}

RetryOrchestrator::RetryOrchestrator(oracle::DecisionOracle &oracle,
                                     observability::IObserver &observer,
                                     OrchestratorOptions options)
    : oracle_(oracle), observer_(observer), options_(std::move(options)) {
  options_.max_attempts = std::max<std::uint32_t>(1, options_.max_attempts);
  options_.deadline = std::min(options_.deadline, config::kMaxDeadline);
}

std::chrono::steady_clock::time_point RetryOrchestrator::now() const {
  return options_.now ? options_.now() : std::chrono::steady_clock::now();
}

JudgeResult RetryOrchestrator::run(const DecisionRequest &request,
                                   const config::DecisionConfig &config) {
  JudgeResult result;
  ConversationState conversation;
  const auto started = now();
  const auto deadline_at = started + options_.deadline;

  result.trace.push_back(JudgeState::Init);
  auto enter = [&result](const JudgeState next) {
    result.state = next;
    result.trace.push_back(next);
  };
  auto fail = [&](const FatalCause cause, std::string detail) {
    result.fatal_cause = cause;
    result.detail = std::move(detail);
    enter(JudgeState::Fatal);
  };
  auto reject_content = [&](const std::string &stage, const std::string &detail,
                            std::string feedback) {
    ++conversation.invalid_answers;
    result.attempts = conversation.invalid_answers;
    result.detail = stage + ": " + detail;
    observer_.record_event(observability::ValidationFailureEvent{
        .attempt = result.oracle_calls, .stage = stage, .detail = detail});
    if (conversation.invalid_answers >= options_.max_attempts) {
      enter(JudgeState::Exhausted);
      return;
    }
    result.feedback.push_back(std::move(feedback));
    enter(JudgeState::Feedback);
  };

  conversation.request.system_prompt = build_system_prompt(config);
  conversation.request.model = config.model;
  conversation.request.allowed_tools = config.allowed_tools.value_or(std::vector<std::string>{});
  conversation.request.turns.push_back({.role = "user", .content = build_initial_turn(request)});
  enter(JudgeState::AwaitOracle);

  while (!is_terminal(result.state)) {
    switch (result.state) {
    case JudgeState::AwaitOracle: {
      const auto call_started = now();
      if (call_started >= deadline_at) {
        fail(FatalCause::Deadline, "decision deadline expired before oracle call");
        break;
      }
      conversation.request.timeout =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline_at - call_started);
      if (conversation.request.timeout.count() <= 0) {
        fail(FatalCause::Deadline, "decision deadline expired before oracle call");
        break;
      }

      ++result.oracle_calls;
      auto reply = oracle_.send(conversation.request);
      const auto call_finished = now();
      const bool has_text = reply.ok() && !common::trim(reply.value()).empty();
      observer_.record_event(observability::OracleCallEvent{
          .attempt = result.oracle_calls,
          .duration =
              std::chrono::duration_cast<std::chrono::milliseconds>(call_finished - call_started),
          .success = has_text});

      if (call_finished > deadline_at) {
        fail(FatalCause::Deadline, "decision deadline expired during oracle call");
        break;
      }
      if (!reply.ok()) {
        fail(FatalCause::Communication, reply.error());
        break;
      }
      if (!has_text) {
        fail(FatalCause::Communication, "oracle returned no content");
        break;
      }
      conversation.last_text = reply.take();
      conversation.request.turns.push_back(
          {.role = "assistant", .content = conversation.last_text});
      enter(JudgeState::Parse);
      break;
    }
    case JudgeState::Parse: {
      auto parsed = extract_decision(conversation.last_text);
      if (!parsed.ok()) {
        reject_content("parse", parsed.error(),
                       build_parse_feedback(parsed.error(), conversation.invalid_answers + 2,
                                            options_.max_attempts));
        break;
      }
      conversation.candidate = normalize_decision(parsed.value());
      enter(JudgeState::Validate);
      break;
    }
    case JudgeState::Validate: {
      const auto outcome = schema::validate(schema::Shape::Response, conversation.candidate);
      if (outcome.ok()) {
        result.candidate = conversation.candidate;
        result.detail.clear();
        enter(JudgeState::Success);
        break;
      }
      reject_content("schema", outcome.summary(),
                     build_schema_feedback(outcome, conversation.invalid_answers + 2,
                                           options_.max_attempts));
      break;
    }
    case JudgeState::Feedback:
      conversation.request.turns.push_back({.role = "user", .content = result.feedback.back()});
      enter(JudgeState::AwaitOracle);
      break;
    case JudgeState::Init:
    case JudgeState::Success:
    case JudgeState::Exhausted:
    case JudgeState::Fatal:
      break;
    }
  }

  return result;
}

} // namespace hookjudge::judge
