#pragma once

#include "hookjudge/judge/retry_orchestrator.hpp"
#include "hookjudge/judge/types.hpp"
#include "hookjudge/observability/observer.hpp"

#include <json/json.h>

#include <string>

namespace hookjudge::judge {

/// Maps a finished orchestrator run onto an outcome. updated_input is always the
/// request's tool_parameters; an oracle echo that differs is reported and dropped.
[[nodiscard]] DecisionOutcome to_outcome(const JudgeResult &result, const DecisionRequest &request,
                                         observability::IObserver &observer);

/// Fixed, cause-specific reason text for a failed decision.
[[nodiscard]] std::string deny_reason(const Failed &failed);

/// Builds the response envelope. Total: any outcome yields a schema-valid
/// envelope, failures always as deny. `tool_parameters` is used for updatedInput
/// when the outcome carries none; a non-object value becomes {}.
[[nodiscard]] Json::Value synthesize(const DecisionOutcome &outcome,
                                     const Json::Value &tool_parameters = Json::Value());

} // namespace hookjudge::judge
