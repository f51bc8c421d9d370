#pragma once

#include "hookjudge/config/config.hpp"
#include "hookjudge/judge/retry_orchestrator.hpp"
#include "hookjudge/judge/types.hpp"
#include "hookjudge/observability/observer.hpp"
#include "hookjudge/oracle/oracle.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace hookjudge::judge {

struct JudgeOptions {
  std::uint32_t max_attempts = kMaxRetryAttempts;
  std::chrono::milliseconds deadline{120'000};
  Clock now;
};

struct Verdict {
  Json::Value envelope;
  DecisionOutcome outcome;
  std::uint32_t oracle_calls = 0;
  /// Empty when the pipeline stopped before the orchestrator ran.
  std::vector<JudgeState> trace;
};

/// One decision per call: strict parse, request schema gate, oracle conversation,
/// fail-closed synthesis. Never throws; every failure becomes a deny envelope.
class Judge {
public:
  Judge(std::shared_ptr<oracle::DecisionOracle> oracle, observability::IObserver &observer,
        JudgeOptions options = {});

  [[nodiscard]] Json::Value decide(const std::string &raw_request,
                                   const config::DecisionConfig &config);
  [[nodiscard]] Verdict evaluate(const std::string &raw_request,
                                 const config::DecisionConfig &config);

  /// Deny envelope for a policy that could not be resolved. The oracle is not used.
  [[nodiscard]] Json::Value reject_configuration(const std::string &message,
                                                 const std::string &raw_request);

private:
  [[nodiscard]] Verdict evaluate_unguarded(const std::string &raw_request,
                                           const config::DecisionConfig &config);
  [[nodiscard]] Verdict finish(DecisionOutcome outcome, const Json::Value &tool_parameters,
                               std::uint32_t oracle_calls, std::vector<JudgeState> trace,
                               std::chrono::steady_clock::time_point started);
  [[nodiscard]] std::chrono::steady_clock::time_point now() const;

  std::shared_ptr<oracle::DecisionOracle> oracle_;
  observability::IObserver &observer_;
  JudgeOptions options_;
};

} // namespace hookjudge::judge
