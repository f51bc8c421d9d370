#pragma once

#include "hookjudge/config/config.hpp"
#include "hookjudge/judge/types.hpp"
#include "hookjudge/observability/observer.hpp"
#include "hookjudge/oracle/oracle.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hookjudge::judge {

inline constexpr std::uint32_t kMaxRetryAttempts = 3;

enum class JudgeState {
  Init,
  AwaitOracle,
  Parse,
  Validate,
  Feedback,
  Success,
  Exhausted,
  Fatal,
};

[[nodiscard]] std::string_view to_string(JudgeState state);
[[nodiscard]] bool is_terminal(JudgeState state);

enum class FatalCause {
  None,
  Communication,
  Deadline,
};

using Clock = std::function<std::chrono::steady_clock::time_point()>;

struct OrchestratorOptions {
  std::uint32_t max_attempts = kMaxRetryAttempts;
  std::chrono::milliseconds deadline{120'000};
  /// Defaults to std::chrono::steady_clock::now when empty.
  Clock now;
};

struct JudgeResult {
  JudgeState state = JudgeState::Init;
  /// Set only in Success: the normalized, schema-valid oracle answer.
  std::optional<Json::Value> candidate;
  FatalCause fatal_cause = FatalCause::None;
  /// Internal diagnostic of the last failure. Logged, never put into a response.
  std::string detail;
  std::uint32_t oracle_calls = 0;
  /// Number of content-invalid answers seen.
  std::uint32_t attempts = 0;
  std::vector<JudgeState> trace;
  /// Corrective turns sent back to the oracle, in order.
  std::vector<std::string> feedback;
};

/// Drives one decision conversation with the oracle. Content defects (unparsable
/// or schema-invalid answers) are fed back and retried up to max_attempts; a
/// broken exchange or an expired deadline ends the run immediately. The turn
/// history lives only inside run() and is discarded when it returns.
class RetryOrchestrator {
public:
  RetryOrchestrator(oracle::DecisionOracle &oracle, observability::IObserver &observer,
                    OrchestratorOptions options = {});

  [[nodiscard]] JudgeResult run(const DecisionRequest &request,
                                const config::DecisionConfig &config);

  [[nodiscard]] std::uint32_t max_attempts() const { return options_.max_attempts; }

private:
  [[nodiscard]] std::chrono::steady_clock::time_point now() const;

  oracle::DecisionOracle &oracle_;
  observability::IObserver &observer_;
  OrchestratorOptions options_;
};

} // namespace hookjudge::judge
