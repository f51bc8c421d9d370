#pragma once

#include "hookjudge/config/config.hpp"
#include "hookjudge/judge/types.hpp"
#include "hookjudge/schema/schema_gate.hpp"

#include <cstdint>
#include <string>

namespace hookjudge::judge {

/// Fixed validator instructions, both schemas and the output rules, followed by
/// the policy text under a "# Policy" heading.
[[nodiscard]] std::string build_system_prompt(const config::DecisionConfig &config);

[[nodiscard]] std::string build_initial_turn(const DecisionRequest &request);

[[nodiscard]] std::string build_parse_feedback(const std::string &diagnostic,
                                               std::uint32_t next_attempt,
                                               std::uint32_t max_attempts);

[[nodiscard]] std::string build_schema_feedback(const schema::ValidationOutcome &outcome,
                                                std::uint32_t next_attempt,
                                                std::uint32_t max_attempts);

} // namespace hookjudge::judge
