#pragma once

#include "hookjudge/common/result.hpp"

#include <json/json.h>

#include <string>

namespace hookjudge::judge {

/// Finds the single JSON object in free oracle text. Prose around the object and
/// one ```/```json fence are tolerated. Zero objects, several objects or an
/// unterminated fence fail with a diagnostic meant to be shown back to the oracle.
[[nodiscard]] common::Result<Json::Value> extract_decision(const std::string &oracle_text);

/// Wraps a flat {permissionDecision, permissionDecisionReason} answer into the
/// hookSpecificOutput envelope. Decision fields are moved, never invented.
[[nodiscard]] Json::Value normalize_decision(const Json::Value &candidate);

} // namespace hookjudge::judge
