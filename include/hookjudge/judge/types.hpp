#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hookjudge::judge {

inline constexpr const char *kHookEventName = "PreToolUse";

enum class Permission {
  Allow,
  Deny,
  Ask,
};

[[nodiscard]] std::string_view to_string(Permission permission);
[[nodiscard]] std::optional<Permission> parse_permission(std::string_view value);

/// A request that already passed the request schema. Fields are copied out of
/// the validated document, nothing is defaulted.
struct DecisionRequest {
  std::string session_id;
  std::string tool_name;
  Json::Value tool_parameters;
  Json::Value message_history;
  Json::Value raw;

  /// Only meaningful on a document that passed schema::validate(Shape::Request).
  [[nodiscard]] static DecisionRequest from_validated(const Json::Value &document);
};

enum class ErrorKind {
  RequestValidation,
  Configuration,
  Communication,
  DeadlineExceeded,
  RetriesExhausted,
  Internal,
};

[[nodiscard]] std::string_view to_string(ErrorKind kind);

struct Decided {
  Permission permission = Permission::Deny;
  std::string reason;
  std::optional<Json::Value> updated_input;
  /// The validated response envelope as the oracle produced it.
  Json::Value envelope;
};

struct Failed {
  ErrorKind kind = ErrorKind::Internal;
  std::string detail;
};

using DecisionOutcome = std::variant<Decided, Failed>;

} // namespace hookjudge::judge
