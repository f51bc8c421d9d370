#include "hookjudge/judge/types.hpp"

namespace hookjudge::judge {

std::string_view to_string(const Permission permission) {
  switch (permission) {
  case Permission::Allow:
    return "allow";
  case Permission::Deny:
    return "deny";
  case Permission::Ask:
    return "ask";
  }
  return "deny";
}

std::optional<Permission> parse_permission(const std::string_view value) {
  if (value == "allow") {
    return Permission::Allow;
  }
  if (value == "deny") {
    return Permission::Deny;
  }
  if (value == "ask") {
    return Permission::Ask;
  }
  return std::nullopt;
}

DecisionRequest DecisionRequest::from_validated(const Json::Value &document) {
  DecisionRequest request;
  request.session_id = document["session_id"].asString();
  request.tool_name = document["tool_name"].asString();
  request.tool_parameters = document["tool_parameters"];
  request.message_history = document["message_history"];
  request.raw = document;
  return request;
}

std::string_view to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::RequestValidation:
    return "request_validation";
  case ErrorKind::Configuration:
    return "configuration";
  case ErrorKind::Communication:
    return "communication";
  case ErrorKind::DeadlineExceeded:
    return "deadline_exceeded";
  case ErrorKind::RetriesExhausted:
    return "retries_exhausted";
  case ErrorKind::Internal:
    return "internal";
  }
  return "internal";
}

} // namespace hookjudge::judge
