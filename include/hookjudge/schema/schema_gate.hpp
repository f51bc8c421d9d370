#pragma once

#include <json/json.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hookjudge::schema {

/// The two fixed document shapes the gate knows about.
enum class Shape {
  Request,
  Response,
};

struct Violation {
  std::string path;       // "$.hookSpecificOutput.permissionDecision"
  std::string constraint; // type | required | enum | const | additionalProperties | minLength
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

class ValidationOutcome {
public:
  static ValidationOutcome valid() { return ValidationOutcome(std::vector<Violation>{}); }
  static ValidationOutcome invalid(std::vector<Violation> violations) {
    return ValidationOutcome(std::move(violations));
  }

  [[nodiscard]] bool ok() const { return violations_.empty(); }
  [[nodiscard]] const std::vector<Violation> &violations() const { return violations_; }

  /// "path: message; path: message" on one line.
  [[nodiscard]] std::string summary() const;

  friend bool operator==(const ValidationOutcome &lhs, const ValidationOutcome &rhs);

private:
  explicit ValidationOutcome(std::vector<Violation> violations)
      : violations_(std::move(violations)) {}

  std::vector<Violation> violations_;
};

bool operator==(const Violation &lhs, const Violation &rhs);

/// Validates an already-parsed document against the fixed schema for `shape`.
/// Pure and deterministic; every violation is collected.
[[nodiscard]] ValidationOutcome validate(Shape shape, const Json::Value &value);

/// Validates against an arbitrary schema written in the supported draft-07 subset.
[[nodiscard]] ValidationOutcome validate_against(const Json::Value &schema,
                                                 const Json::Value &value);

[[nodiscard]] const Json::Value &schema_for(Shape shape);
[[nodiscard]] std::string_view schema_text(Shape shape);
[[nodiscard]] std::string_view shape_name(Shape shape);

} // namespace hookjudge::schema
