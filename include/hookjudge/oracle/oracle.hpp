#pragma once

#include "hookjudge/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hookjudge::oracle {

enum class OracleErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  InvalidResponse,
  Timeout,
};

struct OracleError {
  OracleErrorCode code = OracleErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

struct Turn {
  std::string role; // "user" or "assistant"
  std::string content;
};

struct OracleRequest {
  std::string system_prompt;
  std::vector<Turn> turns;
  std::optional<std::string> model;
  std::vector<std::string> allowed_tools;
  std::chrono::milliseconds timeout{30'000};
};

/// The external reasoning service. Every call carries the full turn history;
/// implementations keep no conversation state between calls. A failure result
/// means the exchange itself broke (transport, auth, empty body), not that the
/// answer was poor.
class DecisionOracle {
public:
  virtual ~DecisionOracle() = default;

  [[nodiscard]] virtual common::Result<std::string> send(const OracleRequest &request) = 0;
  [[nodiscard]] virtual std::string name() const = 0;

  /// Whether the oracle can run the tools named in OracleRequest::allowed_tools.
  [[nodiscard]] virtual bool supports_tools() const { return false; }
};

} // namespace hookjudge::oracle
