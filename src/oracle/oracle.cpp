#include "hookjudge/oracle/oracle.hpp"

#include <sstream>

namespace hookjudge::oracle {

std::string OracleError::to_string() const {
  std::ostringstream stream;
  stream << "Oracle error [";
  switch (code) {
  case OracleErrorCode::ApiError:
    stream << "api";
    break;
  case OracleErrorCode::NetworkError:
    stream << "network";
    break;
  case OracleErrorCode::AuthError:
    stream << "auth";
    break;
  case OracleErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case OracleErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case OracleErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

} // namespace hookjudge::oracle
