#pragma once

#include "hookjudge/config/config.hpp"
#include "hookjudge/oracle/http_client.hpp"
#include "hookjudge/oracle/oracle.hpp"

#include <memory>

namespace hookjudge::oracle {

/// Builds the Anthropic-backed oracle from process settings. A missing API key is
/// not an error here; the first send() reports it as a communication failure.
[[nodiscard]] std::shared_ptr<DecisionOracle>
create_oracle(const config::RuntimeSettings &settings,
              std::shared_ptr<HttpClient> http_client = nullptr);

} // namespace hookjudge::oracle
