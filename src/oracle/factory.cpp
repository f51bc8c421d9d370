#include "hookjudge/oracle/factory.hpp"

#include "hookjudge/common/fs.hpp"
#include "hookjudge/oracle/anthropic.hpp"

namespace hookjudge::oracle {

std::shared_ptr<DecisionOracle> create_oracle(const config::RuntimeSettings &settings,
                                              std::shared_ptr<HttpClient> http_client) {
  if (http_client == nullptr) {
    http_client = std::make_shared<CurlHttpClient>();
  }
  const std::string base_url =
      common::trim(settings.base_url).empty() ? kDefaultAnthropicBaseUrl : settings.base_url;
  const std::string model = settings.default_model.has_value()
                                ? resolve_model_alias(*settings.default_model)
                                : std::string(kDefaultModel);
  return std::make_shared<AnthropicOracle>(common::trim(settings.api_key), base_url, model,
                                           std::move(http_client));
}

} // namespace hookjudge::oracle
