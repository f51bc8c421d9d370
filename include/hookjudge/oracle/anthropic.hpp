#pragma once

#include "hookjudge/oracle/http_client.hpp"
#include "hookjudge/oracle/oracle.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace hookjudge::oracle {

inline constexpr const char *kDefaultAnthropicBaseUrl = "https://api.anthropic.com";
inline constexpr const char *kDefaultModel = "claude-sonnet-4-20250514";

/// Maps the short policy aliases (sonnet, opus, haiku) to full model ids;
/// anything else is returned unchanged.
[[nodiscard]] std::string resolve_model_alias(const std::string &model);

/// Decision oracle backed by the Anthropic Messages API.
class AnthropicOracle final : public DecisionOracle {
public:
  AnthropicOracle(std::string api_key, std::string base_url = kDefaultAnthropicBaseUrl,
                  std::string default_model = kDefaultModel,
                  std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

  [[nodiscard]] common::Result<std::string> send(const OracleRequest &request) override;
  [[nodiscard]] std::string name() const override { return "anthropic"; }

  [[nodiscard]] std::string build_body(const OracleRequest &request) const;

private:
  [[nodiscard]] std::unordered_map<std::string, std::string> build_headers() const;
  [[nodiscard]] std::string messages_url() const;

  std::string api_key_;
  std::string base_url_;
  std::string default_model_;
  std::shared_ptr<HttpClient> http_client_;
};

/// Concatenates every text block of a Messages API response body.
[[nodiscard]] common::Result<std::string> parse_anthropic_text(const std::string &body);

} // namespace hookjudge::oracle
