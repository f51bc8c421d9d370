#include "hookjudge/oracle/anthropic.hpp"

#include "hookjudge/common/fs.hpp"
#include "hookjudge/common/json_util.hpp"

#include <algorithm>
#include <cstdint>

namespace hookjudge::oracle {

namespace {

constexpr int kMaxTokens = 1024;

common::Status validate_status(const HttpResponse &response) {
  if (response.timeout) {
    return common::Status::error(
        OracleError{.code = OracleErrorCode::Timeout, .message = "request timed out"}.to_string());
  }
  if (response.network_error) {
    return common::Status::error(OracleError{.code = OracleErrorCode::NetworkError,
                                             .message = response.network_error_message}
                                     .to_string());
  }
  if (response.status == 401 || response.status == 403) {
    return common::Status::error(
        OracleError{.code = OracleErrorCode::AuthError, .status = response.status}.to_string());
  }
  if (response.status == 429) {
    return common::Status::error(
        OracleError{.code = OracleErrorCode::RateLimitError, .status = response.status}
            .to_string());
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Status::error(
        OracleError{.code = OracleErrorCode::ApiError, .status = response.status}.to_string());
  }
  return common::Status::success();
}

} // namespace

std::string resolve_model_alias(const std::string &model) {
  const std::string alias = common::to_lower(common::trim(model));
  if (alias == "sonnet") {
    return "claude-sonnet-4-20250514";
  }
  if (alias == "opus") {
    return "claude-opus-4-20250514";
  }
  if (alias == "haiku") {
    return "claude-3-5-haiku-20241022";
  }
  return model;
}

common::Result<std::string> parse_anthropic_text(const std::string &body) {
  auto parsed = common::parse_json(body);
  if (!parsed.ok()) {
    return common::Result<std::string>::failure("response body is not JSON: " + parsed.error());
  }
  const Json::Value &root = parsed.value();
  if (!root.isObject() || !root["content"].isArray()) {
    return common::Result<std::string>::failure("content field missing");
  }

  std::string text;
  for (const auto &block : root["content"]) {
    if (block.isObject() && block["type"].asString() == "text" && block["text"].isString()) {
      text += block["text"].asString();
    }
  }
  return common::Result<std::string>::success(text);
}

AnthropicOracle::AnthropicOracle(std::string api_key, std::string base_url,
                                 std::string default_model,
                                 std::shared_ptr<HttpClient> http_client)
    : api_key_(std::move(api_key)), base_url_(std::move(base_url)),
      default_model_(std::move(default_model)), http_client_(std::move(http_client)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string AnthropicOracle::build_body(const OracleRequest &request) const {
  Json::Value body(Json::objectValue);
  body["model"] = resolve_model_alias(request.model.value_or(default_model_));
  body["max_tokens"] = kMaxTokens;
  body["temperature"] = 0.0;
  if (!request.system_prompt.empty()) {
    body["system"] = request.system_prompt;
  }

  Json::Value messages(Json::arrayValue);
  for (const auto &turn : request.turns) {
    Json::Value message(Json::objectValue);
    message["role"] = turn.role;
    message["content"] = turn.content;
    messages.append(message);
  }
  body["messages"] = messages;
  return common::dump_json(body);
}

common::Result<std::string> AnthropicOracle::send(const OracleRequest &request) {
  if (api_key_.empty()) {
    return common::Result<std::string>::failure(
        OracleError{.code = OracleErrorCode::AuthError, .message = "missing API key"}.to_string());
  }
  if (request.turns.empty()) {
    return common::Result<std::string>::failure(
        OracleError{.code = OracleErrorCode::ApiError, .message = "no turns to send"}.to_string());
  }

  const auto timeout_ms = static_cast<std::uint64_t>(std::max<std::int64_t>(
      1, static_cast<std::int64_t>(request.timeout.count())));
  const auto response =
      http_client_->post_json(messages_url(), build_headers(), build_body(request), timeout_ms);

  const auto status = validate_status(response);
  if (!status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }

  auto text = parse_anthropic_text(response.body);
  if (!text.ok()) {
    return common::Result<std::string>::failure(
        OracleError{.code = OracleErrorCode::InvalidResponse, .message = text.error()}.to_string());
  }
  if (common::trim(text.value()).empty()) {
    return common::Result<std::string>::failure(
        OracleError{.code = OracleErrorCode::InvalidResponse, .message = "response has no text"}
            .to_string());
  }
  return text;
}

std::unordered_map<std::string, std::string> AnthropicOracle::build_headers() const {
  return {
      {"Content-Type", "application/json"},
      {"anthropic-version", "2023-06-01"},
      {"x-api-key", api_key_},
  };
}

std::string AnthropicOracle::messages_url() const { return base_url_ + "/v1/messages"; }

} // namespace hookjudge::oracle
