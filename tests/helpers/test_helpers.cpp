#include "tests/helpers/test_helpers.hpp"

#include "hookjudge/common/json_util.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <stdexcept>

namespace hookjudge::testing {

ScriptedOracle::ScriptedOracle(std::vector<common::Result<std::string>> replies,
                               bool supports_tools)
    : replies_(std::move(replies)), supports_tools_(supports_tools) {}

common::Result<std::string> ScriptedOracle::send(const oracle::OracleRequest &request) {
  const std::size_t index = requests_.size();
  requests_.push_back(request);
  if (on_send) {
    on_send(index);
  }
  if (index >= replies_.size()) {
    return common::Result<std::string>::failure("script exhausted");
  }
  return replies_[index];
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  events.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  metrics.push_back(metric);
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("hookjudge-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempWorkspace::create_file(const std::string &name,
                                                 const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc | std::ios::binary);
  out << content;
  return file_path;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

config::DecisionConfig test_config() {
  config::DecisionConfig config;
  config.prompt = "Deny destructive shell commands. Allow read-only inspection.";
  return config;
}

Json::Value request_document(const std::string &tool_name, const std::string &command) {
  Json::Value request(Json::objectValue);
  request["session_id"] = "session-1";
  request["hook_event_name"] = "PreToolUse";
  request["tool_name"] = tool_name;
  request["tool_parameters"] = Json::Value(Json::objectValue);
  request["tool_parameters"]["command"] = command;
  request["message_history"] = Json::Value(Json::arrayValue);
  Json::Value turn(Json::objectValue);
  turn["role"] = "user";
  turn["content"] = "list the files";
  request["message_history"].append(turn);
  return request;
}

std::string request_text(const std::string &tool_name, const std::string &command) {
  return common::dump_json(request_document(tool_name, command));
}

std::string allow_answer(const std::string &reason) {
  return R"({"permissionDecision": "allow", "permissionDecisionReason": ")" + reason + R"("})";
}

common::Result<std::string> reply(std::string text) {
  return common::Result<std::string>::success(std::move(text));
}

common::Result<std::string> broken(std::string message) {
  return common::Result<std::string>::failure(std::move(message));
}

Json::Value parse_or_throw(const std::string &text) {
  auto parsed = common::parse_json(text);
  if (!parsed.ok()) {
    throw std::runtime_error("invalid JSON in test: " + parsed.error());
  }
  return parsed.take();
}

} // namespace hookjudge::testing
