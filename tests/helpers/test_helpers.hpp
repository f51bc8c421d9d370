#pragma once

#include "hookjudge/common/result.hpp"
#include "hookjudge/config/config.hpp"
#include "hookjudge/judge/retry_orchestrator.hpp"
#include "hookjudge/observability/observer.hpp"
#include "hookjudge/oracle/oracle.hpp"

#include <json/json.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hookjudge::testing {

/// Oracle that replays a fixed list of replies and records every request.
/// Calls past the end of the script fail as a communication error.
class ScriptedOracle final : public oracle::DecisionOracle {
public:
  explicit ScriptedOracle(std::vector<common::Result<std::string>> replies,
                          bool supports_tools = false);

  [[nodiscard]] common::Result<std::string> send(const oracle::OracleRequest &request) override;
  [[nodiscard]] std::string name() const override { return "scripted"; }
  [[nodiscard]] bool supports_tools() const override { return supports_tools_; }

  [[nodiscard]] std::size_t calls() const { return requests_.size(); }
  [[nodiscard]] const std::vector<oracle::OracleRequest> &requests() const { return requests_; }

  /// Runs before each reply is returned; used to move a fake clock.
  std::function<void(std::size_t call_index)> on_send;

private:
  std::vector<common::Result<std::string>> replies_;
  std::vector<oracle::OracleRequest> requests_;
  bool supports_tools_;
};

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  template <typename T> [[nodiscard]] std::vector<T> events_of() const {
    std::vector<T> out;
    for (const auto &event : events) {
      if (const auto *typed = std::get_if<T>(&event); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;
};

class FakeClock {
public:
  [[nodiscard]] std::chrono::steady_clock::time_point now() const { return now_; }
  void advance(std::chrono::milliseconds delta) { now_ += delta; }
  [[nodiscard]] judge::Clock as_clock() {
    return [this] { return now_; };
  }

private:
  std::chrono::steady_clock::time_point now_{std::chrono::hours(1)};
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::filesystem::path create_file(const std::string &name,
                                                  const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

[[nodiscard]] config::DecisionConfig test_config();

/// Schema-valid request document.
[[nodiscard]] Json::Value request_document(const std::string &tool_name = "Bash",
                                          const std::string &command = "ls -la");
[[nodiscard]] std::string request_text(const std::string &tool_name = "Bash",
                                       const std::string &command = "ls -la");

[[nodiscard]] std::string allow_answer(const std::string &reason = "read-only");

[[nodiscard]] common::Result<std::string> reply(std::string text);
[[nodiscard]] common::Result<std::string> broken(std::string message);

[[nodiscard]] Json::Value parse_or_throw(const std::string &text);

} // namespace hookjudge::testing
