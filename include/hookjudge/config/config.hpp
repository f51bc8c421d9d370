#pragma once

#include "hookjudge/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hookjudge::config {

inline constexpr const char *kDefaultPolicy = "validate_bq_query";

/// Policy handed to the oracle. Read-only for the lifetime of one decision.
struct DecisionConfig {
  std::string prompt;
  std::optional<std::string> model;
  std::optional<std::vector<std::string>> allowed_tools;
};

struct BuiltinPolicy {
  std::string name;
};

struct PolicyFile {
  std::filesystem::path path;
};

using ConfigSelector = std::variant<BuiltinPolicy, PolicyFile>;

[[nodiscard]] std::string describe(const ConfigSelector &selector);

[[nodiscard]] common::Result<DecisionConfig> load_builtin_config(const std::string &name);
[[nodiscard]] common::Result<DecisionConfig> load_config_file(const std::filesystem::path &path);
[[nodiscard]] common::Result<DecisionConfig> resolve_config(const ConfigSelector &selector);

/// Checks prompt/model/allowed_tools constraints shared by built-in and file policies.
[[nodiscard]] common::Status validate_decision_config(const DecisionConfig &config);

[[nodiscard]] std::vector<std::string> builtin_policy_names();

/// Upper bound on the decision deadline; larger values are treated as malformed.
inline constexpr std::chrono::milliseconds kMaxDeadline = std::chrono::hours(24);

/// Process settings taken from the environment rather than from a policy.
struct RuntimeSettings {
  std::chrono::milliseconds deadline{120'000};
  std::string log_backend = "log";
  std::optional<std::string> default_model;
  std::string api_key;
  std::string base_url = "https://api.anthropic.com";
};

void apply_env_overrides(RuntimeSettings &settings);
[[nodiscard]] RuntimeSettings load_runtime_settings();

} // namespace hookjudge::config
