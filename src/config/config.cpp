#include "hookjudge/config/config.hpp"

#include "hookjudge/common/fs.hpp"
#include "hookjudge/common/toml.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <set>
#include <string_view>

namespace hookjudge::config {

namespace {

struct BuiltinEntry {
  std::string_view name;
  std::string_view prompt;
};

constexpr std::string_view kValidateBqQueryPrompt = R"(You review BigQuery access requested by a coding agent.

Decide per tool call:
- Bash running `bq query` (or an equivalent client) with a read-only statement
  (SELECT, WITH ... SELECT, EXPLAIN, INFORMATION_SCHEMA lookups): "allow".
- Any statement that changes data or schema (INSERT, UPDATE, DELETE, MERGE, TRUNCATE,
  CREATE, ALTER, DROP, GRANT, REVOKE, EXPORT DATA, CALL of procedures with side effects):
  "deny" and name the statement type in the reason.
- `bq` subcommands that modify resources (rm, mk, load, cp, update, insert, truncate):
  "deny".
- Read-only queries that scan whole tables without a LIMIT or partition filter, or that
  touch datasets that look like production billing or personal data: "ask".
- Tool calls that are not BigQuery related: "allow" unless they are plainly destructive.

Keep the reason to one sentence.)";

constexpr std::string_view kStrictShellPrompt = R"(You review shell commands requested by a coding agent.

Decide per tool call:
- Read-only inspection (ls, cat, grep, find without -delete, git status/log/diff): "allow".
- Builds and tests inside the project directory: "allow".
- Deleting files recursively, rewriting git history, force pushes, sudo, changing
  permissions or ownership outside the project, piping downloaded content into a shell,
  or touching credentials (~/.ssh, ~/.aws, .env files): "deny".
- Package installation, network access to unknown hosts, or anything whose effect you
  cannot determine from the command alone: "ask".

Keep the reason to one sentence.)";

constexpr std::array<BuiltinEntry, 2> kBuiltins = {{
    {"validate_bq_query", kValidateBqQueryPrompt},
    {"strict_shell", kStrictShellPrompt},
}};

const std::set<std::string> &known_file_keys() {
  static const std::set<std::string> keys = {"prompt", "model", "allowed_tools"};
  return keys;
}

bool is_known_model(const std::string &model) {
  const std::string normalized = common::to_lower(common::trim(model));
  return normalized == "sonnet" || normalized == "opus" || normalized == "haiku" ||
         common::starts_with(normalized, "claude-");
}

common::Result<DecisionConfig> config_from_toml(const common::TomlDocument &doc) {
  for (const auto &key : doc.keys()) {
    if (!known_file_keys().contains(key)) {
      return common::Result<DecisionConfig>::failure("unknown key '" + key + "'");
    }
  }

  if (!doc.has("prompt")) {
    return common::Result<DecisionConfig>::failure("'prompt' is a required property");
  }
  if (!doc.is_string("prompt")) {
    return common::Result<DecisionConfig>::failure("'prompt' must be a string");
  }

  DecisionConfig config;
  config.prompt = doc.get_string("prompt");

  if (doc.has("model")) {
    if (!doc.is_string("model")) {
      return common::Result<DecisionConfig>::failure("'model' must be a string");
    }
    config.model = doc.get_string("model");
  }

  if (doc.has("allowed_tools")) {
    if (!doc.is_string_array("allowed_tools")) {
      return common::Result<DecisionConfig>::failure("'allowed_tools' must be an array of strings");
    }
    config.allowed_tools = doc.get_string_array("allowed_tools");
  }

  return common::Result<DecisionConfig>::success(std::move(config));
}

} // namespace

std::string describe(const ConfigSelector &selector) {
  if (const auto *builtin = std::get_if<BuiltinPolicy>(&selector); builtin != nullptr) {
    return "builtin:" + builtin->name;
  }
  return "file:" + std::get<PolicyFile>(selector).path.string();
}

common::Status validate_decision_config(const DecisionConfig &config) {
  if (common::trim(config.prompt).empty()) {
    return common::Status::error("'prompt' must not be empty");
  }
  if (config.model.has_value() && !is_known_model(*config.model)) {
    return common::Status::error("'model' must be sonnet, opus, haiku or a claude- model id, got '" +
                                 *config.model + "'");
  }
  if (config.allowed_tools.has_value()) {
    for (const auto &tool : *config.allowed_tools) {
      if (common::trim(tool).empty()) {
        return common::Status::error("'allowed_tools' entries must not be empty");
      }
    }
  }
  return common::Status::success();
}

std::vector<std::string> builtin_policy_names() {
  std::vector<std::string> names;
  names.reserve(kBuiltins.size());
  for (const auto &entry : kBuiltins) {
    names.emplace_back(entry.name);
  }
  return names;
}

common::Result<DecisionConfig> load_builtin_config(const std::string &name) {
  for (const auto &entry : kBuiltins) {
    if (entry.name != name) {
      continue;
    }
    DecisionConfig config;
    config.prompt = std::string(entry.prompt);
    const auto status = validate_decision_config(config);
    if (!status.ok()) {
      return common::Result<DecisionConfig>::failure("Validation failed for builtin config '" +
                                                     name + "': " + status.error());
    }
    return common::Result<DecisionConfig>::success(std::move(config));
  }
  return common::Result<DecisionConfig>::failure("Builtin config '" + name + "' not found");
}

common::Result<DecisionConfig> load_config_file(const std::filesystem::path &path) {
  const std::filesystem::path resolved(common::expand_path(path.string()));
  std::error_code ec;
  if (!std::filesystem::exists(resolved, ec)) {
    return common::Result<DecisionConfig>::failure("Config file '" + resolved.string() +
                                                   "' not found");
  }
  if (!std::filesystem::is_regular_file(resolved, ec)) {
    return common::Result<DecisionConfig>::failure("Failed to read config file '" +
                                                   resolved.string() + "': not a regular file");
  }

  auto content = common::read_text_file(resolved);
  if (!content.ok()) {
    return common::Result<DecisionConfig>::failure("Failed to read config file '" +
                                                   resolved.string() + "': " + content.error());
  }
  if (common::trim(content.value()).empty()) {
    return common::Result<DecisionConfig>::failure("Config file '" + resolved.string() +
                                                   "' is empty");
  }

  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<DecisionConfig>::failure("Failed to parse config file '" +
                                                   resolved.string() + "': " + parsed.error());
  }
  if (parsed.value().values.empty()) {
    return common::Result<DecisionConfig>::failure("Config file '" + resolved.string() +
                                                   "' is empty");
  }

  auto config = config_from_toml(parsed.value());
  if (!config.ok()) {
    return common::Result<DecisionConfig>::failure("Validation failed for config file '" +
                                                   resolved.string() + "': " + config.error());
  }
  const auto status = validate_decision_config(config.value());
  if (!status.ok()) {
    return common::Result<DecisionConfig>::failure("Validation failed for config file '" +
                                                   resolved.string() + "': " + status.error());
  }
  return config;
}

common::Result<DecisionConfig> resolve_config(const ConfigSelector &selector) {
  if (const auto *builtin = std::get_if<BuiltinPolicy>(&selector); builtin != nullptr) {
    return load_builtin_config(builtin->name);
  }
  return load_config_file(std::get<PolicyFile>(selector).path);
}

void apply_env_overrides(RuntimeSettings &settings) {
  if (const char *deadline = std::getenv("HOOKJUDGE_DEADLINE_MS");
      deadline != nullptr && *deadline != '\0') {
    const std::string raw = common::trim(deadline);
    std::uint64_t parsed = 0;
    const auto *first = raw.data();
    const auto *last = first + raw.size();
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc() && ptr == last && parsed > 0 &&
        parsed <= static_cast<std::uint64_t>(kMaxDeadline.count())) {
      settings.deadline = std::chrono::milliseconds(parsed);
    }
  }
  if (const char *log = std::getenv("HOOKJUDGE_LOG"); log != nullptr && *log != '\0') {
    settings.log_backend = log;
  }
  if (const char *model = std::getenv("HOOKJUDGE_MODEL"); model != nullptr && *model != '\0') {
    settings.default_model = std::string(model);
  }
  if (const char *key = std::getenv("ANTHROPIC_API_KEY"); key != nullptr) {
    settings.api_key = key;
  }
  if (const char *url = std::getenv("ANTHROPIC_BASE_URL"); url != nullptr && *url != '\0') {
    settings.base_url = url;
  }
}

RuntimeSettings load_runtime_settings() {
  RuntimeSettings settings;
  apply_env_overrides(settings);
  return settings;
}

} // namespace hookjudge::config
