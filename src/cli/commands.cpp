#include "hookjudge/cli/commands.hpp"

#include "hookjudge/common/fs.hpp"
#include "hookjudge/common/json_util.hpp"
#include "hookjudge/judge/judge.hpp"
#include "hookjudge/judge/result_synthesizer.hpp"
#include "hookjudge/observability/factory.hpp"
#include "hookjudge/oracle/factory.hpp"

#include <exception>
#include <iostream>
#include <iterator>
#include <optional>

namespace hookjudge::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// Handles "--name VALUE" and "--name=VALUE". Returns false when `args[i]` is not
/// this option; `error` is set when it is but has no value.
bool take_value(const std::vector<std::string> &args, std::size_t &i, const std::string &name,
                std::optional<std::string> &out_value, std::string &error) {
  const std::string &arg = args[i];
  if (arg == name) {
    if (i + 1 >= args.size() || common::starts_with(args[i + 1], "--")) {
      error = "missing value for " + name;
      return true;
    }
    out_value = args[i + 1];
    i += 2;
    return true;
  }
  if (common::starts_with(arg, name + "=")) {
    const auto value = arg.substr(name.size() + 1);
    if (value.empty()) {
      error = "missing value for " + name;
      return true;
    }
    out_value = value;
    i += 1;
    return true;
  }
  return false;
}

void write_envelope(std::ostream &out, const Json::Value &envelope) {
  out << common::dump_json_pretty(envelope) << "\n";
  out.flush();
}

} // namespace

std::string version_string() {
#ifdef HOOKJUDGE_VERSION
  std::string version = HOOKJUDGE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "hookjudge " + version;
}

void print_help(std::ostream &out) {
  out << "hookjudge - PreToolUse permission judge\n\n"
      << "Usage: hookjudge [--config PATH | --policy NAME]\n\n"
      << "Reads one PreToolUse request as JSON from stdin and writes one permission\n"
      << "decision as JSON to stdout. Diagnostics go to stderr.\n\n"
      << "Options:\n"
      << "  --config PATH   Load the policy from a TOML file\n"
      << "  --policy NAME   Use a built-in policy (default: " << config::kDefaultPolicy << ")\n"
      << "  --help          Show this help\n"
      << "  --version       Show the version\n\n"
      << "Built-in policies:\n";
  for (const auto &name : config::builtin_policy_names()) {
    out << "  " << name << "\n";
  }
  out << "\nEnvironment:\n"
      << "  ANTHROPIC_API_KEY      API key for the decision oracle\n"
      << "  ANTHROPIC_BASE_URL     API base URL\n"
      << "  HOOKJUDGE_MODEL        Model used when the policy names none\n"
      << "  HOOKJUDGE_DEADLINE_MS  Total time budget per decision (default 120000)\n"
      << "  HOOKJUDGE_LOG          log | none\n";
}

common::Result<CliOptions> parse_args(std::vector<std::string> args) {
  CliOptions options;
  std::optional<std::string> config_path;
  std::optional<std::string> policy_name;

  for (std::size_t i = 0; i < args.size();) {
    std::string error;
    if (take_value(args, i, "--config", config_path, error) ||
        take_value(args, i, "--policy", policy_name, error)) {
      if (!error.empty()) {
        return common::Result<CliOptions>::failure(error);
      }
      continue;
    }
    if (args[i] == "--help" || args[i] == "-h") {
      options.show_help = true;
    } else if (args[i] == "--version" || args[i] == "-V") {
      options.show_version = true;
    } else if (common::starts_with(args[i], "-")) {
      return common::Result<CliOptions>::failure("unknown option '" + args[i] + "'");
    } else {
      return common::Result<CliOptions>::failure("unexpected argument '" + args[i] + "'");
    }
    ++i;
  }

  if (config_path.has_value() && policy_name.has_value()) {
    return common::Result<CliOptions>::failure("--config and --policy are mutually exclusive");
  }
  if (config_path.has_value()) {
    options.selector = config::PolicyFile{*config_path};
  } else if (policy_name.has_value()) {
    options.selector = config::BuiltinPolicy{*policy_name};
  }
  return common::Result<CliOptions>::success(std::move(options));
}

int run(const std::vector<std::string> &args, std::istream &in, std::ostream &out,
        std::ostream &err, const config::RuntimeSettings &settings,
        const OracleFactory &oracle_factory) {
  auto options = parse_args(args);
  if (options.ok() && options.value().show_help) {
    print_help(out);
    return 0;
  }
  if (options.ok() && options.value().show_version) {
    out << version_string() << "\n";
    return 0;
  }

  auto observer = observability::create_observer(settings.log_backend, err);
  std::string raw_request;
  try {
    raw_request.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());

    judge::JudgeOptions judge_options;
    judge_options.deadline = settings.deadline;

    if (!options.ok()) {
      judge::Judge judge(nullptr, *observer, judge_options);
      write_envelope(out, judge.reject_configuration(options.error(), raw_request));
      return 0;
    }

    auto config = config::resolve_config(options.value().selector);
    if (!config.ok()) {
      judge::Judge judge(nullptr, *observer, judge_options);
      write_envelope(out, judge.reject_configuration(config.error(), raw_request));
      return 0;
    }

    auto oracle = oracle_factory ? oracle_factory(settings) : oracle::create_oracle(settings);
    judge::Judge judge(std::move(oracle), *observer, judge_options);
    write_envelope(out, judge.decide(raw_request, config.value()));
  } catch (const std::exception &ex) {
    observer->record_event(
        observability::ErrorEvent{.component = "cli", .message = std::string(ex.what())});
    observer->flush();
    write_envelope(out, judge::synthesize(judge::Failed{.kind = judge::ErrorKind::Internal,
                                                        .detail = ex.what()}));
  }
  return 0;
}

int run_cli(int argc, char **argv) {
  const auto args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  const auto settings = config::load_runtime_settings();
  return run(args, std::cin, std::cout, std::cerr, settings, nullptr);
}

} // namespace hookjudge::cli
