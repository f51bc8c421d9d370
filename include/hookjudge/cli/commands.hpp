#pragma once

#include "hookjudge/common/result.hpp"
#include "hookjudge/config/config.hpp"
#include "hookjudge/oracle/oracle.hpp"

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace hookjudge::cli {

using OracleFactory =
    std::function<std::shared_ptr<oracle::DecisionOracle>(const config::RuntimeSettings &)>;

struct CliOptions {
  config::ConfigSelector selector = config::BuiltinPolicy{config::kDefaultPolicy};
  bool show_help = false;
  bool show_version = false;
};

/// `args` excludes the program name.
[[nodiscard]] common::Result<CliOptions> parse_args(std::vector<std::string> args);

[[nodiscard]] std::string version_string();
void print_help(std::ostream &out);

/// Reads one request from `in` and writes exactly one envelope to `out`.
/// Diagnostics go to `err`. Returns 0 for every hook invocation.
int run(const std::vector<std::string> &args, std::istream &in, std::ostream &out,
        std::ostream &err, const config::RuntimeSettings &settings,
        const OracleFactory &oracle_factory);

int run_cli(int argc, char **argv);

} // namespace hookjudge::cli
