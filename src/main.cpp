#include "hookjudge/cli/commands.hpp"

int main(int argc, char **argv) { return hookjudge::cli::run_cli(argc, argv); }
