#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<hookjudge::tests::TestCase> &tests);
void register_schema_tests(std::vector<hookjudge::tests::TestCase> &tests);
void register_response_parser_tests(std::vector<hookjudge::tests::TestCase> &tests);
void register_config_tests(std::vector<hookjudge::tests::TestCase> &tests);
void register_oracle_tests(std::vector<hookjudge::tests::TestCase> &tests);
void register_orchestrator_tests(std::vector<hookjudge::tests::TestCase> &tests);
void register_synthesizer_tests(std::vector<hookjudge::tests::TestCase> &tests);
void register_judge_tests(std::vector<hookjudge::tests::TestCase> &tests);
void register_observability_tests(std::vector<hookjudge::tests::TestCase> &tests);
void register_cli_tests(std::vector<hookjudge::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<hookjudge::tests::TestCase> tests;
  register_common_tests(tests);
  register_schema_tests(tests);
  register_response_parser_tests(tests);
  register_config_tests(tests);
  register_oracle_tests(tests);
  register_orchestrator_tests(tests);
  register_synthesizer_tests(tests);
  register_judge_tests(tests);
  register_observability_tests(tests);
  register_cli_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
