#include "test_framework.hpp"

#include "hookjudge/observability/factory.hpp"
#include "hookjudge/observability/log_observer.hpp"
#include "hookjudge/observability/noop_observer.hpp"

#include <sstream>

void register_observability_tests(std::vector<hookjudge::tests::TestCase> &tests) {
  using hookjudge::tests::require;
  namespace obs = hookjudge::observability;

  tests.push_back({"observability_factory_backends", [] {
                     require(obs::create_observer("log")->name() == "log", "log backend");
                     require(obs::create_observer("none")->name() == "noop", "none backend");
                     require(obs::create_observer(" OFF ")->name() == "noop", "off backend");
                     require(obs::create_observer("unknown")->name() == "log",
                             "unknown backends fall back to log");
                   }});

  tests.push_back({"observability_log_lines", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::JudgeStartEvent{
                         .session_id = "s1", .tool_name = "Bash", .oracle = "anthropic"});
                     observer.record_event(obs::ValidationFailureEvent{
                         .attempt = 2, .stage = "schema", .detail = "$.x: bad"});
                     observer.record_event(
                         obs::WarningEvent{.component = "oracle", .message = "tools ignored"});
                     observer.record_event(
                         obs::ErrorEvent{.component = "judge", .message = "boom"});
                     observer.record_metric(
                         obs::DecisionLatencyMetric{.latency = std::chrono::milliseconds(42)});
                     observer.flush();
                     const auto text = out.str();
                     require(text.find("[INFO] judge.start session=s1 tool=Bash oracle=anthropic") !=
                                 std::string::npos,
                             text);
                     require(text.find("[WARN] oracle.invalid attempt=2 stage=schema") !=
                                 std::string::npos,
                             text);
                     require(text.find("[WARN] oracle: tools ignored") != std::string::npos, text);
                     require(text.find("[ERROR] judge: boom") != std::string::npos, text);
                     require(text.find("decision_latency_ms=42") != std::string::npos, text);
                   }});

  tests.push_back({"observability_factory_stream_target", [] {
                     std::ostringstream out;
                     auto observer = obs::create_observer("log", out);
                     observer->record_event(obs::DecisionEvent{
                         .permission = "deny", .outcome = "communication", .oracle_calls = 1});
                     require(out.str().find("permission=deny") != std::string::npos, out.str());

                     std::ostringstream silent;
                     auto noop = obs::create_observer("none", silent);
                     noop->record_event(obs::ErrorEvent{.component = "x", .message = "y"});
                     require(silent.str().empty(), "noop must not write");
                   }});
}
