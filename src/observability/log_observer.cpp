#include "hookjudge/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace hookjudge::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, JudgeStartEvent>) {
          log_line("INFO", "judge.start session=" + evt.session_id + " tool=" + evt.tool_name +
                               " oracle=" + evt.oracle);
        } else if constexpr (std::is_same_v<T, OracleCallEvent>) {
          log_line("DEBUG", "oracle.call attempt=" + std::to_string(evt.attempt) +
                                " duration_ms=" + std::to_string(evt.duration.count()) +
                                " success=" + (evt.success ? std::string("true")
                                                           : std::string("false")));
        } else if constexpr (std::is_same_v<T, ValidationFailureEvent>) {
          log_line("WARN", "oracle.invalid attempt=" + std::to_string(evt.attempt) +
                               " stage=" + evt.stage + " detail=" + evt.detail);
        } else if constexpr (std::is_same_v<T, DecisionEvent>) {
          log_line("INFO", "judge.decision permission=" + evt.permission +
                               " outcome=" + evt.outcome +
                               " oracle_calls=" + std::to_string(evt.oracle_calls));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, DecisionLatencyMetric>) {
          log_line("DEBUG", "metric.decision_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, OracleCallsMetric>) {
          log_line("DEBUG", "metric.oracle_calls=" + std::to_string(m.calls));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace hookjudge::observability
