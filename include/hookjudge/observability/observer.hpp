#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace hookjudge::observability {

struct JudgeStartEvent {
  std::string session_id;
  std::string tool_name;
  std::string oracle;
};

struct OracleCallEvent {
  std::uint32_t attempt = 0;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct ValidationFailureEvent {
  std::uint32_t attempt = 0;
  std::string stage; // "parse" or "schema"
  std::string detail;
};

struct DecisionEvent {
  std::string permission;
  std::string outcome;
  std::uint32_t oracle_calls = 0;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<JudgeStartEvent, OracleCallEvent, ValidationFailureEvent,
                                   DecisionEvent, WarningEvent, ErrorEvent>;

struct DecisionLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct OracleCallsMetric {
  std::uint32_t calls = 0;
};

using ObserverMetric = std::variant<DecisionLatencyMetric, OracleCallsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace hookjudge::observability
