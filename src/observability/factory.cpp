#include "hookjudge/observability/factory.hpp"

#include "hookjudge/common/fs.hpp"
#include "hookjudge/observability/log_observer.hpp"
#include "hookjudge/observability/noop_observer.hpp"

#include <iostream>

namespace hookjudge::observability {

namespace {

bool is_disabled(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  return normalized == "none" || normalized == "noop" || normalized == "off";
}

} // namespace

std::unique_ptr<IObserver> create_observer(const std::string &backend) {
  return create_observer(backend, std::cerr);
}

std::unique_ptr<IObserver> create_observer(const std::string &backend, std::ostream &log_stream) {
  if (is_disabled(backend)) {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>(log_stream);
}

} // namespace hookjudge::observability
