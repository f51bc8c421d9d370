#pragma once

#include "hookjudge/observability/observer.hpp"

#include <iosfwd>
#include <memory>
#include <string>

namespace hookjudge::observability {

/// "none"/"noop"/"off" disable diagnostics; "log" (and anything unrecognised)
/// logs to stderr.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backend);

/// Same selection, logging to `log_stream` instead of stderr.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backend,
                                                         std::ostream &log_stream);

} // namespace hookjudge::observability
