#pragma once

#include "stabcheck/config/schema.hpp"
#include "stabcheck/observability/observer.hpp"

#include <iosfwd>
#include <memory>
#include <string>

namespace stabcheck::observability {

/// Build the observer named by `observability.backend`. Unknown backends fall
/// back to a LogObserver. `console` defaults to stderr.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                                         const std::string &run_id,
                                                         std::ostream *console = nullptr);

} // namespace stabcheck::observability
