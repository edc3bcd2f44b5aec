#include "stabcheck/observability/factory.hpp"

#include "stabcheck/common/fs.hpp"
#include "stabcheck/observability/log_observer.hpp"
#include "stabcheck/observability/multi_observer.hpp"
#include "stabcheck/observability/noop_observer.hpp"

#include <sstream>

namespace stabcheck::observability {

namespace {

std::unique_ptr<IObserver> make_log_observer(const config::Config &config,
                                             const std::string &run_id, std::ostream *console) {
  LogOptions options;
  options.min_level = parse_log_level(config.observability.log_level).value_or(LogLevel::Info);
  options.run_id = run_id;
  options.log_file = config.report.log_file;
  options.console = console;
  return std::make_unique<LogObserver>(std::move(options));
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                           const std::string &run_id, std::ostream *console) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend.empty() || backend == "log") {
    return make_log_observer(config, run_id, console);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string backend_name = common::trim(part);
      // Each backend appears at most once.
      if (backend_name == "log" && !multi->contains("log")) {
        multi->add(make_log_observer(config, run_id, console));
      } else if ((backend_name == "noop" || backend_name == "none") && !multi->contains("noop")) {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return make_log_observer(config, run_id, console);
}

} // namespace stabcheck::observability
