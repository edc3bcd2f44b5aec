#include "stabcheck/cli/signals.hpp"

#include "stabcheck/observability/global.hpp"

#include <csignal>
#include <string>

namespace stabcheck::cli {

namespace {

std::string signal_name(const int signal) {
  switch (signal) {
  case SIGINT:
    return "SIGINT";
  case SIGTERM:
    return "SIGTERM";
  default:
    return "signal " + std::to_string(signal);
  }
}

} // namespace

ShutdownSignals::ShutdownSignals(common::CancelToken &cancel) : cancel_(cancel) {}

bool ShutdownSignals::handle(const int signal) {
  ++received_;
  if (received_ > 1) {
    return true;
  }
  observability::record_warning("signal", signal_name(signal) +
                                              " received, stopping after the current probe "
                                              "(repeat to exit now)");
  cancel_.cancel();
  return false;
}

} // namespace stabcheck::cli
