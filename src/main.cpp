#include "stabcheck/cli/commands.hpp"
#include "stabcheck/cli/signals.hpp"
#include "stabcheck/common/cancel_token.hpp"

#include <csignal>
#include <cstdlib>
#include <pthread.h>
#include <thread>

namespace {

stabcheck::common::CancelToken g_cancel;

/// Route SIGINT and SIGTERM to a watcher thread. The mask is set before any
/// other thread starts so every thread inherits it.
void install_signal_watcher() {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
    return;
  }
  std::thread([signals]() {
    stabcheck::cli::ShutdownSignals shutdown(g_cancel);
    int received = 0;
    while (sigwait(&signals, &received) == 0) {
      if (shutdown.handle(received)) {
        std::_Exit(128 + received);
      }
    }
  }).detach();
}

} // namespace

int main(int argc, char **argv) {
  install_signal_watcher();
  stabcheck::cli::CliContext context;
  context.cancel = &g_cancel;
  return stabcheck::cli::run_cli(argc, argv, context);
}
