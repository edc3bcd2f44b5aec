#pragma once

#include "stabcheck/common/cancel_token.hpp"

namespace stabcheck::cli {

/// Shutdown policy for SIGINT/SIGTERM: the first signal cancels the run so a
/// partial report is still written, a repeat asks the process to exit at once.
class ShutdownSignals {
public:
  explicit ShutdownSignals(common::CancelToken &cancel);

  /// True when the caller should terminate immediately.
  [[nodiscard]] bool handle(int signal);
  [[nodiscard]] int received() const { return received_; }

private:
  common::CancelToken &cancel_;
  int received_ = 0;
};

} // namespace stabcheck::cli
