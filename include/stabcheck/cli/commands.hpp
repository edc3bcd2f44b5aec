#pragma once

#include "stabcheck/collect/log_collector.hpp"
#include "stabcheck/common/cancel_token.hpp"
#include "stabcheck/common/clock.hpp"
#include "stabcheck/probe/prober.hpp"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace stabcheck::cli {

enum class ExitCode : int {
  Success = 0,
  ThresholdNotMet = 1,
  Usage = 2,
  ReportSink = 3,
  VerifyFailed = 4,
};

/// Collaborators for one invocation. Null members fall back to the real
/// implementations (curl prober, system clock, docker CLI, std streams).
struct CliContext {
  std::shared_ptr<probe::IProber> prober;
  std::shared_ptr<common::IClock> clock;
  std::shared_ptr<collect::ILogCollector> log_collector;
  const common::CancelToken *cancel = nullptr;
  std::ostream *out = nullptr;
  std::ostream *err = nullptr;
};

/// `args` excludes the program name.
int run_cli(std::vector<std::string> args, const CliContext &context = {});
int run_cli(int argc, char **argv, const CliContext &context = {});

[[nodiscard]] std::string version_string();

} // namespace stabcheck::cli
