#pragma once

#include "stabcheck/common/cancel_token.hpp"
#include "stabcheck/common/clock.hpp"
#include "stabcheck/common/result.hpp"
#include "stabcheck/config/schema.hpp"
#include "stabcheck/probe/prober.hpp"

#include <chrono>
#include <memory>
#include <string_view>
#include <vector>

namespace stabcheck::runner {

enum class RunState { NotStarted, Running, Completed, Cancelled };

[[nodiscard]] std::string_view run_state_name(RunState state);

/// Everything the loop observed, in probe order.
struct RunRecord {
  RunState state = RunState::NotStarted;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
  std::chrono::steady_clock::time_point started{};
  std::vector<probe::ProbeOutcome> outcomes;
};

/// Sequential probe loop anchored to the start of the run. One probe is in
/// flight at a time; the sleep after each probe is the interval minus that
/// probe's latency, floored at zero.
class Scheduler {
public:
  explicit Scheduler(std::shared_ptr<probe::IProber> prober,
                     std::shared_ptr<common::IClock> clock =
                         std::make_shared<common::SystemClock>());

  /// Single use. A second call fails with ErrorKind::Config, as does a
  /// misconfigured `config` (checked before any probe).
  [[nodiscard]] common::Result<RunRecord> run(const config::RunConfig &config,
                                              const common::CancelToken &cancel);

  [[nodiscard]] RunState state() const { return state_; }

private:
  std::shared_ptr<probe::IProber> prober_;
  std::shared_ptr<common::IClock> clock_;
  RunState state_ = RunState::NotStarted;
};

} // namespace stabcheck::runner
