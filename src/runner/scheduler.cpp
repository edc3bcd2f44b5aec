#include "stabcheck/runner/scheduler.hpp"

#include "stabcheck/config/config.hpp"
#include "stabcheck/observability/global.hpp"

#include <algorithm>

namespace stabcheck::runner {

namespace {

void report_probe(const probe::ProbeOutcome &outcome, const std::size_t index) {
  observability::ProbeEvent event;
  event.index = index;
  event.success = outcome.success;
  event.status_code = outcome.status_code;
  event.latency_ms = outcome.latency_ms;
  if (outcome.error.has_value()) {
    event.error = std::string(probe::probe_error_name(*outcome.error));
  }
  event.detail = outcome.error_detail.value_or("");
  observability::record_probe(std::move(event));
}

} // namespace

std::string_view run_state_name(const RunState state) {
  switch (state) {
  case RunState::NotStarted:
    return "not_started";
  case RunState::Running:
    return "running";
  case RunState::Completed:
    return "completed";
  case RunState::Cancelled:
    return "cancelled";
  }
  return "not_started";
}

Scheduler::Scheduler(std::shared_ptr<probe::IProber> prober,
                     std::shared_ptr<common::IClock> clock)
    : prober_(std::move(prober)), clock_(std::move(clock)) {}

common::Result<RunRecord> Scheduler::run(const config::RunConfig &config,
                                         const common::CancelToken &cancel) {
  if (state_ != RunState::NotStarted) {
    return common::Result<RunRecord>::failure("scheduler already used",
                                              common::ErrorKind::Config);
  }
  if (auto status = config::validate_run_config(config); !status.ok()) {
    return common::Result<RunRecord>::failure(status);
  }
  if (prober_ == nullptr || clock_ == nullptr) {
    return common::Result<RunRecord>::failure("scheduler requires a prober and a clock",
                                              common::ErrorKind::Config);
  }

  const auto duration = common::from_seconds(config.duration_seconds);
  const auto interval = common::from_seconds(config.interval_seconds);

  RunRecord record;
  record.started_at = clock_->wall_now();
  record.started = clock_->now();
  state_ = RunState::Running;
  observability::record_run_start(config.url, config.duration_seconds, config.interval_seconds,
                                   config.timeout_seconds);

  bool interrupted = false;
  while (true) {
    if (cancel.is_cancelled()) {
      interrupted = true;
      break;
    }
    auto outcome = prober_->probe(config, cancel);
    if (cancel.is_cancelled() && !outcome.success) {
      interrupted = true;
      break;
    }
    report_probe(outcome, record.outcomes.size());
    const auto latency = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double, std::milli>(outcome.latency_ms));
    record.outcomes.push_back(std::move(outcome));

    const auto elapsed = clock_->now() - record.started;
    if (elapsed + interval >= duration) {
      break;
    }
    const auto sleep = std::max(std::chrono::nanoseconds::zero(), interval - latency);
    if (!clock_->sleep_for(sleep, cancel)) {
      interrupted = true;
      break;
    }
  }

  state_ = interrupted ? RunState::Cancelled : RunState::Completed;
  record.state = state_;
  record.finished_at = clock_->wall_now();

  std::size_t successful = 0;
  for (const auto &outcome : record.outcomes) {
    successful += outcome.success ? 1U : 0U;
  }
  observability::record_run_end(
      std::string(run_state_name(state_)), record.outcomes.size(), successful,
      std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - record.started));
  return common::Result<RunRecord>::success(std::move(record));
}

} // namespace stabcheck::runner
