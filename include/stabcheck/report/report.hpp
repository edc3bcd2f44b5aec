#pragma once

#include "stabcheck/common/result.hpp"
#include "stabcheck/config/schema.hpp"
#include "stabcheck/metrics/statistics.hpp"
#include "stabcheck/probe/outcome.hpp"
#include "stabcheck/runner/scheduler.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stabcheck::report {

/// Run identity and pass criteria that travel with the evidence.
struct ReportMeta {
  std::string run_id;
  std::string container;
  std::optional<double> min_availability_pct;
};

struct ReportOutcome {
  probe::ProbeOutcome outcome;
  double offset_ms = 0.0;
};

struct Report {
  config::RunConfig config;
  metrics::RunStatistics statistics;
  std::vector<ReportOutcome> outcomes;
  std::optional<std::string> collected_logs;
  std::chrono::system_clock::time_point generated_at{};

  ReportMeta meta;
  runner::RunState state = runner::RunState::NotStarted;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
  bool threshold_passed = true;
};

/// Pure assembly. Only `generated_at` differs between calls with equal inputs.
[[nodiscard]] Report build_report(const config::RunConfig &config, const runner::RunRecord &record,
                                  const metrics::RunStatistics &statistics,
                                  std::optional<std::string> collected_logs, ReportMeta meta,
                                  std::chrono::system_clock::time_point generated_at);
[[nodiscard]] Report build_report(const config::RunConfig &config, const runner::RunRecord &record,
                                  const metrics::RunStatistics &statistics,
                                  std::optional<std::string> collected_logs, ReportMeta meta);

/// Pretty-printed JSON document.
[[nodiscard]] std::string to_json(const Report &report);

[[nodiscard]] std::filesystem::path sidecar_path(const std::filesystem::path &report_path);

/// Write the report atomically plus a `<path>.sha256` sidecar in sha256sum
/// format. Failures carry ErrorKind::ReportSink.
[[nodiscard]] common::Status write_report(const std::string &json,
                                          const std::filesystem::path &path);

/// What `stabcheck verify` prints about a report that passed its digest check.
struct ReportSummary {
  std::string digest;
  std::string run_id;
  std::string state;
  std::string url;
  std::string generated_at;
  std::size_t total_probes = 0;
  std::size_t successful_probes = 0;
  double availability_pct = 0.0;
  std::optional<double> p50_latency_ms;
  std::optional<double> p95_latency_ms;
};

/// Recompute the digest of `path` against its sidecar and read back the
/// statistics block. Failures carry ErrorKind::Integrity.
[[nodiscard]] common::Result<ReportSummary> verify_report(const std::filesystem::path &path);

} // namespace stabcheck::report
