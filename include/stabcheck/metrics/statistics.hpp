#pragma once

#include "stabcheck/probe/outcome.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stabcheck::metrics {

/// Aggregate view of one run. Latency figures cover successful probes only and
/// are absent when there were none.
struct RunStatistics {
  std::size_t total_probes = 0;
  std::size_t successful_probes = 0;
  std::size_t failed_probes = 0;
  double availability_pct = 0.0;
  std::optional<double> p50_latency_ms;
  std::optional<double> p95_latency_ms;
  std::optional<double> min_latency_ms;
  std::optional<double> max_latency_ms;
  std::optional<double> mean_latency_ms;
  std::map<std::string, std::size_t> error_counts;

  bool operator==(const RunStatistics &) const = default;
};

/// Nearest-rank percentile over an ascending sample: the value at index
/// ceil(p/100 * n) - 1, clamped to [0, n-1]. No interpolation.
[[nodiscard]] std::optional<double> nearest_rank_percentile(const std::vector<double> &sorted,
                                                            double percentile);

[[nodiscard]] RunStatistics aggregate(const std::vector<probe::ProbeOutcome> &outcomes);

/// No threshold always passes.
[[nodiscard]] bool meets_threshold(const RunStatistics &statistics,
                                   const std::optional<double> &min_availability_pct);

} // namespace stabcheck::metrics
