#include "stabcheck/metrics/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace stabcheck::metrics {

std::optional<double> nearest_rank_percentile(const std::vector<double> &sorted,
                                              const double percentile) {
  if (sorted.empty()) {
    return std::nullopt;
  }
  const auto n = static_cast<long long>(sorted.size());
  // The small epsilon keeps exact products such as 0.95 * 20 from rounding up a rank.
  const double rank = std::ceil(percentile / 100.0 * static_cast<double>(n) - 1e-9);
  const long long index = std::clamp(static_cast<long long>(rank) - 1, 0LL, n - 1);
  return sorted[static_cast<std::size_t>(index)];
}

RunStatistics aggregate(const std::vector<probe::ProbeOutcome> &outcomes) {
  RunStatistics stats;
  stats.total_probes = outcomes.size();

  std::vector<double> latencies;
  latencies.reserve(outcomes.size());
  for (const auto &outcome : outcomes) {
    if (outcome.success) {
      latencies.push_back(outcome.latency_ms);
      continue;
    }
    const auto error = outcome.error.value_or(probe::ProbeError::Other);
    ++stats.error_counts[std::string(probe::probe_error_name(error))];
  }

  stats.successful_probes = latencies.size();
  stats.failed_probes = stats.total_probes - stats.successful_probes;
  if (stats.total_probes > 0) {
    stats.availability_pct = static_cast<double>(stats.successful_probes) /
                             static_cast<double>(stats.total_probes) * 100.0;
  }

  if (latencies.empty()) {
    return stats;
  }

  std::sort(latencies.begin(), latencies.end());
  stats.p50_latency_ms = nearest_rank_percentile(latencies, 50.0);
  stats.p95_latency_ms = nearest_rank_percentile(latencies, 95.0);
  stats.min_latency_ms = latencies.front();
  stats.max_latency_ms = latencies.back();
  stats.mean_latency_ms = std::accumulate(latencies.begin(), latencies.end(), 0.0) /
                          static_cast<double>(latencies.size());
  return stats;
}

bool meets_threshold(const RunStatistics &statistics,
                     const std::optional<double> &min_availability_pct) {
  if (!min_availability_pct.has_value()) {
    return true;
  }
  return statistics.availability_pct >= *min_availability_pct;
}

} // namespace stabcheck::metrics
