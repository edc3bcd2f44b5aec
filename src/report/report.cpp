#include "stabcheck/report/report.hpp"

#include "stabcheck/common/clock.hpp"
#include "stabcheck/common/digest.hpp"
#include "stabcheck/common/fs.hpp"
#include "stabcheck/common/json_util.hpp"
#include "stabcheck/common/time.hpp"
#include "stabcheck/config/config.hpp"

#include <cstdlib>
#include <sstream>

namespace stabcheck::report {

namespace {

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

std::string bool_text(const bool value) { return value ? "true" : "false"; }

std::optional<std::string> non_empty(const std::string &value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_optional_number(const std::string &json, const std::string &field) {
  const std::string raw = common::json_get_number(json, field);
  if (raw.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(raw.c_str(), &end);
  if (end == raw.c_str()) {
    return std::nullopt;
  }
  return value;
}

void write_config(std::ostringstream &out, const config::RunConfig &config) {
  out << "  \"config\": {\n"
      << "    \"url\": " << quoted(config.url) << ",\n"
      << "    \"duration_seconds\": " << common::json_number(config.duration_seconds) << ",\n"
      << "    \"interval_seconds\": " << common::json_number(config.interval_seconds) << ",\n"
      << "    \"expected\": " << common::json_string_or_null(config.expected) << ",\n"
      << "    \"timeout_seconds\": " << common::json_number(config.timeout_seconds) << ",\n"
      << "    \"method\": " << quoted(config::method_name(config.method)) << ",\n"
      << "    \"expected_status\": "
      << (config.expected_status.has_value() ? std::to_string(*config.expected_status) : "null")
      << "\n  },\n";
}

void write_statistics(std::ostringstream &out, const metrics::RunStatistics &stats) {
  out << "  \"statistics\": {\n"
      << "    \"total_probes\": " << stats.total_probes << ",\n"
      << "    \"successful_probes\": " << stats.successful_probes << ",\n"
      << "    \"failed_probes\": " << stats.failed_probes << ",\n"
      << "    \"availability_pct\": " << common::json_number(stats.availability_pct) << ",\n"
      << "    \"p50_latency_ms\": " << common::json_number_or_null(stats.p50_latency_ms) << ",\n"
      << "    \"p95_latency_ms\": " << common::json_number_or_null(stats.p95_latency_ms) << ",\n"
      << "    \"min_latency_ms\": " << common::json_number_or_null(stats.min_latency_ms) << ",\n"
      << "    \"max_latency_ms\": " << common::json_number_or_null(stats.max_latency_ms) << ",\n"
      << "    \"mean_latency_ms\": " << common::json_number_or_null(stats.mean_latency_ms)
      << ",\n"
      << "    \"error_counts\": {";
  bool first = true;
  for (const auto &[tag, count] : stats.error_counts) {
    out << (first ? "" : ", ") << quoted(tag) << ": " << count;
    first = false;
  }
  out << "}\n  },\n";
}

void write_outcome(std::ostringstream &out, const ReportOutcome &entry) {
  const auto &outcome = entry.outcome;
  out << "    {\"timestamp\": " << quoted(common::format_rfc3339(outcome.timestamp))
      << ", \"offset_ms\": " << common::json_number(entry.offset_ms)
      << ", \"success\": " << bool_text(outcome.success) << ", \"status_code\": "
      << (outcome.status_code.has_value() ? std::to_string(*outcome.status_code) : "null")
      << ", \"latency_ms\": " << common::json_number(outcome.latency_ms) << ", \"error\": "
      << (outcome.error.has_value()
              ? quoted(std::string(probe::probe_error_name(*outcome.error)))
              : std::string("null"))
      << ", \"error_detail\": " << common::json_string_or_null(outcome.error_detail) << "}";
}

} // namespace

Report build_report(const config::RunConfig &config, const runner::RunRecord &record,
                    const metrics::RunStatistics &statistics,
                    std::optional<std::string> collected_logs, ReportMeta meta,
                    const std::chrono::system_clock::time_point generated_at) {
  Report report;
  report.config = config;
  report.statistics = statistics;
  report.outcomes.reserve(record.outcomes.size());
  for (const auto &outcome : record.outcomes) {
    report.outcomes.push_back(ReportOutcome{
        .outcome = outcome, .offset_ms = common::to_millis(outcome.started - record.started)});
  }
  report.collected_logs = std::move(collected_logs);
  report.generated_at = generated_at;
  report.threshold_passed = metrics::meets_threshold(statistics, meta.min_availability_pct);
  report.meta = std::move(meta);
  report.state = record.state;
  report.started_at = record.started_at;
  report.finished_at = record.finished_at;
  return report;
}

Report build_report(const config::RunConfig &config, const runner::RunRecord &record,
                    const metrics::RunStatistics &statistics,
                    std::optional<std::string> collected_logs, ReportMeta meta) {
  return build_report(config, record, statistics, std::move(collected_logs), std::move(meta),
                      std::chrono::system_clock::now());
}

std::string to_json(const Report &report) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"run\": {\n"
      << "    \"run_id\": " << quoted(report.meta.run_id) << ",\n"
      << "    \"state\": " << quoted(std::string(runner::run_state_name(report.state))) << ",\n"
      << "    \"started_at\": " << quoted(common::format_rfc3339(report.started_at)) << ",\n"
      << "    \"finished_at\": " << quoted(common::format_rfc3339(report.finished_at)) << ",\n"
      << "    \"container\": " << common::json_string_or_null(non_empty(report.meta.container))
      << "\n  },\n";
  write_config(out, report.config);
  write_statistics(out, report.statistics);
  out << "  \"threshold\": {\"min_availability_pct\": "
      << common::json_number_or_null(report.meta.min_availability_pct)
      << ", \"passed\": " << bool_text(report.threshold_passed) << "},\n";

  out << "  \"outcomes\": [";
  for (std::size_t i = 0; i < report.outcomes.size(); ++i) {
    out << (i == 0 ? "\n" : ",\n");
    write_outcome(out, report.outcomes[i]);
  }
  out << (report.outcomes.empty() ? "],\n" : "\n  ],\n");

  out << "  \"collected_logs\": " << common::json_string_or_null(report.collected_logs) << ",\n";
  out << "  \"generated_at\": " << quoted(common::format_rfc3339(report.generated_at)) << "\n";
  out << "}\n";
  return out.str();
}

std::filesystem::path sidecar_path(const std::filesystem::path &report_path) {
  return std::filesystem::path(report_path.string() + ".sha256");
}

common::Status write_report(const std::string &json, const std::filesystem::path &path) {
  if (auto status = common::write_file_atomic(path, json); !status.ok()) {
    return common::Status::error("cannot write report " + path.string() + ": " + status.error(),
                                 common::ErrorKind::ReportSink);
  }
  const std::string line =
      common::sha256_hex(json) + "  " + path.filename().string() + "\n";
  if (auto status = common::write_file_atomic(sidecar_path(path), line); !status.ok()) {
    return common::Status::error("cannot write digest " + sidecar_path(path).string() + ": " +
                                     status.error(),
                                 common::ErrorKind::ReportSink);
  }
  return common::Status::success();
}

common::Result<ReportSummary> verify_report(const std::filesystem::path &path) {
  using SummaryResult = common::Result<ReportSummary>;
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return SummaryResult::failure("cannot read report " + path.string(),
                                  common::ErrorKind::Integrity);
  }
  const auto sidecar = common::read_file(sidecar_path(path));
  if (!sidecar.ok()) {
    return SummaryResult::failure("missing digest file " + sidecar_path(path).string(),
                                  common::ErrorKind::Integrity);
  }

  const std::string recorded = common::to_lower(
      common::trim(sidecar.value().substr(0, sidecar.value().find_first_of(" \t\r\n"))));
  const std::string actual = common::sha256_hex(content.value());
  if (recorded != actual) {
    return SummaryResult::failure("digest mismatch for " + path.string() + ": recorded " +
                                      recorded + ", actual " + actual,
                                  common::ErrorKind::Integrity);
  }

  const std::string &json = content.value();
  const std::string statistics = common::json_get_object(json, "statistics");
  if (statistics.empty()) {
    return SummaryResult::failure(path.string() + " has no statistics block",
                                  common::ErrorKind::Integrity);
  }

  ReportSummary summary;
  summary.digest = actual;
  const std::string run = common::json_get_object(json, "run");
  summary.run_id = common::json_get_string(run, "run_id");
  summary.state = common::json_get_string(run, "state");
  summary.url = common::json_get_string(common::json_get_object(json, "config"), "url");
  summary.generated_at = common::json_get_string(json, "generated_at");
  summary.total_probes = static_cast<std::size_t>(
      parse_optional_number(statistics, "total_probes").value_or(0.0));
  summary.successful_probes = static_cast<std::size_t>(
      parse_optional_number(statistics, "successful_probes").value_or(0.0));
  summary.availability_pct =
      parse_optional_number(statistics, "availability_pct").value_or(0.0);
  summary.p50_latency_ms = parse_optional_number(statistics, "p50_latency_ms");
  summary.p95_latency_ms = parse_optional_number(statistics, "p95_latency_ms");
  return SummaryResult::success(std::move(summary));
}

} // namespace stabcheck::report
