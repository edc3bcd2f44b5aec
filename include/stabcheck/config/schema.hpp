#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace stabcheck::config {

enum class HttpMethod { Get, Head };

/// Immutable description of one probing run. Built once by make_run_config()
/// and handed to every component by const reference.
struct RunConfig {
  std::string url;
  double duration_seconds = 0.0;
  double interval_seconds = 0.0;
  std::optional<std::string> expected;
  double timeout_seconds = 5.0;
  HttpMethod method = HttpMethod::Get;
  std::optional<int> expected_status;
};

struct TargetConfig {
  std::string url;
  std::string method = "GET";
  std::optional<std::string> expected;
  std::optional<int> expected_status;
};

struct RunSettings {
  double duration_seconds = 0.0;
  double interval_seconds = 0.0;
  std::optional<double> timeout_seconds;
  std::optional<double> min_availability_pct;
};

struct ReportConfig {
  // Empty means a timestamped file in the working directory, "-" means stdout.
  std::string output;
  std::string log_file;
};

struct DockerConfig {
  std::string container;
  std::uint32_t tail_lines = 200;
  double timeout_seconds = 30.0;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
};

struct Config {
  TargetConfig target;
  RunSettings run;
  ReportConfig report;
  DockerConfig docker;
  ObservabilityConfig observability;
};

} // namespace stabcheck::config
