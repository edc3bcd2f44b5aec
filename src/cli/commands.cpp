#include "stabcheck/cli/commands.hpp"

#include "stabcheck/common/digest.hpp"
#include "stabcheck/common/fs.hpp"
#include "stabcheck/common/json_util.hpp"
#include "stabcheck/common/time.hpp"
#include "stabcheck/config/config.hpp"
#include "stabcheck/metrics/statistics.hpp"
#include "stabcheck/observability/factory.hpp"
#include "stabcheck/observability/global.hpp"
#include "stabcheck/report/report.hpp"
#include "stabcheck/runner/scheduler.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace stabcheck::cli {

namespace {

struct Streams {
  std::ostream &out;
  std::ostream &err;
};

int code(const ExitCode exit_code) { return static_cast<int>(exit_code); }

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// Removes `--name value` (or `--name=value`) from `args`. A trailing option
/// with no value sets `missing`.
bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value, bool &missing) {
  const std::string inline_prefix = long_name + "=";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (common::starts_with(args[i], inline_prefix)) {
      out_value = args[i].substr(inline_prefix.size());
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        missing = true;
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool parse_double(const std::string &raw, double &out) {
  const std::string text = common::trim(raw);
  if (text.empty()) {
    return false;
  }
  char *end = nullptr;
  errno = 0;
  const double value = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == nullptr || *end != '\0') {
    return false;
  }
  out = value;
  return true;
}

void print_help(std::ostream &out) {
  out << "\n";
  out << "  stabcheck: HTTP endpoint stability probe\n";
  out << "  " << version_string() << "\n\n";

  out << "  USAGE\n";
  out << "  $ stabcheck run --url URL --duration SECS --interval SECS [options]\n";
  out << "  $ stabcheck verify REPORT.json\n\n";

  out << "  RUN OPTIONS\n";
  out << "  --config PATH          TOML profile ([target] [run] [report] [docker] "
         "[observability])\n";
  out << "  --url URL              Target endpoint (http or https)\n";
  out << "  --duration SECS        Observation window\n";
  out << "  --interval SECS        Time between probe starts\n";
  out << "  --expected TEXT        Body must equal TEXT after trimming\n";
  out << "  --expected-status N    Status must equal N\n";
  out << "  --method GET|HEAD      Request method (default GET)\n";
  out << "  --timeout SECS         Per-probe timeout (default min(5, interval))\n";
  out << "  --output PATH          Report path, '-' for stdout\n";
  out << "                         (default stability_report_<UTC>.json)\n";
  out << "  --container ID         Capture `docker logs` for ID into the report\n";
  out << "  --docker-tail N        Lines of container log to keep (default 200, 0 = all)\n";
  out << "  --min-availability PCT Exit 1 when availability is below PCT\n";
  out << "  --log-level LEVEL      debug|info|warn|error\n";
  out << "  --log-file PATH        Also append log lines to PATH\n\n";

  out << "  EXIT CODES\n";
  out << "  0 ok, 1 threshold not met, 2 usage or configuration error,\n";
  out << "  3 report could not be written, 4 report verification failed\n\n";

  out << "  ENVIRONMENT\n";
  out << "  STABCHECK_URL STABCHECK_EXPECTED STABCHECK_CONTAINER STABCHECK_OUTPUT "
         "STABCHECK_LOG_LEVEL\n\n";
}

/// Overlay command-line flags onto `config`. Returns false with `error` set on a
/// malformed value.
bool apply_run_flags(std::vector<std::string> &args, config::Config &config, std::string &error) {
  std::string value;
  bool missing = false;

  const auto number_flag = [&](const std::string &name, double &target) {
    if (!take_option(args, name, "", value, missing)) {
      return true;
    }
    if (!parse_double(value, target)) {
      error = "invalid value for " + name + ": " + value;
      return false;
    }
    return true;
  };
  const auto optional_number_flag = [&](const std::string &name, std::optional<double> &target) {
    if (!take_option(args, name, "", value, missing)) {
      return true;
    }
    double parsed = 0.0;
    if (!parse_double(value, parsed)) {
      error = "invalid value for " + name + ": " + value;
      return false;
    }
    target = parsed;
    return true;
  };

  if (take_option(args, "--url", "-u", value, missing)) {
    config.target.url = value;
  }
  if (take_option(args, "--method", "", value, missing)) {
    config.target.method = value;
  }
  if (take_option(args, "--expected", "", value, missing)) {
    config.target.expected = value;
  }
  if (take_option(args, "--expected-status", "", value, missing)) {
    double raw = 0.0;
    if (!parse_double(value, raw)) {
      error = "invalid value for --expected-status: " + value;
      return false;
    }
    const auto status = config::checked_http_status(raw);
    if (!status.ok()) {
      error = "invalid value for --expected-status: " + value + " (" + status.error() + ")";
      return false;
    }
    config.target.expected_status = status.value();
  }
  if (!number_flag("--duration", config.run.duration_seconds) ||
      !number_flag("--interval", config.run.interval_seconds) ||
      !optional_number_flag("--timeout", config.run.timeout_seconds) ||
      !optional_number_flag("--min-availability", config.run.min_availability_pct)) {
    return false;
  }
  if (take_option(args, "--output", "-o", value, missing)) {
    config.report.output = value;
  }
  if (take_option(args, "--log-file", "", value, missing)) {
    config.report.log_file = value;
  }
  if (take_option(args, "--container", "", value, missing)) {
    config.docker.container = value;
  }
  if (take_option(args, "--docker-tail", "", value, missing)) {
    double raw = 0.0;
    if (!parse_double(value, raw)) {
      error = "invalid value for --docker-tail: " + value;
      return false;
    }
    const auto lines = config::checked_tail_lines(raw);
    if (!lines.ok()) {
      error = "invalid value for --docker-tail: " + value + " (" + lines.error() + ")";
      return false;
    }
    config.docker.tail_lines = lines.value();
  }
  if (take_option(args, "--log-level", "", value, missing)) {
    config.observability.log_level = value;
  }

  if (missing) {
    error = "missing value for " + args.back();
    return false;
  }
  if (!args.empty()) {
    error = "unexpected argument: " + args.front();
    return false;
  }
  return true;
}

std::filesystem::path default_report_path(const std::chrono::system_clock::time_point now) {
  return std::filesystem::path("stability_report_" + common::format_compact_utc(now) + ".json");
}

void print_summary(std::ostream &out, const metrics::RunStatistics &stats,
                   const runner::RunState state) {
  out << "state: " << runner::run_state_name(state) << "\n";
  out << "probes: " << stats.successful_probes << "/" << stats.total_probes << " successful\n";
  out << "availability: " << common::json_number(stats.availability_pct, 2) << "%\n";
  out << "p50: " << common::json_number_or_null(stats.p50_latency_ms, 1) << " ms, p95: "
      << common::json_number_or_null(stats.p95_latency_ms, 1) << " ms\n";
  for (const auto &[tag, count] : stats.error_counts) {
    out << "  " << tag << ": " << count << "\n";
  }
}

/// Installs the run's observer for the duration of one command.
class ObserverScope {
public:
  explicit ObserverScope(std::unique_ptr<observability::IObserver> observer) {
    observability::set_global_observer(std::move(observer));
  }
  ~ObserverScope() {
    observability::flush_global_observer();
    observability::set_global_observer(nullptr);
  }
  ObserverScope(const ObserverScope &) = delete;
  ObserverScope &operator=(const ObserverScope &) = delete;
};

int run_run(std::vector<std::string> args, const CliContext &context, const Streams &streams) {
  config::Config cfg;
  std::string value;
  bool missing = false;
  if (take_option(args, "--config", "-c", value, missing)) {
    auto loaded = config::load_config_file(common::expand_path(value));
    if (!loaded.ok()) {
      streams.err << "configuration error: " << loaded.error() << "\n";
      return code(ExitCode::Usage);
    }
    cfg = std::move(loaded.value());
  } else if (missing) {
    streams.err << "missing value for --config\n";
    return code(ExitCode::Usage);
  }
  config::apply_env_overrides(cfg);

  std::string flag_error;
  if (!apply_run_flags(args, cfg, flag_error)) {
    streams.err << flag_error << "\n";
    return code(ExitCode::Usage);
  }

  const auto warnings = config::validate_config(cfg);
  if (!warnings.ok()) {
    streams.err << "configuration error: " << warnings.error() << "\n";
    return code(ExitCode::Usage);
  }
  const auto run_config = config::make_run_config(cfg);
  if (!run_config.ok()) {
    streams.err << "configuration error: " << run_config.error() << "\n";
    return code(ExitCode::Usage);
  }

  const std::string run_id = common::random_hex(8);
  ObserverScope observer_scope(observability::create_observer(cfg, run_id, &streams.err));
  for (const auto &warning : warnings.value()) {
    observability::record_warning("config", warning);
  }

  auto clock = context.clock != nullptr ? context.clock : std::make_shared<common::SystemClock>();
  auto prober = context.prober != nullptr
                    ? context.prober
                    : std::make_shared<probe::HttpProber>(
                          std::make_shared<http::CurlHttpClient>(), clock);
  common::CancelToken local_cancel;
  const common::CancelToken &cancel = context.cancel != nullptr ? *context.cancel : local_cancel;

  runner::Scheduler scheduler(prober, clock);
  auto record = scheduler.run(run_config.value(), cancel);
  if (!record.ok()) {
    observability::record_error("runner", record.error());
    streams.err << "configuration error: " << record.error() << "\n";
    return code(ExitCode::Usage);
  }

  const auto stats = metrics::aggregate(record.value().outcomes);
  observability::record_metric(
      observability::AvailabilityMetric{.availability_pct = stats.availability_pct});

  std::optional<std::string> logs;
  const std::string container = common::trim(cfg.docker.container);
  if (!container.empty()) {
    std::shared_ptr<collect::ILogCollector> collector = context.log_collector;
    if (collector == nullptr) {
      collector = std::make_shared<collect::DockerLogCollector>(collect::DockerLogOptions{
          .tail_lines = cfg.docker.tail_lines,
          .timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
              common::from_seconds(cfg.docker.timeout_seconds))});
    }
    auto collected = collector->collect(container);
    if (collected.ok()) {
      logs = std::move(collected.value());
    } else {
      observability::record_warning("collect", collected.error());
    }
  }

  report::ReportMeta meta{.run_id = run_id,
                          .container = container,
                          .min_availability_pct = cfg.run.min_availability_pct};
  const auto built = report::build_report(run_config.value(), record.value(), stats,
                                          std::move(logs), std::move(meta), clock->wall_now());
  const std::string json = report::to_json(built);

  const std::string output = common::trim(cfg.report.output);
  if (output == "-") {
    streams.out << json;
  } else {
    const std::filesystem::path path =
        output.empty() ? default_report_path(clock->wall_now()) : std::filesystem::path(output);
    if (auto written = report::write_report(json, path); !written.ok()) {
      observability::record_error("report", written.error());
      streams.err << "report-sink failure: " << written.error()
                  << "\nprinting report to stdout instead\n";
      streams.out << json;
      return code(ExitCode::ReportSink);
    }
    print_summary(streams.out, stats, built.state);
    streams.out << "report: " << path.string() << "\n";
  }

  if (!built.threshold_passed) {
    observability::record_warning(
        "threshold", "availability " + common::json_number(stats.availability_pct, 2) +
                         "% is below " + common::json_number(*cfg.run.min_availability_pct, 2) +
                         "%");
    return code(ExitCode::ThresholdNotMet);
  }
  return code(ExitCode::Success);
}

int run_verify(std::vector<std::string> args, const Streams &streams) {
  if (args.size() != 1) {
    streams.err << "usage: stabcheck verify REPORT.json\n";
    return code(ExitCode::Usage);
  }
  const auto summary = report::verify_report(args.front());
  if (!summary.ok()) {
    streams.err << "verify failed: " << summary.error() << "\n";
    return code(ExitCode::VerifyFailed);
  }
  const auto &s = summary.value();
  streams.out << "ok: " << args.front() << "\n";
  streams.out << "sha256: " << s.digest << "\n";
  streams.out << "run: " << s.run_id << " (" << s.state << ")\n";
  streams.out << "url: " << s.url << "\n";
  streams.out << "generated_at: " << s.generated_at << "\n";
  streams.out << "probes: " << s.successful_probes << "/" << s.total_probes << " successful\n";
  streams.out << "availability: " << common::json_number(s.availability_pct, 2) << "%\n";
  streams.out << "p50: " << common::json_number_or_null(s.p50_latency_ms, 1) << " ms, p95: "
              << common::json_number_or_null(s.p95_latency_ms, 1) << " ms\n";
  return code(ExitCode::Success);
}

} // namespace

std::string version_string() {
#ifdef STABCHECK_VERSION
  return std::string("stabcheck ") + STABCHECK_VERSION;
#else
  return "stabcheck 0.1.0";
#endif
}

int run_cli(std::vector<std::string> args, const CliContext &context) {
  const Streams streams{.out = context.out != nullptr ? *context.out : std::cout,
                        .err = context.err != nullptr ? *context.err : std::cerr};

  if (args.empty()) {
    print_help(streams.out);
    return code(ExitCode::Usage);
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(streams.out);
    return code(ExitCode::Success);
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    streams.out << version_string() << "\n";
    return code(ExitCode::Success);
  }
  if (subcommand == "run") {
    if (take_flag(args, "--help") || take_flag(args, "-h")) {
      print_help(streams.out);
      return code(ExitCode::Success);
    }
    return run_run(std::move(args), context, streams);
  }
  if (subcommand == "verify") {
    return run_verify(std::move(args), streams);
  }

  streams.err << "Unknown command: " << subcommand << "\n";
  print_help(streams.err);
  return code(ExitCode::Usage);
}

int run_cli(int argc, char **argv, const CliContext &context) {
  if (argc <= 1) {
    return run_cli(std::vector<std::string>{}, context);
  }
  return run_cli(collect_args(argc - 1, argv + 1), context);
}

} // namespace stabcheck::cli
