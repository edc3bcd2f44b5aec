#include "test_framework.hpp"

#include "stabcheck/cli/commands.hpp"
#include "stabcheck/cli/signals.hpp"
#include "stabcheck/common/fs.hpp"
#include "stabcheck/common/json_util.hpp"
#include "stabcheck/report/report.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <csignal>
#include <filesystem>
#include <memory>
#include <sstream>

namespace {

namespace collect = stabcheck::collect;
namespace common = stabcheck::common;
using stabcheck::testing::FakeClock;
using stabcheck::testing::ProbeStep;
using stabcheck::testing::ScriptedProber;

class StaticLogCollector final : public collect::ILogCollector {
public:
  explicit StaticLogCollector(common::Result<std::string> result) : result_(std::move(result)) {}

  [[nodiscard]] common::Result<std::string> collect(const std::string &container) override {
    containers.push_back(container);
    return result_;
  }

  std::vector<std::string> containers;

private:
  common::Result<std::string> result_;
};

struct Harness {
  std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
  std::shared_ptr<ScriptedProber> prober;
  std::ostringstream out;
  std::ostringstream err;
  stabcheck::cli::CliContext context;

  explicit Harness(std::vector<ProbeStep> steps = {}) {
    prober = std::make_shared<ScriptedProber>(clock, std::move(steps));
    context.prober = prober;
    context.clock = clock;
    context.out = &out;
    context.err = &err;
  }

  int run(std::vector<std::string> args) { return stabcheck::cli::run_cli(std::move(args), context); }
};

std::vector<std::string> run_args(const std::filesystem::path &output) {
  return {"run",        "--url",      "http://127.0.0.1:8080/health", "--duration", "10",
          "--interval", "2",          "--output",                     output.string()};
}

} // namespace

void register_cli_tests(std::vector<stabcheck::tests::TestCase> &tests) {
  using stabcheck::tests::require;
  namespace cli = stabcheck::cli;
  namespace probe = stabcheck::probe;
  using stabcheck::testing::TempWorkspace;

  tests.push_back({"cli_run_writes_report_and_sidecar", [] {
                     TempWorkspace workspace;
                     Harness harness;
                     const auto path = workspace.path() / "report.json";
                     const int code = harness.run(run_args(path));
                     require(code == 0, "exit 0, stderr: " + harness.err.str());
                     require(harness.prober->calls() == 5, "five probes");
                     const auto json = common::read_file(path);
                     require(json.ok(), "report written");
                     require(common::json_get_number(common::json_get_object(json.value(),
                                                                             "statistics"),
                                                     "total_probes") == "5",
                             "statistics in report");
                     require(std::filesystem::exists(stabcheck::report::sidecar_path(path)),
                             "sidecar written");
                     require(harness.out.str().find("report: " + path.string()) !=
                                 std::string::npos,
                             "path printed");
                     require(harness.err.str().find("run.start") != std::string::npos,
                             "run logged on stderr");
                   }});

  tests.push_back({"cli_threshold_miss_exits_one", [] {
                     TempWorkspace workspace;
                     Harness harness({ProbeStep{},
                                      stabcheck::testing::failing_step(probe::ProbeError::Timeout)});
                     auto args = run_args(workspace.path() / "report.json");
                     args.push_back("--min-availability");
                     args.push_back("50");
                     require(harness.run(args) == 1, "20% availability misses 50%");
                     require(std::filesystem::exists(workspace.path() / "report.json"),
                             "report still written");
                   }});

  tests.push_back({"cli_interval_zero_exits_two_without_probes_or_report", [] {
                     TempWorkspace workspace;
                     Harness harness;
                     auto args = run_args(workspace.path() / "report.json");
                     args[6] = "0";
                     require(harness.run(args) == 2, "configuration error exit code");
                     require(harness.prober->calls() == 0, "no probes");
                     require(!std::filesystem::exists(workspace.path() / "report.json"),
                             "no report written");
                     require(harness.err.str().find("configuration error") != std::string::npos,
                             "error explained");
                   }});

  tests.push_back({"cli_unwritable_output_prints_report_and_exits_three", [] {
                     TempWorkspace workspace;
                     workspace.create_file("blocker", "x");
                     Harness harness;
                     const int code = harness.run(run_args(workspace.path() / "blocker" / "r.json"));
                     require(code == 3, "report-sink exit code");
                     require(harness.out.str().find("\"statistics\"") != std::string::npos,
                             "report printed as fallback");
                   }});

  tests.push_back({"cli_output_dash_prints_json_only", [] {
                     Harness harness;
                     auto args = run_args("-");
                     require(harness.run(args) == 0, "exit 0");
                     const std::string out = harness.out.str();
                     require(!out.empty() && out.front() == '{', "stdout is the JSON document");
                     require(out.find("report:") == std::string::npos, "no summary mixed in");
                   }});

  tests.push_back({"cli_log_collection_failure_keeps_run", [] {
                     TempWorkspace workspace;
                     Harness harness;
                     auto collector = std::make_shared<StaticLogCollector>(
                         common::Result<std::string>::failure("docker executable not found",
                                                              common::ErrorKind::LogCollection));
                     harness.context.log_collector = collector;
                     auto args = run_args(workspace.path() / "report.json");
                     args.push_back("--container");
                     args.push_back("api");
                     require(harness.run(args) == 0, "collection failure is not fatal");
                     require(collector->containers == std::vector<std::string>{"api"},
                             "collector asked for api");
                     const auto json = common::read_file(workspace.path() / "report.json");
                     require(common::json_is_null(json.value(), "collected_logs"), "logs null");
                     require(harness.err.str().find("docker executable not found") !=
                                 std::string::npos,
                             "warning logged");
                   }});

  tests.push_back({"cli_collected_logs_embedded", [] {
                     TempWorkspace workspace;
                     Harness harness;
                     harness.context.log_collector = std::make_shared<StaticLogCollector>(
                         common::Result<std::string>::success("ready\n"));
                     auto args = run_args(workspace.path() / "report.json");
                     args.push_back("--container");
                     args.push_back("api");
                     require(harness.run(args) == 0, "exit 0");
                     const auto json = common::read_file(workspace.path() / "report.json");
                     require(common::json_get_string(json.value(), "collected_logs") == "ready\n",
                             "logs embedded");
                     require(common::json_get_string(common::json_get_object(json.value(), "run"),
                                                     "container") == "api",
                             "container recorded");
                   }});

  tests.push_back({"cli_config_profile_with_flag_override", [] {
                     TempWorkspace workspace;
                     workspace.create_file("profile.toml", R"(
[target]
url = "http://127.0.0.1:8080/health"
[run]
duration_seconds = 6
interval_seconds = 2
[observability]
backend = "none"
)");
                     Harness harness;
                     const auto path = workspace.path() / "report.json";
                     const int code = harness.run({"run", "--config",
                                                   (workspace.path() / "profile.toml").string(),
                                                   "--duration", "4", "--output", path.string()});
                     require(code == 0, "exit 0, stderr: " + harness.err.str());
                     require(harness.prober->calls() == 2, "flag duration wins over profile");
                     require(harness.err.str().empty(), "backend none keeps stderr quiet");
                   }});

  tests.push_back({"cli_verify_round_trip_and_tamper", [] {
                     TempWorkspace workspace;
                     const auto path = workspace.path() / "report.json";
                     Harness harness;
                     require(harness.run(run_args(path)) == 0, "run");

                     Harness verify;
                     require(verify.run({"verify", path.string()}) == 0, "verify ok");
                     require(verify.out.str().find("probes: 5/5 successful") != std::string::npos,
                             "summary printed");

                     auto content = common::read_file(path).value();
                     content += " ";
                     workspace.create_file("report.json", content);
                     Harness tampered;
                     require(tampered.run({"verify", path.string()}) == 4, "tamper exit code");
                   }});

  tests.push_back({"cli_usage_errors", [] {
                     Harness harness;
                     require(harness.run({"run", "--bogus"}) == 2, "unknown flag");
                     require(harness.run({"run", "--duration", "ten"}) == 2, "bad number");
                     require(harness.run({"run", "--url"}) == 2, "missing value");
                     require(harness.run({"frobnicate"}) == 2, "unknown command");
                     require(harness.run({"verify"}) == 2, "verify needs a path");
                     require(harness.prober->calls() == 0, "nothing probed");
                   }});

  tests.push_back({"cli_out_of_range_numbers_exit_two", [] {
                     const std::string url = "http://127.0.0.1:8080/health";
                     Harness status;
                     require(status.run({"run", "--url", url, "--expected-status", "4294967496",
                                         "--output", "-"}) == 2,
                             "status beyond int range is not wrapped");
                     require(status.out.str().empty(), "no report for wrapped status");

                     Harness fractional;
                     require(fractional.run({"run", "--url", url, "--expected-status", "200.5"}) ==
                                 2,
                             "fractional status");

                     Harness tail;
                     require(tail.run({"run", "--url", url, "--container", "api", "--docker-tail",
                                       "4294967296"}) == 2,
                             "tail beyond uint32 range");

                     Harness window;
                     require(window.run({"run", "--url", url, "--duration", "1e11", "--interval",
                                         "3600", "--output", "-"}) == 2,
                             "duration beyond the one-year window");
                     require(window.prober->calls() == 0, "nothing probed");
                     require(window.out.str().empty(), "no report written");
                   }});

  tests.push_back({"cli_repeated_shutdown_signal_requests_exit", [] {
                     common::CancelToken cancel;
                     cli::ShutdownSignals shutdown(cancel);
                     require(!shutdown.handle(SIGINT), "first signal lets the run wind down");
                     require(cancel.is_cancelled(), "first signal cancels the run");
                     require(shutdown.handle(SIGINT), "second signal exits immediately");
                     require(shutdown.handle(SIGTERM), "later signals keep exiting");
                     require(shutdown.received() == 3, "every signal counted");
                   }});

  tests.push_back({"cli_version_and_help", [] {
                     Harness harness;
                     require(harness.run({"--version"}) == 0, "version exit 0");
                     require(harness.out.str().rfind("stabcheck ", 0) == 0, "version text");
                     require(harness.run({"help"}) == 0, "help exit 0");
                     require(harness.out.str().find("--min-availability") != std::string::npos,
                             "help lists flags");
                     require(cli::version_string().find("stabcheck") == 0, "version prefix");
                   }});
}
