#include "test_framework.hpp"

#include "stabcheck/common/fs.hpp"
#include "stabcheck/observability/factory.hpp"
#include "stabcheck/observability/global.hpp"
#include "stabcheck/observability/log_observer.hpp"
#include "stabcheck/observability/multi_observer.hpp"
#include "stabcheck/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <sstream>
#include <string>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
  int flushes = 0;
};

class CountingObserver final : public stabcheck::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const stabcheck::observability::ObserverEvent &) override { ++state_->events; }
  void record_metric(const stabcheck::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  void flush() override { ++state_->flushes; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

} // namespace

void register_observability_tests(std::vector<stabcheck::tests::TestCase> &tests) {
  using stabcheck::tests::require;
  namespace ob = stabcheck::observability;
  namespace common = stabcheck::common;
  using stabcheck::testing::mock_config;
  using stabcheck::testing::TempWorkspace;

  tests.push_back({"observability_global_routes_probe_events", [] {
                     CounterState state;
                     ob::set_global_observer(std::make_unique<CountingObserver>(&state));
                     ob::record_run_start("http://x/", 10.0, 2.0, 2.0);
                     ob::record_probe(ob::ProbeEvent{.index = 0, .success = true, .latency_ms = 3.0});
                     ob::record_probe(ob::ProbeEvent{.index = 1, .success = false, .error = "timeout"});
                     ob::record_warning("config", "soft");
                     ob::flush_global_observer();
                     require(state.events == 4, "four events");
                     require(state.metrics == 1, "latency metric only for the success");
                     require(state.flushes == 1, "flush forwarded");

                     ob::set_global_observer(nullptr);
                     ob::record_error("runner", "no observer installed");
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     CounterState one;
                     CounterState two;
                     ob::MultiObserver multi;
                     multi.add(std::make_unique<CountingObserver>(&one));
                     multi.add(std::make_unique<CountingObserver>(&two));
                     multi.add(nullptr);
                     multi.record_event(ob::ErrorEvent{.component = "x", .message = "y"});
                     multi.record_metric(ob::AvailabilityMetric{.availability_pct = 99.0});
                     require(multi.size() == 2, "null observer ignored");
                     require(one.events == 1 && two.events == 1, "events forwarded");
                     require(one.metrics == 1 && two.metrics == 1, "metrics forwarded");
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     auto config = mock_config();
                     config.observability.backend = "none";
                     require(ob::create_observer(config, "id")->name() == "noop", "none");
                     config.observability.backend = "log";
                     std::ostringstream sink;
                     require(ob::create_observer(config, "id", &sink)->name() == "log", "log");
                     config.observability.backend = "log,noop";
                     require(ob::create_observer(config, "id", &sink)->name() == "multi", "multi");
                     config.observability.backend = "statsd";
                     require(ob::create_observer(config, "id", &sink)->name() == "log",
                             "unknown falls back to log");
                   }});

  tests.push_back({"observability_factory_ignores_repeated_backends", [] {
                     auto config = mock_config();
                     config.observability.backend = "log, log,noop";
                     config.observability.log_level = "info";
                     std::ostringstream sink;
                     auto observer = ob::create_observer(config, "run42", &sink);
                     auto *multi = dynamic_cast<ob::MultiObserver *>(observer.get());
                     require(multi != nullptr, "comma list builds a multi observer");
                     require(multi->size() == 2, "one log and one noop child");
                     require(multi->contains("log") && multi->contains("noop"), "both backends");
                     require(!multi->contains("counting"), "unknown name");

                     observer->record_event(ob::WarningEvent{.component = "c", .message = "once"});
                     observer->flush();
                     const std::string text = sink.str();
                     const auto first = text.find("once");
                     require(first != std::string::npos, "warning logged");
                     require(text.find("once", first + 1) == std::string::npos,
                             "warning logged a single time");
                   }});

  tests.push_back({"observability_log_levels_filter_lines", [] {
                     require(ob::parse_log_level("WARNING") == ob::LogLevel::Warn, "warning alias");
                     require(!ob::parse_log_level("trace").has_value(), "unknown level");

                     std::ostringstream sink;
                     ob::LogObserver observer(ob::LogOptions{
                         .min_level = ob::LogLevel::Info, .run_id = "abc123", .console = &sink});
                     observer.record_event(ob::ProbeEvent{.index = 0, .success = true});
                     observer.record_event(
                         ob::ProbeEvent{.index = 1, .success = false, .error = "timeout"});
                     observer.record_event(ob::RunEndEvent{.state = "completed", .total_probes = 2});
                     const std::string text = sink.str();
                     require(text.find("index=0") == std::string::npos,
                             "successful probes log at debug");
                     require(text.find("[WARN] run=abc123 probe index=1") != std::string::npos,
                             "failed probe logged with run id");
                     require(text.find("run.end state=completed total=2") != std::string::npos,
                             "run end logged");
                   }});

  tests.push_back({"observability_log_file_is_appended", [] {
                     TempWorkspace workspace;
                     const auto path = workspace.path() / "logs" / "stabcheck.log";
                     workspace.create_file("logs/stabcheck.log", "previous line\n");
                     std::ostringstream sink;
                     {
                       ob::LogObserver observer(ob::LogOptions{.min_level = ob::LogLevel::Debug,
                                                               .log_file = path,
                                                               .console = &sink});
                       require(observer.file_sink_open(), "file sink open");
                       observer.record_event(ob::WarningEvent{.component = "collect",
                                                              .message = "docker missing"});
                       observer.flush();
                     }
                     const auto content = common::read_file(path);
                     require(content.ok(), content.error());
                     require(content.value().rfind("previous line\n", 0) == 0,
                             "existing content kept");
                     require(content.value().find("[WARN] collect: docker missing") !=
                                 std::string::npos,
                             "line appended");
                     require(sink.str().find("collect: docker missing") != std::string::npos,
                             "console also written");
                   }});
}
