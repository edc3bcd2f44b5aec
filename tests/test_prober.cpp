#include "test_framework.hpp"

#include "stabcheck/common/cancel_token.hpp"
#include "stabcheck/probe/prober.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

namespace cfg = stabcheck::config;
namespace http = stabcheck::http;

cfg::RunConfig base_run(std::optional<std::string> expected = std::nullopt) {
  cfg::RunConfig config;
  config.url = "http://127.0.0.1:8080/health";
  config.duration_seconds = 10.0;
  config.interval_seconds = 2.0;
  config.timeout_seconds = 1.5;
  config.expected = std::move(expected);
  return config;
}

http::HttpResponse response(const std::uint16_t status, std::string body) {
  http::HttpResponse out;
  out.status = status;
  out.body = std::move(body);
  return out;
}

http::HttpResponse transport_failure(const bool timeout, const bool connect_failed,
                                     const bool aborted = false) {
  http::HttpResponse out;
  out.network_error = true;
  out.timeout = timeout;
  out.connect_failed = connect_failed;
  out.aborted = aborted;
  out.network_error_message = "transport failure";
  return out;
}

} // namespace

void register_prober_tests(std::vector<stabcheck::tests::TestCase> &tests) {
  using stabcheck::tests::require;
  using stabcheck::tests::require_near;
  namespace probe = stabcheck::probe;
  namespace common = stabcheck::common;
  using stabcheck::testing::FakeClock;
  using stabcheck::testing::FakeHttpClient;

  tests.push_back({"prober_success_measures_latency_with_clock", [] {
                     auto clock = std::make_shared<FakeClock>();
                     auto client = std::make_shared<FakeHttpClient>(clock);
                     client->push_response(response(200, "OK\n"), 12.5);
                     probe::HttpProber prober(client, clock);
                     common::CancelToken cancel;

                     const auto outcome = prober.probe(base_run("OK"), cancel);
                     require(outcome.success, "trimmed body matches expected");
                     require(!outcome.error.has_value(), "success has no error");
                     require(outcome.status_code.value_or(0) == 200, "status recorded");
                     require_near(outcome.latency_ms, 12.5, 1e-6, "latency from clock");
                     require(client->requests().front().timeout_ms == 1500, "timeout in ms");
                     require(client->requests().front().method == "GET", "GET by default");
                   }});

  tests.push_back({"prober_body_mismatch_is_unexpected_response", [] {
                     auto client = std::make_shared<FakeHttpClient>();
                     client->push_response(response(200, "DEGRADED"));
                     probe::HttpProber prober(client, std::make_shared<FakeClock>());
                     common::CancelToken cancel;

                     const auto outcome = prober.probe(base_run("OK"), cancel);
                     require(!outcome.success, "mismatch fails");
                     require(outcome.error == probe::ProbeError::UnexpectedResponse, "tag");
                     require(outcome.status_code.value_or(0) == 200, "status still recorded");
                     require(outcome.error_detail.value_or("").find("DEGRADED") !=
                                 std::string::npos,
                             "detail shows body");
                   }});

  tests.push_back({"prober_expected_is_exact_not_substring", [] {
                     auto client = std::make_shared<FakeHttpClient>();
                     client->push_response(response(200, "NOT OK"));
                     probe::HttpProber prober(client, std::make_shared<FakeClock>());
                     common::CancelToken cancel;
                     require(!prober.probe(base_run("OK"), cancel).success,
                             "substring must not match");
                   }});

  tests.push_back({"prober_error_status_without_marker", [] {
                     probe::ProbeOutcome outcome;
                     probe::classify_response(base_run(), response(503, ""), outcome);
                     require(!outcome.success, "503 fails");
                     require(outcome.error == probe::ProbeError::UnexpectedResponse, "tag");

                     probe::classify_response(base_run(), response(204, ""), outcome);
                     require(outcome.success, "204 succeeds without marker");
                     require(!outcome.error_detail.has_value(), "detail reset");
                   }});

  tests.push_back({"prober_expected_status_exact", [] {
                     auto config = base_run();
                     config.expected_status = 503;
                     probe::ProbeOutcome outcome;
                     probe::classify_response(config, response(503, "maintenance"), outcome);
                     require(outcome.success, "configured status accepted");
                     probe::classify_response(config, response(200, "OK"), outcome);
                     require(outcome.error == probe::ProbeError::UnexpectedResponse,
                             "other status rejected");
                   }});

  tests.push_back({"prober_transport_failures_are_classified", [] {
                     probe::ProbeOutcome outcome;
                     probe::classify_response(base_run(), transport_failure(true, false), outcome);
                     require(outcome.error == probe::ProbeError::Timeout, "timeout");
                     require(!outcome.status_code.has_value(), "no status on timeout");

                     probe::classify_response(base_run(), transport_failure(false, true), outcome);
                     require(outcome.error == probe::ProbeError::ConnectionError, "connect");

                     probe::classify_response(base_run(), transport_failure(false, false), outcome);
                     require(outcome.error == probe::ProbeError::Other, "other");

                     probe::classify_response(base_run(), transport_failure(false, false, true),
                                              outcome);
                     require(outcome.error_detail.value_or("") == "cancelled", "aborted detail");
                   }});

  tests.push_back({"prober_contains_client_exceptions", [] {
                     auto client = std::make_shared<FakeHttpClient>();
                     client->push_exception("boom");
                     probe::HttpProber prober(client, std::make_shared<FakeClock>());
                     common::CancelToken cancel;
                     const auto outcome = prober.probe(base_run(), cancel);
                     require(!outcome.success, "exception becomes failure");
                     require(outcome.error == probe::ProbeError::Other, "other tag");
                     require(outcome.error_detail.value_or("") == "boom", "message kept");
                   }});

  tests.push_back({"prober_head_method", [] {
                     auto client = std::make_shared<FakeHttpClient>();
                     client->push_response(response(200, ""));
                     probe::HttpProber prober(client, std::make_shared<FakeClock>());
                     common::CancelToken cancel;
                     auto config = base_run();
                     config.method = cfg::HttpMethod::Head;
                     require(prober.probe(config, cancel).success, "HEAD 200 succeeds");
                     require(client->requests().front().method == "HEAD", "HEAD sent");
                   }});

  tests.push_back({"prober_curl_refused_port_is_connection_error", [] {
                     probe::HttpProber prober;
                     common::CancelToken cancel;
                     auto config = base_run();
                     config.url = "http://127.0.0.1:1/health";
                     const auto outcome = prober.probe(config, cancel);
                     require(!outcome.success, "nothing listens on port 1");
                     require(outcome.error == probe::ProbeError::ConnectionError,
                             "refused connection is connection_error");
                     require(outcome.latency_ms >= 0.0, "latency non-negative");
                   }});
}
