#include "stabcheck/probe/prober.hpp"

#include "stabcheck/common/fs.hpp"
#include "stabcheck/config/config.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

namespace stabcheck::probe {

namespace {

std::uint64_t timeout_millis(const double seconds) {
  constexpr double MAX_TIMEOUT_MILLIS = config::MAX_WINDOW_SECONDS * 1000.0;
  const double millis = std::ceil(seconds * 1000.0);
  if (std::isnan(millis) || millis < 1.0) {
    return 1U;
  }
  return static_cast<std::uint64_t>(std::min(millis, MAX_TIMEOUT_MILLIS));
}

std::string truncate_for_detail(const std::string &body) {
  constexpr std::size_t MAX_DETAIL_BODY = 120;
  std::string trimmed = common::trim(body);
  if (trimmed.size() > MAX_DETAIL_BODY) {
    trimmed = common::truncate_utf8(trimmed, MAX_DETAIL_BODY) + "...";
  }
  return trimmed;
}

} // namespace

std::string_view probe_error_name(const ProbeError error) {
  switch (error) {
  case ProbeError::Timeout:
    return "timeout";
  case ProbeError::ConnectionError:
    return "connection_error";
  case ProbeError::UnexpectedResponse:
    return "unexpected_response";
  case ProbeError::Other:
    return "other";
  }
  return "other";
}

void classify_response(const config::RunConfig &config, const http::HttpResponse &response,
                       ProbeOutcome &outcome) {
  outcome.success = false;
  outcome.error.reset();
  outcome.error_detail.reset();
  outcome.status_code.reset();

  if (response.network_error) {
    if (response.timeout) {
      outcome.error = ProbeError::Timeout;
    } else if (response.connect_failed) {
      outcome.error = ProbeError::ConnectionError;
    } else {
      outcome.error = ProbeError::Other;
    }
    outcome.error_detail = response.aborted ? std::string("cancelled")
                                            : response.network_error_message;
    return;
  }

  outcome.status_code = static_cast<int>(response.status);

  if (config.expected_status.has_value()) {
    if (static_cast<int>(response.status) != *config.expected_status) {
      outcome.error = ProbeError::UnexpectedResponse;
      outcome.error_detail = "expected status " + std::to_string(*config.expected_status) +
                             ", got " + std::to_string(response.status);
      return;
    }
  } else if (response.status >= 400 || response.status == 0) {
    outcome.error = ProbeError::UnexpectedResponse;
    outcome.error_detail = "HTTP status " + std::to_string(response.status);
    return;
  }

  if (config.expected.has_value() && common::trim(response.body) != *config.expected) {
    outcome.error = ProbeError::UnexpectedResponse;
    outcome.error_detail = "expected body '" + *config.expected + "', got '" +
                           truncate_for_detail(response.body) + "'";
    return;
  }

  outcome.success = true;
}

HttpProber::HttpProber(std::shared_ptr<http::HttpClient> client,
                       std::shared_ptr<common::IClock> clock)
    : client_(std::move(client)), clock_(std::move(clock)) {}

ProbeOutcome HttpProber::probe(const config::RunConfig &config,
                               const common::CancelToken &cancel) {
  ProbeOutcome outcome;
  outcome.timestamp = clock_->wall_now();
  outcome.started = clock_->now();

  const auto timeout_ms = timeout_millis(config.timeout_seconds);
  const http::AbortCheck should_abort = [&cancel]() { return cancel.is_cancelled(); };

  http::HttpResponse response;
  try {
    response = config.method == config::HttpMethod::Head
                   ? client_->head(config.url, {}, timeout_ms, should_abort)
                   : client_->get(config.url, {}, timeout_ms, should_abort);
  } catch (const std::exception &ex) {
    response = http::HttpResponse{};
    response.network_error = true;
    response.network_error_message = ex.what();
  }

  outcome.latency_ms = std::max(0.0, common::to_millis(clock_->now() - outcome.started));
  classify_response(config, response, outcome);
  return outcome;
}

} // namespace stabcheck::probe
