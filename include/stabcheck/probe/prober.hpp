#pragma once

#include "stabcheck/common/cancel_token.hpp"
#include "stabcheck/common/clock.hpp"
#include "stabcheck/config/schema.hpp"
#include "stabcheck/http/client.hpp"
#include "stabcheck/probe/outcome.hpp"

#include <memory>

namespace stabcheck::probe {

/// Performs exactly one timed check. Implementations report every failure as
/// a ProbeOutcome and never throw.
class IProber {
public:
  virtual ~IProber() = default;

  [[nodiscard]] virtual ProbeOutcome probe(const config::RunConfig &config,
                                           const common::CancelToken &cancel) = 0;
};

class HttpProber final : public IProber {
public:
  explicit HttpProber(
      std::shared_ptr<http::HttpClient> client = std::make_shared<http::CurlHttpClient>(),
      std::shared_ptr<common::IClock> clock = std::make_shared<common::SystemClock>());

  [[nodiscard]] ProbeOutcome probe(const config::RunConfig &config,
                                   const common::CancelToken &cancel) override;

private:
  std::shared_ptr<http::HttpClient> client_;
  std::shared_ptr<common::IClock> clock_;
};

/// Apply the success rules to a completed transfer. Exposed for tests.
void classify_response(const config::RunConfig &config, const http::HttpResponse &response,
                       ProbeOutcome &outcome);

} // namespace stabcheck::probe
