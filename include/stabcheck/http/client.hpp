#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

namespace stabcheck::http {

using Headers = std::unordered_map<std::string, std::string>;

/// Polled while a transfer is in flight; returning true aborts it.
using AbortCheck = std::function<bool()>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  Headers headers;
  // Set on any transport failure; the narrower flags below classify it.
  bool network_error = false;
  bool timeout = false;
  bool connect_failed = false;
  bool aborted = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse get(const std::string &url, const Headers &headers,
                                         std::uint64_t timeout_ms,
                                         const AbortCheck &should_abort = {}) = 0;
  [[nodiscard]] virtual HttpResponse head(const std::string &url, const Headers &headers,
                                          std::uint64_t timeout_ms,
                                          const AbortCheck &should_abort = {}) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse get(const std::string &url, const Headers &headers,
                                 std::uint64_t timeout_ms,
                                 const AbortCheck &should_abort = {}) override;
  [[nodiscard]] HttpResponse head(const std::string &url, const Headers &headers,
                                  std::uint64_t timeout_ms,
                                  const AbortCheck &should_abort = {}) override;
};

} // namespace stabcheck::http
