#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace oac::http {

using Headers = std::unordered_map<std::string, std::string>;

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  Headers headers;
  std::string body;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  // Keys are lower-cased.
  Headers headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool success() const {
    return !network_error && status >= 200 && status < 300;
  }
};

/// How a request maps onto libcurl's method options. A request carrying a
/// body always names its method explicitly, otherwise libcurl sends POST.
struct CurlMethodPlan {
  bool http_get = false;
  bool no_body = false;
  std::string custom_request;
  bool send_body = false;
};

[[nodiscard]] CurlMethodPlan plan_curl_method(const HttpRequest &request);

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse send(const HttpRequest &request,
                                          std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse send(const HttpRequest &request, std::uint64_t timeout_ms) override;
};

} // namespace oac::http
