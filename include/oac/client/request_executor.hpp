#pragma once

#include "oac/auth/token_manager.hpp"
#include "oac/common/result.hpp"
#include "oac/config/schema.hpp"
#include "oac/http/http_client.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace oac::client {

/// Joins base and path with exactly one slash between them.
[[nodiscard]] std::string join_url(const std::string &base, const std::string &path);

/// An argument naming an existing file yields the file's bytes; any other
/// argument is the payload itself. No argument means an empty body.
[[nodiscard]] common::Result<std::string>
resolve_request_body(const std::optional<std::string> &argument);

/// Sends bearer-authenticated requests to the analytics instance. A 401
/// invalidates the token and repeats the request exactly once.
class RequestExecutor {
public:
  RequestExecutor(http::HttpClient &http, auth::TokenManager &tokens, std::string instance_url,
                  std::uint64_t timeout_ms = config::DEFAULT_HTTP_TIMEOUT_MS);

  /// Returns the formatted response body.
  [[nodiscard]] common::Result<std::string> execute(const std::string &method,
                                                    const std::string &path,
                                                    const std::optional<std::string> &body);

private:
  [[nodiscard]] http::HttpResponse send_once(const http::HttpRequest &request,
                                             std::uint32_t attempt);

  http::HttpClient &http_;
  auth::TokenManager &tokens_;
  std::string instance_url_;
  std::uint64_t timeout_ms_;
};

} // namespace oac::client
