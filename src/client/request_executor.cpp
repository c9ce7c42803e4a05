#include "oac/client/request_executor.hpp"

#include "oac/client/response_format.hpp"
#include "oac/common/fs.hpp"
#include "oac/observability/global.hpp"

#include <chrono>
#include <filesystem>

namespace oac::client {

namespace {

constexpr std::uint16_t HTTP_UNAUTHORIZED = 401;

void set_bearer(http::HttpRequest &request, const std::string &token) {
  request.headers["Authorization"] = "Bearer " + token;
}

} // namespace

std::string join_url(const std::string &base, const std::string &path) {
  std::string left = base;
  while (!left.empty() && left.back() == '/') {
    left.pop_back();
  }
  std::size_t start = 0;
  while (start < path.size() && path[start] == '/') {
    ++start;
  }
  return left + "/" + path.substr(start);
}

common::Result<std::string> resolve_request_body(const std::optional<std::string> &argument) {
  if (!argument.has_value() || argument->empty()) {
    return common::Result<std::string>::success("");
  }
  std::error_code ec;
  if (std::filesystem::exists(*argument, ec)) {
    return common::read_file(*argument);
  }
  return common::Result<std::string>::success(*argument);
}

RequestExecutor::RequestExecutor(http::HttpClient &http, auth::TokenManager &tokens,
                                 std::string instance_url, const std::uint64_t timeout_ms)
    : http_(http), tokens_(tokens), instance_url_(std::move(instance_url)),
      timeout_ms_(timeout_ms) {}

http::HttpResponse RequestExecutor::send_once(const http::HttpRequest &request,
                                              const std::uint32_t attempt) {
  const auto started = std::chrono::steady_clock::now();
  auto response = http_.send(request, timeout_ms_);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_metric(observability::RequestLatencyMetric{.latency = elapsed});
  observability::record_http_request(request.method, request.url, response.status, attempt,
                                     elapsed);
  return response;
}

common::Result<std::string> RequestExecutor::execute(const std::string &method,
                                                     const std::string &path,
                                                     const std::optional<std::string> &body) {
  if (common::trim(instance_url_).empty()) {
    return common::Result<std::string>::failure(
        common::Error::config("instance URL is not configured", {"instance_url"}));
  }

  auto payload = resolve_request_body(body);
  if (!payload.ok()) {
    return common::Result<std::string>::failure(payload.error());
  }

  auto token = tokens_.get_token();
  if (!token.ok()) {
    return common::Result<std::string>::failure(token.error());
  }

  http::HttpRequest request;
  request.method = common::to_upper(method);
  request.url = join_url(common::trim(instance_url_), path);
  request.headers["Content-Type"] = "application/json";
  request.body = payload.value();
  set_bearer(request, token.value());

  auto response = send_once(request, 1);
  if (!response.network_error && response.status == HTTP_UNAUTHORIZED) {
    tokens_.invalidate();
    auto refreshed = tokens_.get_token();
    if (!refreshed.ok()) {
      return common::Result<std::string>::failure(refreshed.error());
    }
    set_bearer(request, refreshed.value());
    response = send_once(request, 2);
  }

  if (response.network_error) {
    std::string cause = response.network_error_message;
    if (response.timeout) {
      cause = "timed out after " + std::to_string(timeout_ms_) + " ms (" + cause + ")";
    }
    return common::Result<std::string>::failure(common::Error::network(request.url, cause));
  }
  if (!response.success()) {
    return common::Result<std::string>::failure(
        common::Error::request(response.status, response.body));
  }
  return format_response_body(response.body);
}

} // namespace oac::client
