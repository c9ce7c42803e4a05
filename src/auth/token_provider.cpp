#include "oac/auth/token_provider.hpp"

#include "oac/common/fs.hpp"
#include "oac/common/json_util.hpp"
#include "oac/observability/global.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <limits>
#include <sstream>
#include <unordered_map>

namespace oac::auth {

namespace {

std::string url_encode_component(const std::string &value) {
  std::ostringstream encoded;
  for (const unsigned char ch : value) {
    if ((ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
        (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      encoded << static_cast<char>(ch);
    } else {
      encoded << '%';
      encoded << "0123456789ABCDEF"[ch >> 4];
      encoded << "0123456789ABCDEF"[ch & 0x0F];
    }
  }
  return encoded.str();
}

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::string url_decode_component(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (ch == '+') {
      out.push_back(' ');
    } else if (ch == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 &&
               hex_value(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2])));
      i += 2;
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> parse_form(const std::string &body) {
  std::unordered_map<std::string, std::string> fields;
  std::size_t start = 0;
  while (start <= body.size()) {
    std::size_t end = body.find('&', start);
    if (end == std::string::npos) {
      end = body.size();
    }
    const std::string pair = body.substr(start, end - start);
    if (!pair.empty()) {
      const auto eq = pair.find('=');
      const std::string key = url_decode_component(pair.substr(0, eq));
      const std::string value =
          eq == std::string::npos ? std::string() : url_decode_component(pair.substr(eq + 1));
      fields.emplace(key, value);
    }
    start = end + 1;
  }
  return fields;
}

std::string base64_encode(const std::string &input) {
  const int output_len = 4 * static_cast<int>((input.size() + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()),
                  reinterpret_cast<const unsigned char *>(input.data()),
                  static_cast<int>(input.size()));
  return output;
}

std::optional<std::int64_t> parse_expires_in(const std::string &text) {
  const std::string trimmed = common::trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const auto *begin = trimmed.data();
  const auto *end = trimmed.data() + trimmed.size();
  const auto parsed = std::from_chars(begin, end, value);
  if (parsed.ec != std::errc() || parsed.ptr != end) {
    return common::json_number_to_int64(trimmed);
  }
  return value;
}

bool is_form_content_type(const http::HttpResponse &response) {
  const auto it = response.headers.find("content-type");
  if (it == response.headers.end()) {
    return false;
  }
  const std::string type = common::to_lower(it->second);
  return common::starts_with(type, "application/x-www-form-urlencoded") ||
         common::starts_with(type, "text/plain");
}

// Flattens either response encoding into string fields.
common::Result<std::unordered_map<std::string, std::string>>
decode_fields(const http::HttpResponse &response) {
  using Fields = std::unordered_map<std::string, std::string>;
  if (is_form_content_type(response)) {
    return common::Result<Fields>::success(parse_form(common::trim(response.body)));
  }

  auto parsed = common::json_parse_object(response.body);
  if (!parsed.ok()) {
    return common::Result<Fields>::failure(parsed.error());
  }
  Fields fields;
  for (const auto &[key, value] : parsed.value()) {
    if (value.kind == common::JsonKind::String || value.kind == common::JsonKind::Number) {
      fields.emplace(key, value.text);
    }
  }
  return common::Result<Fields>::success(std::move(fields));
}

std::string describe_failure(const http::HttpResponse &response) {
  std::string message = "token endpoint returned HTTP " + std::to_string(response.status);
  const std::string body = common::trim(response.body);
  if (body.empty()) {
    return message;
  }

  auto fields = decode_fields(response);
  if (fields.ok()) {
    const auto &values = fields.value();
    const auto error = values.find("error");
    if (error != values.end() && !error->second.empty()) {
      message += ": " + error->second;
      const auto description = values.find("error_description");
      if (description != values.end() && !description->second.empty()) {
        message += ": " + description->second;
      }
      return message;
    }
  }
  return message + ": " + body;
}

} // namespace

std::int64_t compute_expires_at(const std::optional<std::int64_t> expires_in,
                                const std::int64_t now) {
  std::int64_t lifetime =
      (expires_in.has_value() && *expires_in > 0) ? *expires_in : DEFAULT_TOKEN_LIFETIME_SECS;
  // Servers may advertise absurd lifetimes; saturate instead of overflowing.
  const std::int64_t headroom =
      now > 0 ? std::numeric_limits<std::int64_t>::max() - now
              : std::numeric_limits<std::int64_t>::max();
  lifetime = std::min(lifetime, headroom);
  return now + lifetime - EXPIRY_MARGIN_SECS;
}

http::HttpRequest build_token_request(const OAuthCredentials &credentials) {
  http::HttpRequest request;
  request.method = "POST";
  request.url = credentials.token_url;
  request.headers["Content-Type"] = "application/x-www-form-urlencoded";
  request.headers["Accept"] = "application/json";

  std::string body;
  if (const auto *password = std::get_if<ResourceOwnerPasswordGrant>(&credentials.grant)) {
    body = "grant_type=password";
    body += "&username=" + url_encode_component(password->username);
    body += "&password=" + url_encode_component(password->password);
  } else {
    body = "grant_type=client_credentials";
  }
  body += "&scope=" + url_encode_component(credentials.scope);

  if (credentials.auth_style == ClientAuthStyle::FormParams) {
    body += "&client_id=" + url_encode_component(credentials.client_id);
    body += "&client_secret=" + url_encode_component(credentials.client_secret);
  } else {
    request.headers["Authorization"] =
        "Basic " + base64_encode(url_encode_component(credentials.client_id) + ":" +
                                 url_encode_component(credentials.client_secret));
  }

  request.body = std::move(body);
  return request;
}

common::Result<TokenResponse> parse_token_response(const http::HttpResponse &response) {
  if (response.network_error) {
    const std::string cause = response.timeout ? "timed out: " : "network error: ";
    return common::Result<TokenResponse>::failure(
        common::Error::token_exchange(cause + response.network_error_message));
  }
  if (!response.success()) {
    return common::Result<TokenResponse>::failure(
        common::Error::token_exchange(describe_failure(response)));
  }

  auto fields = decode_fields(response);
  if (!fields.ok()) {
    return common::Result<TokenResponse>::failure(common::Error::token_exchange(
        "malformed token response: " + fields.error().message));
  }
  const auto &values = fields.value();

  TokenResponse token;
  if (const auto it = values.find("access_token"); it != values.end()) {
    token.access_token = it->second;
  }
  if (token.access_token.empty()) {
    return common::Result<TokenResponse>::failure(
        common::Error::token_exchange("server response missing access_token"));
  }
  if (const auto it = values.find("expires_in"); it != values.end()) {
    token.expires_in = parse_expires_in(it->second);
  }
  return common::Result<TokenResponse>::success(std::move(token));
}

OAuthTokenProvider::OAuthTokenProvider(http::HttpClient &http, config::AuthConfig auth,
                                       const std::uint64_t timeout_ms, Clock clock)
    : http_(http), auth_(std::move(auth)), timeout_ms_(timeout_ms), clock_(std::move(clock)) {}

common::Result<TokenRecord> OAuthTokenProvider::obtain() {
  auto credentials = resolve_credentials(auth_);
  if (!credentials.ok()) {
    return common::Result<TokenRecord>::failure(credentials.error());
  }
  if (credentials.value().token_url.empty()) {
    return common::Result<TokenRecord>::failure(
        common::Error::token_exchange("token endpoint URL is not configured"));
  }

  const std::string grant = grant_name(credentials.value().grant);
  const auto request = build_token_request(credentials.value());

  const auto started = std::chrono::steady_clock::now();
  const auto response = http_.send(request, timeout_ms_);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_metric(observability::TokenExchangeLatencyMetric{.latency = elapsed});
  observability::record_http_request("POST", request.url, response.status, 1, elapsed);

  auto parsed = parse_token_response(response);
  if (!parsed.ok()) {
    return common::Result<TokenRecord>::failure(parsed.error());
  }

  const std::int64_t now = clock_();
  TokenRecord record{.access_token = parsed.value().access_token,
                     .expires_at = compute_expires_at(parsed.value().expires_in, now)};
  observability::record_token_acquired(grant, record.expires_at - now);
  return common::Result<TokenRecord>::success(std::move(record));
}

} // namespace oac::auth
