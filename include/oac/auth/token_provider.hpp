#pragma once

#include "oac/auth/grant.hpp"
#include "oac/auth/token.hpp"
#include "oac/common/result.hpp"
#include "oac/config/schema.hpp"
#include "oac/http/http_client.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace oac::auth {

// Tokens are treated as expired this many seconds before the server says so.
inline constexpr std::int64_t EXPIRY_MARGIN_SECS = 60;
// Lifetime assumed when the token endpoint reports no expiry.
inline constexpr std::int64_t DEFAULT_TOKEN_LIFETIME_SECS = 3600;

/// Anything that can mint a fresh access token.
class TokenSource {
public:
  virtual ~TokenSource() = default;
  [[nodiscard]] virtual common::Result<TokenRecord> obtain() = 0;
};

struct TokenResponse {
  std::string access_token;
  std::optional<std::int64_t> expires_in;
};

[[nodiscard]] std::int64_t compute_expires_at(std::optional<std::int64_t> expires_in,
                                              std::int64_t now);

[[nodiscard]] http::HttpRequest build_token_request(const OAuthCredentials &credentials);

/// Accepts JSON or form-encoded bodies. Non-2xx statuses become
/// TokenExchange errors carrying the OAuth error fields when present.
[[nodiscard]] common::Result<TokenResponse> parse_token_response(const http::HttpResponse &response);

/// Performs the OAuth2 token exchange for the configured grant.
class OAuthTokenProvider final : public TokenSource {
public:
  OAuthTokenProvider(http::HttpClient &http, config::AuthConfig auth,
                     std::uint64_t timeout_ms = config::DEFAULT_HTTP_TIMEOUT_MS,
                     Clock clock = now_unix);

  [[nodiscard]] common::Result<TokenRecord> obtain() override;

private:
  http::HttpClient &http_;
  config::AuthConfig auth_;
  std::uint64_t timeout_ms_;
  Clock clock_;
};

} // namespace oac::auth
