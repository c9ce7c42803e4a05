#pragma once

#include "oac/common/result.hpp"
#include "oac/config/schema.hpp"

#include <string>
#include <variant>

namespace oac::auth {

inline constexpr const char *GRANT_CLIENT_CREDENTIALS = "client_credentials";
inline constexpr const char *GRANT_RESOURCE_OWNER = "resource_owner";

struct ClientCredentialsGrant {};

struct ResourceOwnerPasswordGrant {
  std::string username;
  std::string password;
};

using Grant = std::variant<ClientCredentialsGrant, ResourceOwnerPasswordGrant>;

enum class ClientAuthStyle { BasicHeader, FormParams };

struct OAuthCredentials {
  std::string token_url;
  std::string client_id;
  std::string client_secret;
  std::string scope;
  Grant grant;
  ClientAuthStyle auth_style = ClientAuthStyle::BasicHeader;
};

/// Validate the auth settings and turn them into typed credentials.
/// Fails with a Config error naming every missing setting, or an
/// UnsupportedGrant error naming an unknown grant type.
[[nodiscard]] common::Result<OAuthCredentials> resolve_credentials(const config::AuthConfig &auth);

[[nodiscard]] std::string grant_name(const Grant &grant);

} // namespace oac::auth
