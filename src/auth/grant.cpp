#include "oac/auth/grant.hpp"

#include "oac/common/fs.hpp"

#include <vector>

namespace oac::auth {

namespace {

std::string join(const std::vector<std::string> &values) {
  std::string out;
  for (const auto &value : values) {
    if (!out.empty()) {
      out += ", ";
    }
    out += value;
  }
  return out;
}

common::Error missing_settings(std::vector<std::string> missing, const std::string &context) {
  std::string message = "missing required " + context + ": " + join(missing);
  return common::Error::config(std::move(message), std::move(missing));
}

} // namespace

common::Result<OAuthCredentials> resolve_credentials(const config::AuthConfig &auth) {
  std::vector<std::string> missing;
  if (auth.client_id.empty()) {
    missing.emplace_back("client_id");
  }
  if (auth.client_secret.empty()) {
    missing.emplace_back("client_secret");
  }
  if (auth.scope.empty()) {
    missing.emplace_back("scope");
  }
  if (auth.grant_type.empty()) {
    missing.emplace_back("grant_type");
  }
  if (!missing.empty()) {
    return common::Result<OAuthCredentials>::failure(
        missing_settings(std::move(missing), "auth configuration"));
  }

  OAuthCredentials credentials;
  credentials.token_url = auth.token_url;
  while (!credentials.token_url.empty() && credentials.token_url.back() == '/') {
    credentials.token_url.pop_back();
  }
  credentials.client_id = auth.client_id;
  credentials.client_secret = auth.client_secret;
  credentials.scope = auth.scope;

  const std::string client_auth = common::to_lower(common::trim(auth.client_auth));
  if (client_auth.empty() || client_auth == "header" || client_auth == "basic") {
    credentials.auth_style = ClientAuthStyle::BasicHeader;
  } else if (client_auth == "params" || client_auth == "body") {
    credentials.auth_style = ClientAuthStyle::FormParams;
  } else {
    return common::Result<OAuthCredentials>::failure(common::Error::config(
        "unknown client_auth '" + auth.client_auth + "' (expected header or params)"));
  }

  if (auth.grant_type == GRANT_CLIENT_CREDENTIALS) {
    credentials.grant = ClientCredentialsGrant{};
  } else if (auth.grant_type == GRANT_RESOURCE_OWNER) {
    if (auth.username.empty()) {
      missing.emplace_back("username");
    }
    if (auth.password.empty()) {
      missing.emplace_back("password");
    }
    if (!missing.empty()) {
      return common::Result<OAuthCredentials>::failure(
          missing_settings(std::move(missing), "credentials for password grant"));
    }
    credentials.grant =
        ResourceOwnerPasswordGrant{.username = auth.username, .password = auth.password};
  } else {
    return common::Result<OAuthCredentials>::failure(
        common::Error::unsupported_grant(auth.grant_type));
  }

  return common::Result<OAuthCredentials>::success(std::move(credentials));
}

std::string grant_name(const Grant &grant) {
  if (std::holds_alternative<ResourceOwnerPasswordGrant>(grant)) {
    return GRANT_RESOURCE_OWNER;
  }
  return GRANT_CLIENT_CREDENTIALS;
}

} // namespace oac::auth
