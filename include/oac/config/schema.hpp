#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace oac::config {

inline constexpr std::uint64_t DEFAULT_HTTP_TIMEOUT_MS = 30000;

struct AuthConfig {
  std::string token_url;
  std::string client_id;
  std::string client_secret;
  std::string scope;
  std::string grant_type;
  std::string username;
  std::string password;
  // "header" sends HTTP Basic credentials, "params" puts them in the form body.
  std::string client_auth = "header";
};

struct InstanceConfig {
  std::string url;
};

struct HttpConfig {
  std::uint64_t timeout_ms = DEFAULT_HTTP_TIMEOUT_MS;
};

struct CacheConfig {
  std::string token_path;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "warn";
};

struct Config {
  AuthConfig auth;
  InstanceConfig instance;
  HttpConfig http;
  CacheConfig cache;
  ObservabilityConfig observability;

  // .env files that were read while loading, in load order.
  std::vector<std::filesystem::path> env_files;
};

} // namespace oac::config
