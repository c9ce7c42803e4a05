#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>

namespace oac::testing {

config::AuthConfig mock_auth_config() {
  config::AuthConfig auth;
  auth.token_url = "https://idcs.example.com/oauth2/v1/token";
  auth.client_id = "client-id";
  auth.client_secret = "client-secret";
  auth.scope = "urn:opc:resource:consumer::all";
  auth.grant_type = "client_credentials";
  return auth;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("oac-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc | std::ios::binary);
  out << content;
}

std::string TempWorkspace::read_file(const std::string &name) const {
  std::ifstream in(path_ / name, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

void MockHttpClient::push_response(http::HttpResponse response) {
  responses_.push_back(std::move(response));
}

void MockHttpClient::push(const std::uint16_t status, std::string body, http::Headers headers) {
  http::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  response.headers = std::move(headers);
  responses_.push_back(std::move(response));
}

void MockHttpClient::push_network_error(std::string message) {
  http::HttpResponse response;
  response.network_error = true;
  response.network_error_message = std::move(message);
  responses_.push_back(std::move(response));
}

http::HttpResponse MockHttpClient::send(const http::HttpRequest &request,
                                        const std::uint64_t timeout_ms) {
  requests_.push_back(request);
  last_timeout_ms_ = timeout_ms;
  if (responses_.empty()) {
    http::HttpResponse unexpected;
    unexpected.status = 599;
    unexpected.body = "unexpected request to " + request.url;
    return unexpected;
  }
  auto response = std::move(responses_.front());
  responses_.pop_front();
  return response;
}

void ScriptedTokenSource::push_token(std::string access_token, const std::int64_t expires_at) {
  results_.push_back(common::Result<auth::TokenRecord>::success(
      auth::TokenRecord{.access_token = std::move(access_token), .expires_at = expires_at}));
}

void ScriptedTokenSource::push_error(common::Error error) {
  results_.push_back(common::Result<auth::TokenRecord>::failure(std::move(error)));
}

common::Result<auth::TokenRecord> ScriptedTokenSource::obtain() {
  ++calls_;
  if (results_.empty()) {
    return common::Result<auth::TokenRecord>::failure(
        common::Error::token_exchange("no scripted token left"));
  }
  auto next = std::move(results_.front());
  results_.pop_front();
  return next;
}

std::string token_json(const std::string &access_token,
                       const std::optional<std::int64_t> expires_in) {
  std::string json = "{\"access_token\":\"" + access_token + "\",\"token_type\":\"Bearer\"";
  if (expires_in.has_value()) {
    json += ",\"expires_in\":" + std::to_string(*expires_in);
  }
  return json + "}";
}

} // namespace oac::testing
