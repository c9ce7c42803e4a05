#include "oac/common/error.hpp"

namespace oac::common {

std::string Error::to_string() const {
  switch (code) {
  case ErrorCode::Config:
    return "configuration error: " + message;
  case ErrorCode::UnsupportedGrant:
    return "unsupported grant type: " + message;
  case ErrorCode::TokenExchange:
    return "failed to obtain token: " + message;
  case ErrorCode::Request:
    return "request failed: " + message;
  case ErrorCode::Format:
    return "invalid JSON response: " + message;
  case ErrorCode::Io:
    return "I/O error: " + message;
  }
  return message;
}

Error Error::config(std::string message, std::vector<std::string> missing) {
  return Error{.code = ErrorCode::Config,
               .message = std::move(message),
               .missing = std::move(missing)};
}

Error Error::unsupported_grant(const std::string &grant_type) {
  return Error{.code = ErrorCode::UnsupportedGrant, .message = grant_type};
}

Error Error::token_exchange(std::string message) {
  return Error{.code = ErrorCode::TokenExchange, .message = std::move(message)};
}

Error Error::request(const std::uint16_t status, std::string body) {
  std::string message = std::to_string(status);
  if (!body.empty()) {
    message += " " + body;
  }
  return Error{.code = ErrorCode::Request,
               .message = std::move(message),
               .status = status,
               .body = std::move(body)};
}

Error Error::network(const std::string &url, const std::string &cause) {
  return Error{.code = ErrorCode::Request, .message = url + ": " + cause};
}

Error Error::format(std::string message) {
  return Error{.code = ErrorCode::Format, .message = std::move(message)};
}

Error Error::io(std::string message) {
  return Error{.code = ErrorCode::Io, .message = std::move(message)};
}

} // namespace oac::common
