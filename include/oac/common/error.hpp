#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace oac::common {

enum class ErrorCode {
  Config,
  UnsupportedGrant,
  TokenExchange,
  Request,
  Format,
  Io,
};

struct Error {
  ErrorCode code = ErrorCode::Io;
  std::string message;
  // Set for Request errors; 0 when the request never got a response.
  std::uint16_t status = 0;
  std::string body;
  // Set for Config errors caused by absent settings.
  std::vector<std::string> missing;

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] static Error config(std::string message, std::vector<std::string> missing = {});
  [[nodiscard]] static Error unsupported_grant(const std::string &grant_type);
  [[nodiscard]] static Error token_exchange(std::string message);
  [[nodiscard]] static Error request(std::uint16_t status, std::string body);
  [[nodiscard]] static Error network(const std::string &url, const std::string &cause);
  [[nodiscard]] static Error format(std::string message);
  [[nodiscard]] static Error io(std::string message);
};

} // namespace oac::common
