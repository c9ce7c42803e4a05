#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace oac::auth {

/// Seconds since the Unix epoch.
[[nodiscard]] std::int64_t now_unix();

using Clock = std::function<std::int64_t()>;

struct TokenRecord {
  std::string access_token;
  std::int64_t expires_at = 0; // Unix timestamp (seconds)

  /// Usable only with a non-empty token and strictly before expires_at.
  [[nodiscard]] bool is_valid(std::int64_t now) const {
    return !access_token.empty() && now < expires_at;
  }
};

} // namespace oac::auth
