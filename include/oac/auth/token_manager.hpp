#pragma once

#include "oac/auth/token.hpp"
#include "oac/auth/token_provider.hpp"
#include "oac/auth/token_store.hpp"
#include "oac/common/result.hpp"

#include <optional>
#include <string>

namespace oac::auth {

/// Owns the in-memory token for one process. Seeds itself from the store at
/// construction and falls back to the token source when the record is
/// missing or expired.
class TokenManager {
public:
  TokenManager(TokenSource &source, TokenStore store, Clock clock = now_unix);

  /// Bearer string of a record that is valid right now.
  [[nodiscard]] common::Result<std::string> get_token();

  /// Drops the in-memory record. The cache file is left alone.
  void invalidate();

  [[nodiscard]] const std::optional<TokenRecord> &current() const { return current_; }

private:
  TokenSource &source_;
  TokenStore store_;
  Clock clock_;
  std::optional<TokenRecord> current_;
};

} // namespace oac::auth
