#pragma once

#include "oac/auth/token.hpp"
#include "oac/common/result.hpp"

#include <filesystem>
#include <optional>

namespace oac::auth {

/// Single-record token cache persisted as
/// `{"access_token": "...", "expires_at": <unix seconds>}`.
class TokenStore {
public:
  explicit TokenStore(std::filesystem::path path);

  /// Returns the cached record, or nothing when the file is missing,
  /// unreadable, malformed or already expired at `now`.
  [[nodiscard]] std::optional<TokenRecord> load(std::int64_t now) const;
  [[nodiscard]] std::optional<TokenRecord> load() const { return load(now_unix()); }

  /// Write-then-rename with 0600 permissions, creating parent directories.
  [[nodiscard]] common::Status save(const TokenRecord &record) const;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace oac::auth
