#include "oac/auth/token_manager.hpp"

#include "oac/observability/global.hpp"

namespace oac::auth {

TokenManager::TokenManager(TokenSource &source, TokenStore store, Clock clock)
    : source_(source), store_(std::move(store)), clock_(std::move(clock)) {
  current_ = store_.load(clock_());
}

common::Result<std::string> TokenManager::get_token() {
  if (current_.has_value() && current_->is_valid(clock_())) {
    return common::Result<std::string>::success(current_->access_token);
  }
  current_.reset();

  auto fresh = source_.obtain();
  if (!fresh.ok()) {
    return common::Result<std::string>::failure(fresh.error());
  }
  current_ = fresh.value();

  const auto saved = store_.save(*current_);
  if (!saved.ok()) {
    observability::record_warning("token_cache",
                                  "failed to save token: " + saved.error().to_string());
  }
  return common::Result<std::string>::success(current_->access_token);
}

void TokenManager::invalidate() {
  current_.reset();
  observability::record_token_invalidated("server rejected token");
}

} // namespace oac::auth
