#include "oac/auth/token_store.hpp"

#include "oac/common/fs.hpp"
#include "oac/common/json_util.hpp"
#include "oac/observability/global.hpp"

#include <chrono>
#include <fstream>

#include <sys/stat.h>

namespace oac::auth {

namespace {

constexpr const char *ACCESS_TOKEN_FIELD = "access_token";
constexpr const char *EXPIRES_AT_FIELD = "expires_at";

} // namespace

std::int64_t now_unix() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

TokenStore::TokenStore(std::filesystem::path path) : path_(std::move(path)) {}

std::optional<TokenRecord> TokenStore::load(const std::int64_t now) const {
  if (path_.empty()) {
    return std::nullopt;
  }

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    observability::record_token_cache("miss", path_.string());
    return std::nullopt;
  }

  const auto contents = common::read_file(path_);
  if (!contents.ok()) {
    observability::record_token_cache("invalid", path_.string(), contents.error().message);
    return std::nullopt;
  }

  const auto parsed = common::json_parse_object(contents.value());
  if (!parsed.ok()) {
    observability::record_token_cache("invalid", path_.string(), parsed.error().message);
    return std::nullopt;
  }

  const auto &fields = parsed.value();
  const auto token_it = fields.find(ACCESS_TOKEN_FIELD);
  const auto expiry_it = fields.find(EXPIRES_AT_FIELD);
  if (token_it == fields.end() || token_it->second.kind != common::JsonKind::String ||
      expiry_it == fields.end() || expiry_it->second.kind != common::JsonKind::Number) {
    observability::record_token_cache("invalid", path_.string(), "unexpected schema");
    return std::nullopt;
  }

  const auto expires_at = common::json_number_to_int64(expiry_it->second.text);
  if (!expires_at.has_value()) {
    observability::record_token_cache("invalid", path_.string(), "expires_at out of range");
    return std::nullopt;
  }

  if (token_it->second.text.empty()) {
    observability::record_token_cache("invalid", path_.string(), "empty access_token");
    return std::nullopt;
  }

  TokenRecord record{.access_token = token_it->second.text, .expires_at = *expires_at};
  if (!record.is_valid(now)) {
    observability::record_token_cache("expired", path_.string());
    return std::nullopt;
  }

  observability::record_token_cache("hit", path_.string());
  return record;
}

common::Status TokenStore::save(const TokenRecord &record) const {
  if (path_.empty()) {
    return common::Status::error(common::Error::io("no token cache path configured"));
  }

  if (path_.has_parent_path()) {
    const auto dir = common::ensure_dir(path_.parent_path());
    if (!dir.ok()) {
      return common::Status::error(dir.error());
    }
  }

  const std::filesystem::path tmp_path = path_.string() + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      return common::Status::error(common::Error::io("unable to write " + tmp_path.string()));
    }
    // Restrict before the secret is written.
    if (chmod(tmp_path.c_str(), S_IRUSR | S_IWUSR) != 0) {
      file.close();
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      return common::Status::error(
          common::Error::io("unable to restrict permissions on " + tmp_path.string()));
    }

    file << "{\"" << ACCESS_TOKEN_FIELD << "\":\"" << common::json_escape(record.access_token)
         << "\",\"" << EXPIRES_AT_FIELD << "\":" << record.expires_at << "}";
    file.close();
    if (!file) {
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      return common::Status::error(common::Error::io("failed writing " + tmp_path.string()));
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    return common::Status::error(
        common::Error::io("failed to replace " + path_.string() + ": " + ec.message()));
  }

  observability::record_token_cache("saved", path_.string());
  return common::Status::success();
}

} // namespace oac::auth
