#include "oac/config/config.hpp"

#include "oac/common/fs.hpp"
#include "oac/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace oac::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".oac-client";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *CACHE_FOLDER = "oac-client";
constexpr const char *TOKEN_CACHE_FILENAME = "oac_token.json";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("OAC_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

bool load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return false;
  }

  std::ifstream file(path);
  if (!file) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    const std::string value = strip_env_quotes(trimmed.substr(eq + 1));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, value);
  }
  return true;
}

void load_auth_config(AuthConfig &auth, const common::TomlDocument &doc) {
  auth.token_url = expand_config_value(doc.get_string("auth.token_url", auth.token_url));
  auth.client_id = expand_config_value(doc.get_string("auth.client_id", auth.client_id));
  auth.client_secret =
      expand_config_value(doc.get_string("auth.client_secret", auth.client_secret));
  auth.scope = expand_config_value(doc.get_string("auth.scope", auth.scope));
  auth.grant_type = doc.get_string("auth.grant_type", auth.grant_type);
  auth.username = expand_config_value(doc.get_string("auth.username", auth.username));
  auth.password = expand_config_value(doc.get_string("auth.password", auth.password));
  auth.client_auth = common::to_lower(doc.get_string("auth.client_auth", auth.client_auth));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::Error::io("unable to resolve current directory"));
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<std::filesystem::path> default_token_cache_path() {
  if (const auto xdg = env_value("XDG_CACHE_HOME"); xdg.has_value()) {
    return common::Result<std::filesystem::path>::success(std::filesystem::path(*xdg) /
                                                          CACHE_FOLDER / TOKEN_CACHE_FILENAME);
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::Result<std::filesystem::path>::success(home.value() / ".cache" / CACHE_FOLDER /
                                                        TOKEN_CACHE_FILENAME);
}

std::vector<std::filesystem::path> load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const auto env_file = env_value("OAC_ENV_FILE"); env_file.has_value()) {
    candidates.emplace_back(common::expand_path(*env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  std::vector<std::filesystem::path> loaded;
  for (const auto &candidate : candidates) {
    if (load_dotenv_file(candidate)) {
      loaded.push_back(candidate);
    }
  }
  return loaded;
}

void apply_env_overrides(Config &config) {
  const auto assign = [](std::string &target, const char *name) {
    if (auto value = env_value(name); value.has_value()) {
      target = std::move(*value);
    }
  };

  assign(config.auth.token_url, "IDCS_TOKEN_URL");
  assign(config.auth.client_id, "IDCS_OAC_CLIENT_ID");
  assign(config.auth.client_secret, "IDCS_OAC_CLIENT_SECRET");
  assign(config.auth.scope, "IDCS_OAC_SCOPE");
  assign(config.auth.grant_type, "IDCS_GRANT_TYPE");
  assign(config.auth.username, "OAC_USERNAME");
  assign(config.auth.password, "OAC_PASSWORD");
  assign(config.instance.url, "OAC_INSTANCE");
  assign(config.observability.level, "OAC_LOG_LEVEL");

  if (auto cache = env_value("OAC_TOKEN_CACHE"); cache.has_value()) {
    config.cache.token_path = common::expand_path(*cache);
  }

  if (auto timeout = env_value("OAC_HTTP_TIMEOUT_MS"); timeout.has_value()) {
    std::uint64_t parsed = 0;
    const auto *first = timeout->data();
    const auto *last = first + timeout->size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc() && ptr == last) {
      config.http.timeout_ms = parsed;
    }
  }
}

common::Result<Config> load_config() {
  Config config;
  config.env_files = load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (cfg_path_result.ok() && std::filesystem::exists(cfg_path_result.value())) {
    const auto &path = cfg_path_result.value();
    std::ifstream file(path);
    if (!file) {
      return common::Result<Config>::failure(
          common::Error::config("unable to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    const auto parsed = common::parse_toml(buffer.str());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(
          common::Error::config(path.string() + ": " + parsed.error().message));
    }

    const auto &doc = parsed.value();
    load_auth_config(config.auth, doc);
    config.instance.url = expand_config_value(doc.get_string("instance.url", config.instance.url));
    config.http.timeout_ms = doc.get_u64("http.timeout_ms", config.http.timeout_ms);
    config.cache.token_path =
        common::expand_path(doc.get_string("cache.token_path", config.cache.token_path));
    config.observability.backend =
        doc.get_string("observability.backend", config.observability.backend);
    config.observability.level = doc.get_string("observability.level", config.observability.level);
  }

  apply_env_overrides(config);

  if (config.http.timeout_ms == 0) {
    config.http.timeout_ms = DEFAULT_HTTP_TIMEOUT_MS;
  }
  if (config.cache.token_path.empty()) {
    if (auto cache_path = default_token_cache_path(); cache_path.ok()) {
      config.cache.token_path = cache_path.value().string();
    }
  }

  return common::Result<Config>::success(std::move(config));
}

} // namespace oac::config
