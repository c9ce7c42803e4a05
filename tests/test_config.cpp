#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "oac/common/fs.hpp"
#include "oac/config/config.hpp"

#include <cstdlib>
#include <deque>
#include <filesystem>

namespace {

using oac::testing::EnvGuard;

const char *const MANAGED_ENV[] = {
    "IDCS_TOKEN_URL",  "IDCS_OAC_CLIENT_ID", "IDCS_OAC_CLIENT_SECRET", "IDCS_OAC_SCOPE",
    "IDCS_GRANT_TYPE", "OAC_USERNAME",       "OAC_PASSWORD",           "OAC_INSTANCE",
    "OAC_TOKEN_CACHE", "OAC_HTTP_TIMEOUT_MS", "OAC_LOG_LEVEL",         "OAC_ENV_FILE",
    "OAC_CONFIG_PATH", "XDG_CACHE_HOME",
};

// Starts every managed variable unset and restores the originals afterwards.
struct CleanEnv {
  std::deque<EnvGuard> guards;

  CleanEnv() {
    for (const char *name : MANAGED_ENV) {
      guards.emplace_back(name, std::nullopt);
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = oac::config::config_path_override();
    if (next.has_value()) {
      oac::config::set_config_path_override(*next);
    } else {
      oac::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      oac::config::set_config_path_override(*old_override);
    } else {
      oac::config::clear_config_path_override();
    }
  }
};

} // namespace

void register_config_tests(std::vector<oac::tests::TestCase> &tests) {
  using oac::tests::require;
  namespace cfg = oac::config;

  tests.push_back({"config_defaults_without_file", [] {
                     CleanEnv env;
                     oac::testing::TempWorkspace ws;
                     ConfigOverrideGuard guard(ws.path() / "config.toml");
                     EnvGuard home("HOME", ws.path().string());

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), "missing config file should load defaults");
                     const auto &config = loaded.value();
                     require(config.http.timeout_ms == cfg::DEFAULT_HTTP_TIMEOUT_MS,
                             "default timeout");
                     require(config.auth.client_auth == "header", "default client auth");
                     require(config.observability.level == "warn", "default log level");
                     require(config.cache.token_path ==
                                 (ws.path() / ".cache" / "oac-client" / "oac_token.json").string(),
                             "default cache path under HOME: " + config.cache.token_path);
                   }});

  tests.push_back({"config_loads_toml_file", [] {
                     CleanEnv env;
                     oac::testing::TempWorkspace ws;
                     ws.create_file("config.toml", "[auth]\n"
                                                   "token_url = \"https://idcs.example.com/\"\n"
                                                   "client_id = \"file-id\"\n"
                                                   "client_secret = \"file-secret\"\n"
                                                   "scope = \"scope-a\"\n"
                                                   "grant_type = \"resource_owner\"\n"
                                                   "username = \"alice\"\n"
                                                   "password = \"pw\"\n"
                                                   "client_auth = \"PARAMS\"\n"
                                                   "[instance]\n"
                                                   "url = \"https://oac.example.com\"\n"
                                                   "[http]\n"
                                                   "timeout_ms = 2500\n"
                                                   "[cache]\n"
                                                   "token_path = \"" +
                                                       (ws.path() / "tok.json").string() +
                                                       "\"\n"
                                                       "[observability]\n"
                                                       "level = \"debug\"\n");
                     ConfigOverrideGuard guard(ws.path() / "config.toml");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), "config should load");
                     const auto &config = loaded.value();
                     require(config.auth.token_url == "https://idcs.example.com/", "token_url");
                     require(config.auth.client_id == "file-id", "client_id");
                     require(config.auth.grant_type == "resource_owner", "grant_type");
                     require(config.auth.username == "alice", "username");
                     require(config.auth.client_auth == "params", "client_auth lower-cased");
                     require(config.instance.url == "https://oac.example.com", "instance");
                     require(config.http.timeout_ms == 2500, "timeout");
                     require(config.cache.token_path == (ws.path() / "tok.json").string(),
                             "cache path");
                     require(config.observability.level == "debug", "log level");
                   }});

  tests.push_back({"config_env_overrides_file", [] {
                     CleanEnv env;
                     oac::testing::TempWorkspace ws;
                     ws.create_file("config.toml", "[auth]\nclient_id = \"file-id\"\n"
                                                   "[http]\ntimeout_ms = 2500\n");
                     ConfigOverrideGuard guard(ws.path() / "config.toml");
                     EnvGuard id("IDCS_OAC_CLIENT_ID", std::string("env-id"));
                     EnvGuard instance("OAC_INSTANCE", std::string("https://env.example.com"));
                     EnvGuard timeout("OAC_HTTP_TIMEOUT_MS", std::string("1200"));
                     EnvGuard cache("OAC_TOKEN_CACHE", (ws.path() / "env.json").string());

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), "config should load");
                     require(loaded.value().auth.client_id == "env-id", "env wins");
                     require(loaded.value().instance.url == "https://env.example.com", "instance");
                     require(loaded.value().http.timeout_ms == 1200, "timeout");
                     require(loaded.value().cache.token_path == (ws.path() / "env.json").string(),
                             "cache override");
                   }});

  tests.push_back({"config_ignores_unparseable_timeout_env", [] {
                     CleanEnv env;
                     EnvGuard timeout("OAC_HTTP_TIMEOUT_MS", std::string("soon"));
                     cfg::Config config;
                     config.http.timeout_ms = 42;
                     cfg::apply_env_overrides(config);
                     require(config.http.timeout_ms == 42, "invalid value should be ignored");
                   }});

  tests.push_back({"config_zero_timeout_uses_default", [] {
                     CleanEnv env;
                     oac::testing::TempWorkspace ws;
                     ws.create_file("config.toml", "[http]\ntimeout_ms = 0\n");
                     ConfigOverrideGuard guard(ws.path() / "config.toml");
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), "config should load");
                     require(loaded.value().http.timeout_ms == cfg::DEFAULT_HTTP_TIMEOUT_MS,
                             "zero falls back to default");
                   }});

  tests.push_back({"config_malformed_file_is_config_error", [] {
                     CleanEnv env;
                     oac::testing::TempWorkspace ws;
                     ws.create_file("config.toml", "[auth]\nthis is not toml\n");
                     ConfigOverrideGuard guard(ws.path() / "config.toml");
                     auto loaded = cfg::load_config();
                     require(!loaded.ok(), "malformed config should fail");
                     require(loaded.error().code == oac::common::ErrorCode::Config,
                             "config error expected");
                   }});

  tests.push_back({"config_dotenv_fills_missing_only", [] {
                     CleanEnv env;
                     oac::testing::TempWorkspace ws;
                     ws.create_file(".env", "# credentials\n"
                                            "export IDCS_OAC_CLIENT_ID=\"dot-id\"\n"
                                            "IDCS_OAC_SCOPE='dot scope'\n"
                                            "IDCS_OAC_CLIENT_SECRET=dot-secret\n"
                                            "not-a-pair\n");
                     ConfigOverrideGuard guard(ws.path() / "config.toml");
                     EnvGuard secret("IDCS_OAC_CLIENT_SECRET", std::string("process-secret"));

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), "config should load");
                     const auto &config = loaded.value();
                     require(config.auth.client_id == "dot-id", "dotenv value applied");
                     require(config.auth.scope == "dot scope", "single quotes stripped");
                     require(config.auth.client_secret == "process-secret",
                             "existing environment wins");
                     bool found = false;
                     for (const auto &path : config.env_files) {
                       found = found || path == ws.path() / ".env";
                     }
                     require(found, "loaded .env should be reported");
                   }});

  tests.push_back({"config_env_file_variable_is_read_first", [] {
                     CleanEnv env;
                     oac::testing::TempWorkspace ws;
                     ws.create_file("custom.env", "IDCS_GRANT_TYPE=resource_owner\n");
                     ws.create_file("conf/.env", "IDCS_GRANT_TYPE=client_credentials\n");
                     ConfigOverrideGuard guard(ws.path() / "conf" / "config.toml");
                     EnvGuard env_file("OAC_ENV_FILE", (ws.path() / "custom.env").string());

                     const auto files = cfg::load_dotenv_files();
                     require(!files.empty() && files.front() == ws.path() / "custom.env",
                             "OAC_ENV_FILE should load first");
                     const char *grant = std::getenv("IDCS_GRANT_TYPE");
                     require(grant != nullptr && std::string(grant) == "resource_owner",
                             "first file wins");
                   }});

  tests.push_back({"config_default_cache_path_prefers_xdg", [] {
                     CleanEnv env;
                     EnvGuard xdg("XDG_CACHE_HOME", std::string("/tmp/xdg-cache"));
                     auto path = cfg::default_token_cache_path();
                     require(path.ok(), "path should resolve");
                     require(path.value() ==
                                 std::filesystem::path("/tmp/xdg-cache/oac-client/oac_token.json"),
                             "xdg path mismatch: " + path.value().string());
                   }});

  tests.push_back({"config_path_override_accepts_directory", [] {
                     CleanEnv env;
                     oac::testing::TempWorkspace ws;
                     ConfigOverrideGuard guard(ws.path());
                     auto path = cfg::config_path();
                     require(path.ok() && path.value() == ws.path() / "config.toml",
                             "directory override should resolve to config.toml");
                     auto dir = cfg::config_dir();
                     require(dir.ok() && dir.value() == ws.path(), "config dir");
                   }});
}
