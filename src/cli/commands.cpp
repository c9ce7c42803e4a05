#include "oac/cli/commands.hpp"

#include "oac/auth/token_manager.hpp"
#include "oac/auth/token_provider.hpp"
#include "oac/auth/token_store.hpp"
#include "oac/client/request_executor.hpp"
#include "oac/common/fs.hpp"
#include "oac/config/config.hpp"
#include "oac/observability/factory.hpp"
#include "oac/observability/global.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace oac::cli {

namespace {

std::string version_string() {
#ifdef OAC_VERSION
  std::string version = OAC_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "oac-client " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool method_requires_body(const std::string &method) {
  return method == "POST" || method == "PUT";
}

void print_help(std::ostream &out) {
  out << version_string() << "\n\n";
  out << "Usage: oac-client [--config PATH] [--verbose] <method> <path> [body]\n\n";
  out << "Sends an authenticated request to the Oracle Analytics Cloud REST API.\n";
  out << "POST and PUT take a body, either a path to a JSON file or a literal payload.\n\n";
  out << "Options:\n";
  out << "  --config PATH   Read settings from PATH instead of ~/.oac-client/config.toml\n";
  out << "  -v, --verbose   Log token and HTTP activity to stderr\n";
  out << "  -h, --help      Show this help\n";
  out << "  -V, --version   Show version\n\n";
  out << "Environment:\n";
  out << "  IDCS_TOKEN_URL IDCS_OAC_CLIENT_ID IDCS_OAC_CLIENT_SECRET IDCS_OAC_SCOPE\n";
  out << "  IDCS_GRANT_TYPE OAC_USERNAME OAC_PASSWORD OAC_INSTANCE OAC_TOKEN_CACHE\n";
  out << "  OAC_HTTP_TIMEOUT_MS OAC_LOG_LEVEL OAC_CONFIG_PATH OAC_ENV_FILE\n";
}

} // namespace

bool parse_request_args(const std::vector<std::string> &args, RequestOptions &out,
                        std::string &error) {
  // Only method and path can be mistaken for options; a body may start with '-'.
  for (std::size_t i = 0; i < args.size() && i < 2; ++i) {
    if (args[i].size() > 1 && args[i].front() == '-') {
      error = "unknown option: " + args[i];
      return false;
    }
  }
  if (args.size() < 2) {
    error = "usage: oac-client <method> <path> [body]";
    return false;
  }
  if (args.size() > 3) {
    error = "unexpected argument: " + args[3];
    return false;
  }

  out.method = common::to_upper(args[0]);
  out.path = args[1];
  out.body.reset();
  if (method_requires_body(out.method)) {
    if (args.size() < 3 || args[2].empty()) {
      error = out.method + " requires a body file";
      return false;
    }
    out.body = args[2];
  }
  return true;
}

int run_request(const config::Config &config, http::HttpClient &http,
                const RequestOptions &options, std::ostream &out, std::ostream &err) {
  auth::OAuthTokenProvider provider(http, config.auth, config.http.timeout_ms);
  auth::TokenManager tokens(provider, auth::TokenStore(config.cache.token_path));
  client::RequestExecutor executor(http, tokens, config.instance.url, config.http.timeout_ms);

  auto result = executor.execute(options.method, options.path, options.body);
  if (!result.ok()) {
    err << "Error: " << result.error().to_string() << "\n";
    return 1;
  }
  out << result.value() << "\n";
  return 0;
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << "Error: " << global_error << "\n";
    return 1;
  }
  const bool verbose = take_flag(args, "--verbose") || take_flag(args, "-v");

  if (take_flag(args, "--help") || take_flag(args, "-h")) {
    print_help(std::cout);
    return 0;
  }
  if (take_flag(args, "--version") || take_flag(args, "-V")) {
    std::cout << version_string() << "\n";
    return 0;
  }

  RequestOptions options;
  std::string usage_error;
  if (!parse_request_args(args, options, usage_error)) {
    std::cerr << "Error: " << usage_error << "\n";
    if (args.size() < 2) {
      print_help(std::cerr);
    }
    return 1;
  }

  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << "Error: " << loaded.error().to_string() << "\n";
    return 1;
  }
  config::Config config = loaded.value();
  if (verbose) {
    config.observability.level = "debug";
  }
  observability::set_global_observer(observability::create_observer(config));

  if (config.env_files.empty()) {
    observability::record_warning("config",
                                  "no .env file found, using environment and config file");
  }

  http::CurlHttpClient http;
  const int code = run_request(config, http, options, std::cout, std::cerr);
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

} // namespace oac::cli
