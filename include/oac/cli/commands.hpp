#pragma once

#include "oac/config/schema.hpp"
#include "oac/http/http_client.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace oac::cli {

struct RequestOptions {
  std::string method;
  std::string path;
  std::optional<std::string> body;
};

/// Parses `<method> <path> [body]`. The method comes back upper-cased and the
/// body is kept only for methods that send one.
[[nodiscard]] bool parse_request_args(const std::vector<std::string> &args,
                                      RequestOptions &out, std::string &error);

/// Runs one authenticated request and prints the outcome. Returns the exit code.
int run_request(const config::Config &config, http::HttpClient &http,
                const RequestOptions &options, std::ostream &out, std::ostream &err);

int run_cli(int argc, char **argv);

} // namespace oac::cli
