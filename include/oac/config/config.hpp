#pragma once

#include "oac/common/result.hpp"
#include "oac/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace oac::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// $XDG_CACHE_HOME/oac-client/oac_token.json, else ~/.cache/oac-client/oac_token.json.
[[nodiscard]] common::Result<std::filesystem::path> default_token_cache_path();

/// Read KEY=VALUE lines from the candidate .env files into the process
/// environment without overwriting variables that are already set.
/// Returns the files that existed and were read.
std::vector<std::filesystem::path> load_dotenv_files();

[[nodiscard]] common::Result<Config> load_config();

void apply_env_overrides(Config &config);

} // namespace oac::config
