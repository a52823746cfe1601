#pragma once
#include <filesystem>
#include <string>

namespace repochurn {

struct Config {
  std::string agent = "repochurn"; // sent as agent=<value> in the want line
  long timeout_seconds = 60;       // HTTP timeout, 0 = none
  unsigned jobs = 1;               // parallel diff workers
  std::string log_level = "warn";  // spdlog level name
  bool append_git_suffix = true;   // append ".git" to repository URLs
};

// Read a "key: value" config file; defaults for a missing file or key.
// Throws ConfigError for values that do not parse.
Config load_config(const std::filesystem::path &path);

// $REPOCHURN_CONFIG, else $HOME/.repochurnrc (empty path if neither is known)
std::filesystem::path default_config_path();

} // namespace repochurn
