#include "repochurn/config.hpp"

#include "repochurn/errors.hpp"
#include "repochurn/fs.hpp"
#include "repochurn/util.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <string_view>
#include <system_error>

namespace {

long parse_long(std::string_view key, const std::string &value, long min) {
  long out = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc{} || ptr != value.data() + value.size() || out < min) {
    throw repochurn::ConfigError("config: bad value for " + std::string(key) + ": '" + value + "'");
  }
  return out;
}

bool parse_bool(std::string_view key, const std::string &value) {
  if (value == "true" || value == "yes" || value == "1")
    return true;
  if (value == "false" || value == "no" || value == "0")
    return false;
  throw repochurn::ConfigError("config: bad value for " + std::string(key) + ": '" + value + "'");
}

} // namespace

namespace repochurn {

auto load_config(const std::filesystem::path &path) -> Config {
  Config out{};
  if (path.empty() || !fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (strutil::trim(sv).empty() || strutil::trim(sv)[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos) {
      throw ConfigError("config: expected 'key: value' in line '" + line + "'");
    }
    const std::string key = strutil::trim(sv.substr(0, colon));
    const std::string value = strutil::trim(sv.substr(colon + 1));

    if (key == "agent") {
      if (value.empty() || value.find_first_of(" \t\n") != std::string::npos)
        throw ConfigError("config: agent must be a single non-empty token");
      out.agent = value;
    } else if (key == "timeout_seconds") {
      out.timeout_seconds = parse_long(key, value, 0);
    } else if (key == "jobs") {
      out.jobs = static_cast<unsigned>(parse_long(key, value, 1));
    } else if (key == "log_level") {
      if (spdlog::level::from_str(value) == spdlog::level::off && value != "off")
        throw ConfigError("config: unknown log_level '" + value + "'");
      out.log_level = value;
    } else if (key == "append_git_suffix") {
      out.append_git_suffix = parse_bool(key, value);
    }
  }
  return out;
}

std::filesystem::path default_config_path() {
  if (const char *explicit_path = std::getenv("REPOCHURN_CONFIG"); explicit_path != nullptr) {
    return explicit_path;
  }
  if (const char *home = std::getenv("HOME"); home != nullptr) {
    return std::filesystem::path(home) / ".repochurnrc";
  }
  return {};
}

} // namespace repochurn
