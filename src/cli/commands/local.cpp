#include "cli/options.hpp"
#include "repochurn/analyzer.hpp"

#include <filesystem>

int cmd_local(const repochurn::cli::Options &opts) {
  const std::filesystem::path dir =
      opts.positional.empty() ? std::filesystem::current_path() : std::filesystem::path(opts.positional[0]);
  const auto result = repochurn::analyze_local(dir, opts.config);
  return repochurn::cli::report("local", result, opts);
}
