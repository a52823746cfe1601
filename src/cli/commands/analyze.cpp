#include "cli/options.hpp"
#include "repochurn/analyzer.hpp"

int cmd_analyze(const repochurn::cli::Options &opts) {
  const auto result = repochurn::analyze_repo(opts.positional[0], opts.config);
  return repochurn::cli::report("analyze", result, opts);
}
