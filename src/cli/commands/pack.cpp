#include "cli/options.hpp"
#include "repochurn/analyzer.hpp"
#include "repochurn/fs.hpp"

int cmd_pack(const repochurn::cli::Options &opts) {
  const auto bytes = repochurn::fs::read_file(opts.positional[0]);
  const auto result = repochurn::analyze_pack(bytes, opts.positional[1], opts.config);
  return repochurn::cli::report("pack", result, opts);
}
