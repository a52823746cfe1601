#pragma once
#include "repochurn/analyzer.hpp"
#include "repochurn/config.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace repochurn::cli {

struct Options {
  Config config;
  std::vector<std::string> positional;
  std::string path;   // --path: subtree to print, "" = root
  int depth = -1;     // --depth: levels to print below the subtree, -1 = all
};

// Parse argv (argv[0] is the subcommand), load the config file and apply
// command-line overrides. Throws std::invalid_argument on bad usage.
Options parse_options(int argc, char **argv);

// Route spdlog to stderr at the configured level.
void setup_logging(const Config &config);

void print_tree(std::ostream &os, const AnalysisNode &node, int max_depth);

// Print a finished analysis (or its error). Returns the process exit code.
int report(const char *cmd, const AnalyzeResult &result, const Options &opts);

} // namespace repochurn::cli
