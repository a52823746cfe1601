#include "cli/options.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string_view>

namespace repochurn::cli {

namespace {

int parse_count(std::string_view flag, const std::string &value, int min) {
  try {
    std::size_t used = 0;
    const int n = std::stoi(value, &used);
    if (used == value.size() && n >= min) {
      return n;
    }
  } catch (const std::logic_error &) {
    // reported below
  }
  throw std::invalid_argument(std::string(flag) + " expects a number >= " + std::to_string(min) +
                              ", got '" + value + "'");
}

void print_node(std::ostream &os, const AnalysisNode &node, int indent, int depth_left) {
  for (const auto &child : node.children) {
    os << std::string(static_cast<std::size_t>(indent) * 2, ' ') << child->name
       << (child->is_directory() ? "/" : "") << "  changes=" << child->num_changes
       << " files=" << child->num_files << "\n";
    if (child->is_directory() && depth_left != 0) {
      print_node(os, *child, indent + 1, depth_left < 0 ? -1 : depth_left - 1);
    }
  }
}

} // namespace

Options parse_options(int argc, char **argv) {
  std::string config_path = default_config_path().string();
  int verbosity = 0;
  std::string jobs;
  Options opts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument(arg + " requires a value");
      }
      return argv[++i];
    };
    if (arg == "--config") {
      config_path = value();
    } else if (arg == "--jobs") {
      jobs = value();
    } else if (arg == "--path") {
      opts.path = value();
    } else if (arg == "--depth") {
      opts.depth = parse_count("--depth", value(), 0);
    } else if (arg == "-v") {
      verbosity = std::max(verbosity, 1);
    } else if (arg == "-vv") {
      verbosity = 2;
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw std::invalid_argument("unknown option " + arg);
    } else {
      opts.positional.push_back(arg);
    }
  }

  opts.config = load_config(config_path);
  if (!jobs.empty()) {
    opts.config.jobs = static_cast<unsigned>(parse_count("--jobs", jobs, 1));
  }
  if (verbosity == 1) {
    opts.config.log_level = "info";
  } else if (verbosity == 2) {
    opts.config.log_level = "debug";
  }
  return opts;
}

void setup_logging(const Config &config) {
  auto logger = spdlog::get("repochurn");
  if (!logger) {
    logger = spdlog::stderr_color_mt("repochurn");
  }
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(config.log_level));
  spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

void print_tree(std::ostream &os, const AnalysisNode &node, int max_depth) {
  if (max_depth == 0) {
    return;
  }
  print_node(os, node, 0, max_depth < 0 ? -1 : max_depth - 1);
}

int report(const char *cmd, const AnalyzeResult &result, const Options &opts) {
  if (!result) {
    std::cerr << cmd << ": " << result.error_message << "\n";
    return 1;
  }
  const AnalysisNode *node = follow_path(*result.root, opts.path);
  if (node == nullptr) {
    std::cerr << cmd << ": no such path in HEAD: " << opts.path << "\n";
    return 1;
  }
  std::cout << "HEAD " << result.head_ref << "  (" << result.stats.commits << " commits)\n";
  std::cout << (opts.path.empty() ? "/" : opts.path)
            << "  changes=" << node->num_changes << " files=" << node->num_files << "\n";
  if (node->is_directory()) {
    print_tree(std::cout, *node, opts.depth);
  }
  return 0;
}

} // namespace repochurn::cli
