#pragma once
#include "cli/options.hpp"

#include <cstddef>
#include <string>

namespace repochurn::cli {

// Handlers get options already parsed, with the positional count checked.
using command_fn = int (*)(const Options &opts);

struct Command {
  std::string name;
  std::string args;    // positional synopsis, e.g. "<url> <out.pack>"
  std::string summary;
  std::size_t min_args = 0;
  std::size_t max_args = 0;
  command_fn fn = nullptr;
};

} // namespace repochurn::cli
