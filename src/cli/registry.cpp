#include "cli/registry.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace repochurn::cli {

namespace {

std::vector<Command> &table() {
  static std::vector<Command> t;
  return t;
}

void print_command_usage(std::ostream &os, const Command &cmd) {
  os << "usage: repochurn " << cmd.name << " " << cmd.args
     << " [--config F] [--jobs N] [--path P] [--depth N] [-v|-vv]\n";
}

} // namespace

void register_command(Command cmd) { table().push_back(std::move(cmd)); }

const Command *find_command(std::string_view name) {
  for (const auto &c : table()) {
    if (c.name == name) {
      return &c;
    }
  }
  return nullptr;
}

void print_usage(std::ostream &os) {
  os << "usage: repochurn <command> [args]\n\ncommands:\n";
  for (const auto &c : table()) {
    os << "  " << c.name << " " << c.args << "\n      " << c.summary << "\n";
  }
  os << "\noptions:\n"
        "  --config F   settings file (default $REPOCHURN_CONFIG or ~/.repochurnrc)\n"
        "  --jobs N     parallel diff workers\n"
        "  --path P     print the subtree at P instead of the root\n"
        "  --depth N    levels to print below the subtree\n"
        "  -v, -vv      info or debug logging on stderr\n";
}

int dispatch(int argc, char **argv) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 2;
  }
  const Command *cmd = find_command(argv[1]);
  if (cmd == nullptr) {
    std::cerr << "unknown command: " << argv[1] << "\n";
    print_usage(std::cerr);
    return 2;
  }

  try {
    const Options opts = parse_options(argc - 1, argv + 1);
    if (opts.positional.size() < cmd->min_args || opts.positional.size() > cmd->max_args) {
      print_command_usage(std::cerr, *cmd);
      return 2;
    }
    setup_logging(opts.config);
    return cmd->fn(opts);
  } catch (const std::invalid_argument &e) {
    std::cerr << cmd->name << ": " << e.what() << "\n";
    print_command_usage(std::cerr, *cmd);
    return 2;
  } catch (const std::exception &e) {
    std::cerr << cmd->name << ": " << e.what() << "\n";
    return 1;
  }
}

} // namespace repochurn::cli
