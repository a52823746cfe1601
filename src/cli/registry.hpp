#pragma once
#include "cli/command.hpp"

#include <ostream>
#include <string_view>

namespace repochurn::cli {

void register_command(Command cmd);
const Command *find_command(std::string_view name);
void print_usage(std::ostream &os);

// Run the subcommand named by argv[1]. Exit codes: 0 ok, 1 failure, 2 usage.
int dispatch(int argc, char **argv);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace repochurn::cli
