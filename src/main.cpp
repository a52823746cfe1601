#include "cli/registry.hpp"

int main(int argc, char **argv) {
  repochurn::cli::register_all_commands();
  return repochurn::cli::dispatch(argc, argv);
}
