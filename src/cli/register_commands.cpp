#include "cli/registry.hpp"

int cmd_analyze(const repochurn::cli::Options &opts);
int cmd_local(const repochurn::cli::Options &opts);
int cmd_refs(const repochurn::cli::Options &opts);
int cmd_fetch_pack(const repochurn::cli::Options &opts);
int cmd_pack(const repochurn::cli::Options &opts);

namespace repochurn::cli {

void register_all_commands() {
  register_command({.name = "analyze",
                    .args = "<url>",
                    .summary = "change counts for every path of a remote repository",
                    .min_args = 1,
                    .max_args = 1,
                    .fn = ::cmd_analyze});
  register_command({.name = "local",
                    .args = "[<dir>]",
                    .summary = "change counts for a work tree or bare repository",
                    .min_args = 0,
                    .max_args = 1,
                    .fn = ::cmd_local});
  register_command({.name = "refs",
                    .args = "<url>",
                    .summary = "show the HEAD a remote advertises",
                    .min_args = 1,
                    .max_args = 1,
                    .fn = ::cmd_refs});
  register_command({.name = "fetch-pack",
                    .args = "<url> <out.pack>",
                    .summary = "save the blob-less pack for the remote HEAD",
                    .min_args = 2,
                    .max_args = 2,
                    .fn = ::cmd_fetch_pack});
  register_command({.name = "pack",
                    .args = "<file.pack> <head-oid>",
                    .summary = "change counts from a saved pack",
                    .min_args = 2,
                    .max_args = 2,
                    .fn = ::cmd_pack});
}

} // namespace repochurn::cli
