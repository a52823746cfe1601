#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace repochurn {

// Locate the git directory for a work tree (<path>/.git) or a bare repository.
// Returns std::nullopt if `path` is neither.
std::optional<std::filesystem::path> find_git_dir(const std::filesystem::path& path);

// Read HEAD file as raw string (e.g., "ref: refs/heads/master\n" or a 40-hex id).
// Returns std::nullopt if HEAD does not exist yet.
std::optional<std::string> read_HEAD(const std::filesystem::path& git_dir);

// Look up a ref (e.g., "refs/heads/master") as a loose file first, then in
// packed-refs. Returns the 40-hex OID or std::nullopt.
std::optional<std::string> read_ref(const std::filesystem::path& git_dir, const std::string& refname);

// Commit id HEAD points at, following one level of symbolic ref.
// Throws EmptyRepositoryError if the branch has no commits yet.
std::string resolve_head(const std::filesystem::path& git_dir);

} // namespace repochurn
