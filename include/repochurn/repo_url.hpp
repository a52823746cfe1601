#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace repochurn {

// Base URL for the smart HTTP endpoints: http(s) only, trailing '/' removed,
// ".git" appended when asked and not already present.
auto normalize_repo_url(std::string_view url, bool append_git_suffix = true) -> std::string;

// "https://host/user/dotfiles.git" -> "dotfiles"; nullopt if the last segment is empty.
auto repository_name(std::string_view url) -> std::optional<std::string>;

} // namespace repochurn
