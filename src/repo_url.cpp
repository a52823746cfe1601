#include "repochurn/repo_url.hpp"

#include "repochurn/errors.hpp"

namespace repochurn {

namespace {

constexpr std::string_view kGitSuffix = ".git";

std::string_view strip_trailing_slashes(std::string_view s) {
  while (!s.empty() && s.back() == '/') {
    s.remove_suffix(1);
  }
  return s;
}

// Only scheme, host and path name a repository.
std::string_view strip_query_and_fragment(std::string_view s) {
  return s.substr(0, s.find_first_of("?#"));
}

} // namespace

auto normalize_repo_url(std::string_view url, bool append_git_suffix) -> std::string {
  std::size_t scheme_len = 0;
  if (url.starts_with("https://")) {
    scheme_len = 8;
  } else if (url.starts_with("http://")) {
    scheme_len = 7;
  } else {
    throw Error("unsupported repository URL (expected http:// or https://): " + std::string(url));
  }

  const std::string_view trimmed = strip_trailing_slashes(strip_query_and_fragment(url));
  if (trimmed.size() <= scheme_len) {
    throw Error("repository URL has no host: " + std::string(url));
  }

  std::string out(trimmed);
  if (append_git_suffix && !out.ends_with(kGitSuffix)) {
    out += kGitSuffix;
  }
  return out;
}

auto repository_name(std::string_view url) -> std::optional<std::string> {
  url = strip_trailing_slashes(strip_query_and_fragment(url));
  const std::size_t slash = url.rfind('/');
  std::string_view base = slash == std::string_view::npos ? url : url.substr(slash + 1);
  if (base.ends_with(kGitSuffix)) {
    base.remove_suffix(kGitSuffix.size());
  }
  if (base.empty()) {
    return std::nullopt;
  }
  return std::string(base);
}

} // namespace repochurn
