#include "cli/options.hpp"
#include "repochurn/http.hpp"
#include "repochurn/repo_url.hpp"
#include "repochurn/smart_http.hpp"

#include <iostream>
#include <string>

int cmd_refs(const repochurn::cli::Options &opts) {
  const std::string base =
      repochurn::normalize_repo_url(opts.positional[0], opts.config.append_git_suffix);
  repochurn::http::CurlTransport transport{repochurn::http::CurlOptions{
      .timeout_seconds = opts.config.timeout_seconds, .user_agent = opts.config.agent}};
  const auto ad = repochurn::smart::discover_head_ref(transport, base);

  if (const auto name = repochurn::repository_name(base)) {
    std::cout << "repository: " << *name << "\n";
  }
  std::cout << ad.oid << " " << ad.name << "\n";
  if (ad.symref) {
    std::cout << "default branch: " << *ad.symref << "\n";
  }
  std::cout << "capabilities:";
  for (const auto &cap : ad.capabilities) {
    std::cout << " " << cap;
  }
  std::cout << "\n";
  return 0;
}
