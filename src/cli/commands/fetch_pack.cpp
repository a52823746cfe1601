#include "cli/options.hpp"
#include "repochurn/fs.hpp"
#include "repochurn/http.hpp"
#include "repochurn/repo_url.hpp"
#include "repochurn/smart_http.hpp"

#include <iostream>
#include <string>

int cmd_fetch_pack(const repochurn::cli::Options &opts) {
  const std::string base =
      repochurn::normalize_repo_url(opts.positional[0], opts.config.append_git_suffix);
  repochurn::http::CurlTransport transport{repochurn::http::CurlOptions{
      .timeout_seconds = opts.config.timeout_seconds, .user_agent = opts.config.agent}};

  const auto ad = repochurn::smart::discover_head_ref(transport, base);
  const auto pack = repochurn::smart::fetch_pack(transport, base, ad.oid, opts.config.agent);
  repochurn::fs::write_file_atomic(opts.positional[1], pack);

  // The head id is needed again to analyze the saved pack.
  std::cout << ad.oid << " " << pack.size() << " bytes -> " << opts.positional[1] << "\n";
  return 0;
}
