#include "repochurn/config.hpp"
#include "repochurn/errors.hpp"
#include "repochurn/repo_url.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

using namespace repochurn;
using testsupport::throws;

static void write_file(const std::filesystem::path& p, std::string_view s) {
  std::filesystem::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const std::filesystem::path tmp = std::filesystem::temp_directory_path() / ("repochurn_cfg_" + std::to_string(std::random_device{}()));
  std::filesystem::create_directories(tmp);
  const std::filesystem::path cfg = tmp / "repochurnrc";

  try {
    // missing file -> defaults
    {
      const Config c = load_config(tmp / "absent");
      if (c.agent != "repochurn" || c.timeout_seconds != 60 || c.jobs != 1 || c.log_level != "warn" || !c.append_git_suffix) {
        std::cerr << "defaults: unexpected values\n"; return 1;
      }
    }

    // every key, with comments and blank lines
    {
      write_file(cfg, "# analyzer settings\n"
                      "\n"
                      "agent: repo-explorer\n"
                      "  timeout_seconds :  0  \n"
                      "jobs: 8\n"
                      "log_level: debug\n"
                      "append_git_suffix: no\n"
                      "unknown_key: ignored\n");
      const Config c = load_config(cfg);
      if (c.agent != "repo-explorer" || c.timeout_seconds != 0 || c.jobs != 8 || c.log_level != "debug" || c.append_git_suffix) {
        std::cerr << "parse: values\n"; return 1;
      }
    }

    // rejected values
    for (const char* bad : {"jobs: 0\n", "jobs: many\n", "timeout_seconds: -1\n", "append_git_suffix: maybe\n",
                            "agent: two words\n", "log_level: loud\n", "no separator here\n"}) {
      write_file(cfg, bad);
      if (!throws<ConfigError>([&] { (void)load_config(cfg); })) {
        std::cerr << "reject: accepted '" << bad << "'\n"; return 1;
      }
    }

    // URL normalization
    if (normalize_repo_url("https://example.com/user/dotfiles") != "https://example.com/user/dotfiles.git") {
      std::cerr << "url: suffix\n"; return 1;
    }
    if (normalize_repo_url("https://example.com/user/dotfiles.git/") != "https://example.com/user/dotfiles.git") {
      std::cerr << "url: trailing slash\n"; return 1;
    }
    if (normalize_repo_url("http://example.com/repo/", false) != "http://example.com/repo") {
      std::cerr << "url: no suffix\n"; return 1;
    }
    if (normalize_repo_url("https://example.com/user/dotfiles?tab=readme") != "https://example.com/user/dotfiles.git" ||
        normalize_repo_url("https://example.com/user/dotfiles/#readme") != "https://example.com/user/dotfiles.git" ||
        normalize_repo_url("https://example.com/user/dotfiles.git?x=1#y", false) != "https://example.com/user/dotfiles.git") {
      std::cerr << "url: query or fragment kept\n"; return 1;
    }
    if (!throws<Error>([] { (void)normalize_repo_url("git@example.com:user/repo.git"); }) ||
        !throws<Error>([] { (void)normalize_repo_url("https://"); })) {
      std::cerr << "url: invalid accepted\n"; return 1;
    }
    if (repository_name("https://example.com/user/dotfiles.git") != "dotfiles" ||
        repository_name("https://example.com/user/tools/") != "tools" ||
        repository_name("https://example.com/user/tools?ref=main") != "tools" ||
        repository_name("https://example.com/.git").has_value()) {
      std::cerr << "url: repository_name\n"; return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "config test failed: " << e.what() << "\n";
    return 1;
  }

  std::error_code ec;
  std::filesystem::remove_all(tmp, ec);
  std::cout << "OK\n";
  return 0;
}
