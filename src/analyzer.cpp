#include "repochurn/analyzer.hpp"

#include "repochurn/errors.hpp"
#include "repochurn/local_repo.hpp"
#include "repochurn/pack.hpp"
#include "repochurn/refs.hpp"
#include "repochurn/repo_url.hpp"
#include "repochurn/smart_http.hpp"
#include "repochurn/util.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <functional>

namespace repochurn {

namespace {

[[nodiscard]] auto parse_head(std::string_view hex) -> oid {
  oid id{};
  if (!looks_hex40(hex) || !from_hex(hex, id)) {
    throw Error("not a 40-hex commit id: '" + std::string(hex) + "'");
  }
  return id;
}

// All-or-nothing: any exception becomes the run's error message.
[[nodiscard]] auto run_guarded(const std::function<void(AnalyzeResult &)> &body) -> AnalyzeResult {
  AnalyzeResult result;
  try {
    body(result);
    result.success = true;
  } catch (const std::exception &e) {
    spdlog::debug("analysis failed: {}", e.what());
    result = AnalyzeResult{};
    result.error_message = e.what();
  }
  return result;
}

void analyze_into(AnalyzeResult &result, const ObjectGraph &graph, std::string_view head_hex,
                  const Config &config) {
  result.head_ref = std::string(head_hex);
  result.root = analyze_graph(graph, parse_head(head_hex), config.jobs, &result.stats);
}

void analyze_remote_into(AnalyzeResult &result, http::Transport &transport,
                         std::string_view repo_url, const Config &config) {
  const std::string base = normalize_repo_url(repo_url, config.append_git_suffix);
  const auto ad = smart::discover_head_ref(transport, base);
  const auto pack_bytes = smart::fetch_pack(transport, base, ad.oid, config.agent);

  MemoryObjectGraph graph;
  const auto stats = pack::decode_pack(pack_bytes, graph);
  spdlog::info("received pack: {} objects ({} commits, {} trees)", stats.objects, stats.commits,
               stats.trees);
  analyze_into(result, graph, ad.oid, config);
}

} // namespace

auto analyze_graph(const ObjectGraph &graph, const oid &head, unsigned jobs, WalkStats *stats)
    -> std::unique_ptr<AnalysisNode> {
  PathChangeMap changes;
  CommitWalker walker{graph, changes, jobs};
  const WalkStats walked = walker.walk(head);
  if (stats != nullptr) {
    *stats = walked;
  }
  const CommitNode head_commit = graph.resolve_commit(head);
  auto root = build_analysis_tree(graph, head_commit.tree, changes);
  spdlog::info("analysis of {}: {} files, {} changed paths", to_hex(head), root->num_files,
               changes.size());
  return root;
}

auto analyze_repo(http::Transport &transport, std::string_view repo_url, const Config &config)
    -> AnalyzeResult {
  return run_guarded(
      [&](AnalyzeResult &result) { analyze_remote_into(result, transport, repo_url, config); });
}

auto analyze_repo(std::string_view repo_url, const Config &config) -> AnalyzeResult {
  return run_guarded([&](AnalyzeResult &result) {
    http::CurlTransport transport{
        http::CurlOptions{.timeout_seconds = config.timeout_seconds, .user_agent = config.agent}};
    analyze_remote_into(result, transport, repo_url, config);
  });
}

auto analyze_local(const std::filesystem::path &path, const Config &config) -> AnalyzeResult {
  return run_guarded([&](AnalyzeResult &result) {
    const auto git_dir = find_git_dir(path);
    if (!git_dir) {
      throw Error("not a git repository: " + path.string());
    }
    const LocalObjectGraph graph{*git_dir};
    analyze_into(result, graph, resolve_head(*git_dir), config);
  });
}

auto analyze_pack(std::span<const std::uint8_t> pack_bytes, std::string_view head_hex,
                  const Config &config) -> AnalyzeResult {
  return run_guarded([&](AnalyzeResult &result) {
    MemoryObjectGraph graph;
    (void)pack::decode_pack(pack_bytes, graph);
    analyze_into(result, graph, head_hex, config);
  });
}

} // namespace repochurn
