#pragma once
#include "repochurn/analysis.hpp"
#include "repochurn/commit_walker.hpp"
#include "repochurn/config.hpp"
#include "repochurn/http.hpp"
#include "repochurn/object_graph.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace repochurn {

// Outcome of one analysis run: the full tree, or a single error message.
struct AnalyzeResult {
  bool success = false;
  std::string head_ref;               // 40-hex head commit
  std::unique_ptr<AnalysisNode> root; // set on success
  std::string error_message;          // set on failure
  WalkStats stats;

  [[nodiscard]] explicit operator bool() const { return success; }
};

// Walk from `head`, diff every edge and aggregate the head tree. Throws on failure.
auto analyze_graph(const ObjectGraph &graph, const oid &head, unsigned jobs = 1,
                   WalkStats *stats = nullptr) -> std::unique_ptr<AnalysisNode>;

// Remote repository over smart HTTP.
auto analyze_repo(http::Transport &transport, std::string_view repo_url, const Config &config)
    -> AnalyzeResult;
auto analyze_repo(std::string_view repo_url, const Config &config) -> AnalyzeResult;

// Local work tree or bare repository.
auto analyze_local(const std::filesystem::path &path, const Config &config) -> AnalyzeResult;

// Previously fetched pack plus the head commit id it was fetched for.
auto analyze_pack(std::span<const std::uint8_t> pack, std::string_view head_hex,
                  const Config &config) -> AnalyzeResult;

} // namespace repochurn
