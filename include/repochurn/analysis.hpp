#pragma once
#include "repochurn/object_graph.hpp"
#include "repochurn/path_changes.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace repochurn {

enum class NodeKind { file, directory };

struct AnalysisNode {
  std::string name; // empty for the root
  NodeKind kind = NodeKind::file;
  std::uint32_t num_changes = 0;
  std::uint32_t num_files = 0; // 1 for a file; leaf count for a directory
  std::vector<std::unique_ptr<AnalysisNode>> children;
  // Non-owning; set during construction to propagate num_files upward.
  AnalysisNode *parent = nullptr;

  [[nodiscard]] auto is_directory() const -> bool { return kind == NodeKind::directory; }
  [[nodiscard]] auto find_child(std::string_view child_name) const -> const AnalysisNode *;
};

// Annotated tree for `root_tree`; children keep tree order.
auto build_analysis_tree(const ObjectGraph &graph, const oid &root_tree,
                         const PathChangeMap &changes) -> std::unique_ptr<AnalysisNode>;

// Node at a '/'-separated path relative to `root` ("" is the root itself).
// Returns nullptr as soon as a segment does not match.
auto follow_path(const AnalysisNode &root, std::string_view path) -> const AnalysisNode *;

} // namespace repochurn
