#pragma once
#include "repochurn/object_graph.hpp"
#include "repochurn/path_changes.hpp"

#include <string>
#include <vector>

namespace repochurn {

/**
 * Charges content modifications between two trees to a PathChangeMap.
 *
 * Only blobs present under the same path on both sides with different ids
 * count. Such a blob charges its own path and every enclosing directory,
 * including "/". Creations and deletions charge nothing, and entries that
 * exist only in `before` are never visited.
 */
class TreeDiffer {
public:
  TreeDiffer(const ObjectGraph &graph, PathChangeMap &changes)
      : graph_(graph), changes_(changes) {}

  void diff(const oid &after, const oid &before) const;

private:
  // prefixes: "/", "/a/", "/a/b/", ... for the subtree being compared
  void diff_subtree(const oid &after, const oid &before, std::vector<std::string> &prefixes) const;

  const ObjectGraph &graph_;
  PathChangeMap &changes_;
};

} // namespace repochurn
