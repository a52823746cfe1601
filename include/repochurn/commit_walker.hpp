#pragma once
#include "repochurn/object_graph.hpp"
#include "repochurn/path_changes.hpp"

#include <cstddef>
#include <mutex>
#include <unordered_set>

namespace repochurn {

// Commit ids already visited. try_visit is an atomic check-and-set.
class VisitedSet {
public:
  // true the first time `id` is offered, false afterwards
  [[nodiscard]] auto try_visit(const oid &id) -> bool;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  mutable std::mutex mu_;
  std::unordered_set<oid, OidHash> seen_;
};

struct WalkStats {
  std::size_t commits = 0; // distinct commits visited
  std::size_t merges = 0;  // commits with two or more parents
  std::size_t roots = 0;   // commits with no parent
  std::size_t diffs = 0;   // (commit, parent) edges whose trees differ
};

/**
 * Walks commit ancestry from a head and diffs every commit's tree against
 * each parent's tree. A commit's diffs run at most once per walk, however
 * many paths reach it; every walk() starts from an empty visited set.
 *
 * With jobs > 1 the diffs are spread over up to that many worker threads
 * (never more than there are edges to diff). Each worker counts into its
 * own map, merged into `changes` at join; the counts match a serial walk.
 */
class CommitWalker {
public:
  CommitWalker(const ObjectGraph &graph, PathChangeMap &changes, unsigned jobs = 1)
      : graph_(graph), changes_(changes), jobs_(jobs == 0 ? 1 : jobs) {}

  auto walk(const oid &head) -> WalkStats;

private:
  const ObjectGraph &graph_;
  PathChangeMap &changes_;
  unsigned jobs_;
};

} // namespace repochurn
