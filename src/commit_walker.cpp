#include "repochurn/commit_walker.hpp"

#include "repochurn/tree_diff.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <utility>
#include <vector>

namespace repochurn {

namespace {

struct DiffEdge {
  oid after;  // commit tree
  oid before; // parent tree
};

void run_parallel(const ObjectGraph &graph, PathChangeMap &changes,
                  const std::vector<DiffEdge> &edges, unsigned jobs) {
  const std::size_t n = std::min<std::size_t>(jobs, edges.size());
  std::vector<PathChangeMap> local(n);
  std::atomic<std::size_t> next{0};
  const auto worker = [&](PathChangeMap &counts) {
    const TreeDiffer differ{graph, counts};
    for (std::size_t i = next++; i < edges.size(); i = next++) {
      differ.diff(edges[i].after, edges[i].before);
    }
  };

  std::vector<std::future<void>> workers;
  workers.reserve(n);
  for (std::size_t j = 0; j < n; ++j) {
    workers.push_back(std::async(std::launch::async, worker, std::ref(local[j])));
  }
  // Join every worker before reporting the first failure.
  std::exception_ptr first_error;
  for (auto &w : workers) {
    try {
      w.get();
    } catch (...) {
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
  for (const PathChangeMap &counts : local) {
    changes.merge(counts);
  }
}

} // namespace

auto VisitedSet::try_visit(const oid &id) -> bool {
  const std::lock_guard<std::mutex> lock(mu_);
  return seen_.insert(id).second;
}

auto VisitedSet::size() const -> std::size_t {
  const std::lock_guard<std::mutex> lock(mu_);
  return seen_.size();
}

auto CommitWalker::walk(const oid &head) -> WalkStats {
  const TreeDiffer differ{graph_, changes_};
  VisitedSet visited;
  WalkStats stats;
  std::vector<DiffEdge> deferred;

  std::vector<oid> stack{head};
  while (!stack.empty()) {
    const oid id = stack.back();
    stack.pop_back();
    if (!visited.try_visit(id)) {
      continue;
    }

    const CommitNode commit = graph_.resolve_commit(id);
    ++stats.commits;
    if (commit.parents.empty()) {
      ++stats.roots;
    } else if (commit.parents.size() > 1) {
      ++stats.merges;
    }

    for (const oid &parent_id : commit.parents) {
      const CommitNode parent = graph_.resolve_commit(parent_id);
      if (parent.tree != commit.tree) {
        ++stats.diffs;
        if (jobs_ > 1) {
          deferred.push_back(DiffEdge{.after = commit.tree, .before = parent.tree});
        } else {
          differ.diff(commit.tree, parent.tree);
        }
      }
      stack.push_back(parent_id);
    }
  }

  if (!deferred.empty()) {
    spdlog::debug("diffing {} edges on {} workers", deferred.size(),
                  std::min<std::size_t>(jobs_, deferred.size()));
    run_parallel(graph_, changes_, deferred, jobs_);
  }

  spdlog::info("walked {} commits ({} merges, {} roots), {} tree diffs", stats.commits,
               stats.merges, stats.roots, stats.diffs);
  return stats;
}

} // namespace repochurn
