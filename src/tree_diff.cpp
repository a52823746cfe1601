#include "repochurn/tree_diff.hpp"

#include <string_view>
#include <unordered_map>

namespace repochurn {

namespace {

struct Partition {
  std::unordered_map<std::string_view, const TreeEntry *> blobs;
  std::unordered_map<std::string_view, const TreeEntry *> trees;
};

// Views point into `entries`, which must outlive the result.
Partition partition(const std::vector<TreeEntry> &entries) {
  Partition out;
  for (const auto &e : entries) {
    auto &bucket = e.kind == EntryKind::blob ? out.blobs : out.trees;
    bucket.emplace(e.name, &e);
  }
  return out;
}

} // namespace

void TreeDiffer::diff(const oid &after, const oid &before) const {
  std::vector<std::string> prefixes{"/"};
  diff_subtree(after, before, prefixes);
}

void TreeDiffer::diff_subtree(const oid &after, const oid &before,
                              std::vector<std::string> &prefixes) const {
  if (after == before) {
    return; // content-addressed: identical subtree
  }

  const auto a = graph_.resolve_tree(after);
  const auto b = graph_.resolve_tree(before);
  const Partition in_b = partition(b);

  for (const auto &entry : a) {
    if (entry.kind == EntryKind::blob) {
      const auto it = in_b.blobs.find(entry.name);
      if (it == in_b.blobs.end() || it->second->id == entry.id) {
        continue; // created, or unchanged
      }
      for (const auto &dir : prefixes) {
        changes_.charge(dir);
      }
      changes_.charge(prefixes.back() + entry.name);
    } else {
      const auto it = in_b.trees.find(entry.name);
      if (it == in_b.trees.end() || it->second->id == entry.id) {
        continue;
      }
      prefixes.push_back(prefixes.back() + entry.name + "/");
      diff_subtree(entry.id, it->second->id, prefixes);
      prefixes.pop_back();
    }
  }
}

} // namespace repochurn
