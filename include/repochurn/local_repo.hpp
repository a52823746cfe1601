#pragma once
#include "repochurn/object_graph.hpp"
#include "repochurn/object_store.hpp"

#include <cstddef>
#include <filesystem>

namespace repochurn {

/**
 * Object graph over a local git directory.
 * Every pack under objects/pack is decoded up front; lookups that miss the
 * packs fall back to loose objects.
 */
class LocalObjectGraph final : public ObjectGraph {
public:
  explicit LocalObjectGraph(std::filesystem::path git_dir);

  [[nodiscard]] auto resolve_commit(const oid &id) const -> CommitNode override;
  [[nodiscard]] auto resolve_tree(const oid &id) const -> std::vector<TreeEntry> override;

  [[nodiscard]] auto git_dir() const -> const std::filesystem::path & { return git_dir_; }
  [[nodiscard]] auto pack_count() const -> std::size_t { return packs_; }

private:
  [[nodiscard]] auto read_loose(const oid &id, ObjectType expected) const -> Object;

  std::filesystem::path git_dir_;
  ObjectStore loose_;
  MemoryObjectGraph packed_;
  std::size_t packs_ = 0;
};

} // namespace repochurn
