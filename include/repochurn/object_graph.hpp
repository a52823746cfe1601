#pragma once
#include "repochurn/hash.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace repochurn {

enum class ObjectType { commit, tree, blob, tag };

auto type_name(ObjectType type) -> std::string_view;
auto parse_type_name(std::string_view name) -> std::optional<ObjectType>;

enum class EntryKind { blob, tree };

struct TreeEntry {
  std::string name; // single path segment (no '/')
  EntryKind kind;
  oid id;           // 20-byte raw SHA-1 of referenced object
};

struct CommitNode {
  oid tree;                 // root file-tree
  std::vector<oid> parents; // zero for a root commit, two or more for a merge
};

/**
 * Read access to the commit/tree graph of one repository.
 * Implementations must be safe for concurrent const calls.
 *
 * Both operations throw ObjectError for missing or malformed objects;
 * resolve_tree throws UnsupportedObjectKindError for entries that are
 * neither blobs nor trees (submodules).
 */
class ObjectGraph {
public:
  virtual ~ObjectGraph() = default;

  [[nodiscard]] virtual auto resolve_commit(const oid &id) const -> CommitNode = 0;
  [[nodiscard]] virtual auto resolve_tree(const oid &id) const -> std::vector<TreeEntry> = 0;
};

// Object payload codecs (payloads exclude the "<type> <size>\0" header)

auto parse_commit(std::span<const std::uint8_t> payload) -> CommitNode;
auto parse_tree(std::span<const std::uint8_t> payload) -> std::vector<TreeEntry>;

// Raw tree record as stored on disk, mode included.
struct TreeRecord {
  std::uint32_t mode; // e.g. consts::kModeFile, consts::kModeTree
  std::string name;
  oid id;
};

// Serialize records in canonical git order.
auto encode_tree(std::vector<TreeRecord> records) -> std::vector<std::uint8_t>;

auto encode_commit(const oid &tree, const std::vector<oid> &parents, std::string_view author_line,
                   std::string_view committer_line, std::string_view message)
    -> std::vector<std::uint8_t>;

// Commits and trees held in memory. Commits are parsed on insertion,
// trees on every resolve_tree call.
class MemoryObjectGraph final : public ObjectGraph {
public:
  // Hash and index a payload. Blobs and tags are not kept. Returns the id.
  auto add(ObjectType type, std::span<const std::uint8_t> payload) -> oid;

  // Index a payload whose id the caller has already computed.
  void add(const oid &id, ObjectType type, std::vector<std::uint8_t> payload);

  [[nodiscard]] auto resolve_commit(const oid &id) const -> CommitNode override;
  [[nodiscard]] auto resolve_tree(const oid &id) const -> std::vector<TreeEntry> override;

  [[nodiscard]] auto has_commit(const oid &id) const -> bool { return commits_.contains(id); }
  [[nodiscard]] auto has_tree(const oid &id) const -> bool { return trees_.contains(id); }
  [[nodiscard]] auto commit_count() const -> std::size_t { return commits_.size(); }
  [[nodiscard]] auto tree_count() const -> std::size_t { return trees_.size(); }

private:
  std::unordered_map<oid, CommitNode, OidHash> commits_;
  std::unordered_map<oid, std::vector<std::uint8_t>, OidHash> trees_;
};

} // namespace repochurn
