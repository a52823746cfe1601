#pragma once
#include "repochurn/hash.hpp"
#include "repochurn/object_graph.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace repochurn {

struct Object {
  ObjectType type;
  std::vector<std::uint8_t> data; // payload bytes (no header)
};

// Read-only view of loose objects under <gitdir>/objects/xx/yyyy... (zlib-compressed).
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path gitdir)
    : gitdir_(std::move(gitdir)) {}

  // Read and decompress an object; nullopt if no loose file exists for it.
  [[nodiscard]] std::optional<Object> read(const oid& object_id) const;

  // Get filesystem path for a binary oid.
  [[nodiscard]] std::filesystem::path path_for_oid(const oid& object_id) const;

private:
  std::filesystem::path gitdir_;
};

} // namespace repochurn
