#pragma once
#include "repochurn/object_graph.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace repochurn::pack {

struct PackStats {
  std::uint32_t version = 0;
  std::size_t objects = 0; // entries in the pack
  std::size_t deltas = 0;  // OFS_DELTA + REF_DELTA entries
  std::size_t commits = 0;
  std::size_t trees = 0;
};

/**
 * Decode a version 2/3 pack into `graph`.
 * Verifies the trailing checksum and resolves both delta kinds. Bases must be
 * inside the same pack (thin packs are rejected). Blobs and tags are only
 * hashed; their bytes are held just while a pending delta still uses them.
 * Only commits and trees reach `graph`. Throws ObjectError on any corruption.
 */
auto decode_pack(std::span<const std::uint8_t> pack, MemoryObjectGraph &graph) -> PackStats;

// Rebuild an object from its base and a git delta instruction stream.
auto apply_delta(std::span<const std::uint8_t> base, std::span<const std::uint8_t> delta)
    -> std::vector<std::uint8_t>;

} // namespace repochurn::pack
