#include "repochurn/pack.hpp"

#include "repochurn/consts.hpp"
#include "repochurn/errors.hpp"
#include "repochurn/fs.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace repochurn::pack {

namespace {

struct Entry {
  std::size_t offset = 0;
  std::uint8_t code = 0;          // pack type code
  std::size_t size = 0;           // inflated size from the entry header
  std::size_t data_at = 0;        // start of the zlib stream
  std::vector<std::uint8_t> data; // inflated payload, or delta instructions
  bool loaded = false;            // `data` holds the bytes; blobs and tags are not kept
  std::size_t base_offset = 0;    // OFS_DELTA
  oid base_id{};                  // REF_DELTA
  bool resolved = false;
  ObjectType type = ObjectType::blob;
  oid id{};
  std::size_t dependents = 0; // unresolved deltas that still need this entry as base
};

[[nodiscard]] auto read_be32(std::span<const std::uint8_t> data, std::size_t at) -> std::uint32_t {
  return (static_cast<std::uint32_t>(data[at]) << 24U) |
         (static_cast<std::uint32_t>(data[at + 1]) << 16U) |
         (static_cast<std::uint32_t>(data[at + 2]) << 8U) | static_cast<std::uint32_t>(data[at + 3]);
}

[[nodiscard]] auto byte_at(std::span<const std::uint8_t> data, std::size_t p) -> std::uint8_t {
  if (p >= data.size()) {
    throw ObjectError("pack: truncated entry header");
  }
  return data[p];
}

[[nodiscard]] auto object_type_for(std::uint8_t code) -> std::optional<ObjectType> {
  switch (code) {
  case consts::kPackCommit:
    return ObjectType::commit;
  case consts::kPackTree:
    return ObjectType::tree;
  case consts::kPackBlob:
    return ObjectType::blob;
  case consts::kPackTag:
    return ObjectType::tag;
  default:
    return std::nullopt;
  }
}

// Size varint used by delta headers: 7 bits per byte, little-endian.
[[nodiscard]] auto read_delta_size(std::span<const std::uint8_t> delta, std::size_t &p)
    -> std::size_t {
  std::size_t value = 0;
  unsigned shift = 0;
  for (;;) {
    if (p >= delta.size() || shift > 56) {
      throw ObjectError("delta: truncated size header");
    }
    const std::uint8_t c = delta[p++];
    value |= static_cast<std::size_t>(c & 0x7fU) << shift;
    shift += 7;
    if ((c & 0x80U) == 0) {
      return value;
    }
  }
}

// Entry header: 3-bit type, then the inflated size in a 4+7n bit varint.
void read_entry_header(std::span<const std::uint8_t> data, std::size_t &p, Entry &e,
                       std::size_t &size) {
  std::uint8_t c = byte_at(data, p++);
  e.code = static_cast<std::uint8_t>((c >> 4U) & 0x7U);
  size = c & 0x0fU;
  unsigned shift = 4;
  while ((c & 0x80U) != 0) {
    if (shift > 56) {
      throw ObjectError("pack: oversized entry length");
    }
    c = byte_at(data, p++);
    size |= static_cast<std::size_t>(c & 0x7fU) << shift;
    shift += 7;
  }

  if (e.code == consts::kPackOfsDelta) {
    // Big-endian base-128 with an implicit +1 per continuation byte.
    c = byte_at(data, p++);
    std::size_t off = c & 0x7fU;
    while ((c & 0x80U) != 0) {
      c = byte_at(data, p++);
      off = ((off + 1) << 7U) | (c & 0x7fU);
    }
    if (off == 0 || off > e.offset) {
      throw ObjectError("pack: ofs-delta base outside pack at offset " + std::to_string(e.offset));
    }
    e.base_offset = e.offset - off;
  } else if (e.code == consts::kPackRefDelta) {
    if (data.size() - p < consts::kOidRawLen) {
      throw ObjectError("pack: truncated ref-delta base id");
    }
    std::memcpy(e.base_id.data(), &data[p], consts::kOidRawLen);
    p += consts::kOidRawLen;
  } else if (!object_type_for(e.code)) {
    throw ObjectError("pack: unknown object type " + std::to_string(e.code) + " at offset " +
                      std::to_string(e.offset));
  }
}

void finish(Entry &e, ObjectType type) {
  e.type = type;
  e.id = hash_object(type_name(type), e.data);
  e.resolved = true;
}

[[nodiscard]] bool is_content(ObjectType type) {
  return type == ObjectType::blob || type == ObjectType::tag;
}

void release(Entry &e) {
  if (is_content(e.type)) {
    std::vector<std::uint8_t>().swap(e.data);
    e.loaded = false;
  }
}

[[noreturn]] void throw_entry(const Entry &e, const std::runtime_error &ex) {
  throw ObjectError("pack: entry at offset " + std::to_string(e.offset) + ": " + ex.what());
}

// Hash a blob or tag straight out of the zlib stream; only its id is kept.
std::size_t stream_content(std::span<const std::uint8_t> body, Entry &e, ObjectType type) {
  Sha1 hasher;
  hasher.update(object_header(type_name(type), e.size));
  const std::size_t consumed = fs::z_inflate_stream(
      body.subspan(e.data_at), e.size,
      [&hasher](std::span<const std::uint8_t> chunk) { hasher.update(chunk); });
  e.type = type;
  e.id = hasher.finish();
  e.resolved = true;
  return consumed;
}

// Bring back the bytes of an entry that was streamed past, now that a delta needs them.
void load(std::span<const std::uint8_t> body, Entry &e) {
  if (e.loaded) {
    return;
  }
  try {
    e.data = fs::z_inflate_prefix(body.subspan(e.data_at), e.size).data;
  } catch (const std::runtime_error &ex) {
    throw_entry(e, ex);
  }
  e.loaded = true;
}

} // namespace

auto apply_delta(std::span<const std::uint8_t> base, std::span<const std::uint8_t> delta)
    -> std::vector<std::uint8_t> {
  std::size_t p = 0;
  const std::size_t src_size = read_delta_size(delta, p);
  const std::size_t tgt_size = read_delta_size(delta, p);
  if (src_size != base.size()) {
    throw ObjectError("delta: base size mismatch (expected " + std::to_string(src_size) +
                      ", have " + std::to_string(base.size()) + ")");
  }

  std::vector<std::uint8_t> out;
  out.reserve(tgt_size);

  while (p < delta.size()) {
    const std::uint8_t op = delta[p++];
    if ((op & 0x80U) != 0) {
      // copy from base: offset bytes in bits 0-3, size bytes in bits 4-6
      std::size_t offset = 0;
      std::size_t size = 0;
      for (unsigned i = 0; i < 4; ++i) {
        if ((op & (1U << i)) != 0) {
          offset |= static_cast<std::size_t>(byte_at(delta, p++)) << (8 * i);
        }
      }
      for (unsigned i = 0; i < 3; ++i) {
        if ((op & (0x10U << i)) != 0) {
          size |= static_cast<std::size_t>(byte_at(delta, p++)) << (8 * i);
        }
      }
      if (size == 0) {
        size = 0x10000;
      }
      if (offset > base.size() || size > base.size() - offset) {
        throw ObjectError("delta: copy outside base object");
      }
      out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(offset),
                 base.begin() + static_cast<std::ptrdiff_t>(offset + size));
    } else if (op != 0) {
      // insert the next `op` literal bytes
      if (op > delta.size() - p) {
        throw ObjectError("delta: insert runs past end of delta");
      }
      out.insert(out.end(), delta.begin() + static_cast<std::ptrdiff_t>(p),
                 delta.begin() + static_cast<std::ptrdiff_t>(p + op));
      p += op;
    } else {
      throw ObjectError("delta: opcode 0 is reserved");
    }
  }

  if (out.size() != tgt_size) {
    throw ObjectError("delta: result size mismatch");
  }
  return out;
}

auto decode_pack(std::span<const std::uint8_t> pack, MemoryObjectGraph &graph) -> PackStats {
  if (pack.size() < consts::kPackHeaderLen + consts::kOidRawLen) {
    throw ObjectError("pack: too short (" + std::to_string(pack.size()) + " bytes)");
  }
  if (!std::equal(consts::kPackMagic.begin(), consts::kPackMagic.end(), pack.begin(),
                  [](char a, std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; })) {
    throw ObjectError("pack: bad signature");
  }

  PackStats stats;
  stats.version = read_be32(pack, 4);
  if (stats.version != 2 && stats.version != 3) {
    throw ObjectError("pack: unsupported version " + std::to_string(stats.version));
  }
  const std::uint32_t count = read_be32(pack, 8);

  const std::size_t body_end = pack.size() - consts::kOidRawLen;
  const oid trailer = [&] {
    oid t{};
    std::memcpy(t.data(), &pack[body_end], consts::kOidRawLen);
    return t;
  }();
  if (sha1(pack.first(body_end)) != trailer) {
    throw ObjectError("pack: checksum mismatch");
  }

  std::vector<Entry> entries;
  entries.reserve(count);
  std::size_t p = consts::kPackHeaderLen;
  const auto body = pack.first(body_end);

  // First pass: headers, plus the payload of everything but blobs and tags.
  std::size_t pending = 0;
  for (std::uint32_t i = 0; i < count; ++i) {
    Entry e;
    e.offset = p;
    read_entry_header(body, p, e, e.size);
    e.data_at = p;
    try {
      const auto type = object_type_for(e.code);
      if (type && is_content(*type)) {
        p += stream_content(body, e, *type);
      } else {
        auto inflated = fs::z_inflate_prefix(body.subspan(p), e.size);
        e.data = std::move(inflated.data);
        e.loaded = true;
        p += inflated.consumed;
        if (type) {
          finish(e, *type);
        } else {
          ++pending;
        }
      }
    } catch (const ObjectError &) {
      throw;
    } catch (const std::runtime_error &ex) {
      throw_entry(e, ex);
    }
    entries.push_back(std::move(e));
  }
  if (p != body_end) {
    throw ObjectError("pack: " + std::to_string(body_end - p) + " unexpected trailing bytes");
  }
  stats.objects = entries.size();
  stats.deltas = pending;

  std::unordered_map<std::size_t, std::size_t> by_offset;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    by_offset.emplace(entries[i].offset, i);
  }

  // Count how many deltas lean on each base so its bytes can go once the last
  // one is applied. REF_DELTA bases are credited when their id becomes known.
  std::unordered_map<oid, std::size_t, OidHash> ref_wanted;
  for (Entry &e : entries) {
    if (e.code == consts::kPackOfsDelta) {
      const auto it = by_offset.find(e.base_offset);
      if (it == by_offset.end()) {
        throw ObjectError("pack: ofs-delta at offset " + std::to_string(e.offset) +
                          " points at no entry");
      }
      ++entries[it->second].dependents;
    } else if (e.code == consts::kPackRefDelta) {
      ++ref_wanted[e.base_id];
    }
  }

  std::unordered_map<oid, std::size_t, OidHash> by_id;
  const auto index_id = [&](std::size_t i) {
    if (!by_id.emplace(entries[i].id, i).second) {
      return;
    }
    if (const auto it = ref_wanted.find(entries[i].id); it != ref_wanted.end()) {
      entries[i].dependents += it->second;
      ref_wanted.erase(it);
    }
  };
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (entries[i].resolved) {
      index_id(i);
    }
  }

  // Each round resolves every delta whose base is ready; chains take one
  // round per link when bases follow their deltas.
  std::size_t rounds = 0;
  bool progress = true;
  while (pending > 0 && progress) {
    progress = false;
    ++rounds;
    for (std::size_t i = 0; i < entries.size(); ++i) {
      Entry &e = entries[i];
      if (e.resolved) {
        continue;
      }
      std::optional<std::size_t> base;
      if (e.code == consts::kPackOfsDelta) {
        base = by_offset.at(e.base_offset);
      } else if (const auto it = by_id.find(e.base_id); it != by_id.end()) {
        base = it->second;
      }
      if (!base || !entries[*base].resolved) {
        continue;
      }
      Entry &b = entries[*base];
      load(body, b);
      e.data = apply_delta(b.data, e.data);
      finish(e, b.type);
      index_id(i);
      if (--b.dependents == 0) {
        release(b);
      }
      if (e.dependents == 0) {
        release(e);
      }
      --pending;
      progress = true;
    }
  }
  if (pending > 0) {
    throw ObjectError("pack: " + std::to_string(pending) +
                      " delta(s) reference a base that is not in the pack");
  }
  spdlog::debug("pack v{}: {} objects, {} deltas resolved in {} round(s)", stats.version,
                stats.objects, stats.deltas, rounds);

  std::size_t skipped = 0;
  for (Entry &e : entries) {
    switch (e.type) {
    case ObjectType::commit:
      ++stats.commits;
      break;
    case ObjectType::tree:
      ++stats.trees;
      break;
    case ObjectType::blob:
    case ObjectType::tag:
      ++skipped;
      continue;
    }
    graph.add(e.id, e.type, std::move(e.data));
  }
  spdlog::debug("pack indexed {} commits, {} trees; {} blobs/tags skipped", stats.commits,
                stats.trees, skipped);
  return stats;
}

} // namespace repochurn::pack
