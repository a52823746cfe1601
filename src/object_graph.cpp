#include "repochurn/object_graph.hpp"

#include "repochurn/consts.hpp"
#include "repochurn/errors.hpp"
#include "repochurn/util.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstddef>
#include <cstring>
#include <string>
#include <utility>

namespace repochurn {

namespace {

auto mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 12> buf{};
  const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), mode, 8);
  return {buf.data(), res.ptr};
}

auto ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  if (s.empty()) {
    throw ObjectError("tree parse: empty mode");
  }
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      throw ObjectError("tree parse: bad mode '" + std::string(s) + "'");
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

auto kind_for_mode(std::uint32_t mode, std::string_view name) -> EntryKind {
  switch (mode & consts::kModeTypeMask) {
  case consts::kModeTree:
    return EntryKind::tree;
  case 0100000: // regular and executable files
  case consts::kModeSymlink:
    return EntryKind::blob;
  case consts::kModeGitlink:
    throw UnsupportedObjectKindError("unsupported entry kind: '" + std::string(name) +
                                     "' is a submodule");
  default:
    throw UnsupportedObjectKindError("unsupported entry kind: '" + std::string(name) +
                                     "' has mode " + mode_to_ascii_octal(mode));
  }
}

auto parse_oid_field(std::string_view line, std::string_view prefix) -> oid {
  const std::string_view hex = line.substr(prefix.size());
  oid id{};
  if (hex.size() != consts::kOidHexLen || !from_hex(hex, id)) {
    throw ObjectError("commit parse: malformed '" + std::string(prefix) + "' header");
  }
  return id;
}

// Git orders tree entries as if directory names carried a trailing '/'.
auto sort_key(const TreeRecord &r) -> std::string {
  std::string key = r.name;
  if ((r.mode & consts::kModeTypeMask) == consts::kModeTree) {
    key.push_back('/');
  }
  return key;
}

} // namespace

auto type_name(ObjectType type) -> std::string_view {
  switch (type) {
  case ObjectType::commit:
    return consts::kTypeCommit;
  case ObjectType::tree:
    return consts::kTypeTree;
  case ObjectType::blob:
    return consts::kTypeBlob;
  case ObjectType::tag:
    return consts::kTypeTag;
  }
  return {};
}

auto parse_type_name(std::string_view name) -> std::optional<ObjectType> {
  if (name == consts::kTypeCommit) return ObjectType::commit;
  if (name == consts::kTypeTree) return ObjectType::tree;
  if (name == consts::kTypeBlob) return ObjectType::blob;
  if (name == consts::kTypeTag) return ObjectType::tag;
  return std::nullopt;
}

// Trees (binary)
//   <octal mode> SP <name> NUL <20-byte oid>, repeated

auto parse_tree(std::span<const std::uint8_t> data) -> std::vector<TreeEntry> {
  std::vector<TreeEntry> out;
  auto p = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw ObjectError("tree parse: expected space");
    }
    const std::string mode_str(p, q_space);
    const std::uint32_t mode = ascii_octal_to_mode(mode_str);

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw ObjectError("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    if (name.empty() || name.find('/') != std::string::npos) {
      throw ObjectError("tree parse: invalid entry name '" + name + "'");
    }
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw ObjectError("tree parse: truncated oid");
    }

    TreeEntry e{.name = std::move(name), .kind = EntryKind::blob, .id = {}};
    e.kind = kind_for_mode(mode, e.name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

auto encode_tree(std::vector<TreeRecord> records) -> std::vector<std::uint8_t> {
  std::ranges::sort(records, [](const TreeRecord &a, const TreeRecord &b) {
    return sort_key(a) < sort_key(b);
  });

  std::vector<std::uint8_t> data;
  for (const auto &r : records) {
    const std::string mode = mode_to_ascii_octal(r.mode);
    data.insert(data.end(), mode.begin(), mode.end());
    data.push_back(static_cast<std::uint8_t>(consts::kSpace));
    data.insert(data.end(), r.name.begin(), r.name.end());
    data.push_back(static_cast<std::uint8_t>(consts::kNul));
    data.insert(data.end(), r.id.begin(), r.id.end());
  }
  return data;
}

// Commits
//   tree <hex>\n (parent <hex>\n)* author ...\n committer ...\n\n <message>

auto parse_commit(std::span<const std::uint8_t> payload) -> CommitNode {
  const std::string_view text(reinterpret_cast<const char *>(payload.data()), payload.size());

  CommitNode node{};
  bool have_tree = false;
  std::size_t pos = 0;

  for (;;) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string_view line =
        (nl == std::string_view::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      break; // end of headers
    }

    if (line.starts_with(consts::kTreePrefix)) {
      node.tree = parse_oid_field(line, consts::kTreePrefix);
      have_tree = true;
    } else if (line.starts_with(consts::kParentPrefix)) {
      node.parents.push_back(parse_oid_field(line, consts::kParentPrefix));
    }

    if (nl == std::string_view::npos) break;
    pos = nl + 1;
  }

  if (!have_tree) {
    throw ObjectError("commit parse: missing tree header");
  }
  return node;
}

auto encode_commit(const oid &tree, const std::vector<oid> &parents, std::string_view author_line,
                   std::string_view committer_line, std::string_view message)
    -> std::vector<std::uint8_t> {
  std::string txt;

  txt += consts::kTreePrefix;
  txt += to_hex(tree);
  txt += '\n';

  for (const auto &p : parents) {
    txt += consts::kParentPrefix;
    txt += to_hex(p);
    txt += '\n';
  }

  txt += consts::kAuthorPrefix;
  txt += author_line;
  txt += '\n';

  txt += consts::kCommitterPrefix;
  txt += committer_line;
  txt += "\n\n";

  txt += message;

  const auto bytes = as_bytes(txt);
  return {bytes.begin(), bytes.end()};
}

// MemoryObjectGraph

auto MemoryObjectGraph::add(ObjectType type, std::span<const std::uint8_t> payload) -> oid {
  const oid id = hash_object(type_name(type), payload);
  add(id, type, std::vector<std::uint8_t>(payload.begin(), payload.end()));
  return id;
}

void MemoryObjectGraph::add(const oid &id, ObjectType type, std::vector<std::uint8_t> payload) {
  switch (type) {
  case ObjectType::commit:
    commits_.insert_or_assign(id, parse_commit(payload));
    break;
  case ObjectType::tree:
    trees_.insert_or_assign(id, std::move(payload));
    break;
  case ObjectType::blob:
  case ObjectType::tag:
    break;
  }
}

auto MemoryObjectGraph::resolve_commit(const oid &id) const -> CommitNode {
  const auto it = commits_.find(id);
  if (it == commits_.end()) {
    throw ObjectError("commit not found: " + to_hex(id));
  }
  return it->second;
}

auto MemoryObjectGraph::resolve_tree(const oid &id) const -> std::vector<TreeEntry> {
  const auto it = trees_.find(id);
  if (it == trees_.end()) {
    throw ObjectError("tree not found: " + to_hex(id));
  }
  return parse_tree(it->second);
}

} // namespace repochurn
