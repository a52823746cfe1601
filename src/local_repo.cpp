#include "repochurn/local_repo.hpp"

#include "repochurn/consts.hpp"
#include "repochurn/errors.hpp"
#include "repochurn/fs.hpp"
#include "repochurn/pack.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <vector>

namespace stdfs = std::filesystem;

namespace repochurn {

LocalObjectGraph::LocalObjectGraph(stdfs::path git_dir)
    : git_dir_(std::move(git_dir)), loose_(git_dir_) {
  const stdfs::path pack_dir = git_dir_ / consts::kObjectsDir / consts::kPackDir;
  if (!fs::exists(pack_dir)) {
    return;
  }
  std::vector<stdfs::path> packs;
  for (const auto &entry : stdfs::directory_iterator(pack_dir)) {
    if (entry.is_regular_file() && entry.path().extension() == ".pack") {
      packs.push_back(entry.path());
    }
  }
  std::ranges::sort(packs);
  for (const auto &p : packs) {
    const auto bytes = fs::read_file(p);
    const auto stats = pack::decode_pack(bytes, packed_);
    spdlog::debug("loaded {} ({} commits, {} trees)", p.filename().string(), stats.commits,
                  stats.trees);
    ++packs_;
  }
}

auto LocalObjectGraph::read_loose(const oid &id, ObjectType expected) const -> Object {
  auto obj = loose_.read(id);
  if (!obj) {
    throw ObjectError(std::string(type_name(expected)) + " not found: " + to_hex(id));
  }
  if (obj->type != expected) {
    throw ObjectError("object " + to_hex(id) + " is a " + std::string(type_name(obj->type)) +
                      ", expected " + std::string(type_name(expected)));
  }
  return std::move(*obj);
}

auto LocalObjectGraph::resolve_commit(const oid &id) const -> CommitNode {
  if (packed_.has_commit(id)) {
    return packed_.resolve_commit(id);
  }
  return parse_commit(read_loose(id, ObjectType::commit).data);
}

auto LocalObjectGraph::resolve_tree(const oid &id) const -> std::vector<TreeEntry> {
  if (packed_.has_tree(id)) {
    return packed_.resolve_tree(id);
  }
  return parse_tree(read_loose(id, ObjectType::tree).data);
}

} // namespace repochurn
