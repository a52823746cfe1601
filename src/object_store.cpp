#include "repochurn/object_store.hpp"

#include "repochurn/consts.hpp"
#include "repochurn/errors.hpp"
#include "repochurn/fs.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace rfs = repochurn::fs;

namespace repochurn {

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir =
      gitdir_ / consts::kObjectsDir / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

std::optional<Object> ObjectStore::read(const oid &object_id) const {
  const auto path = path_for_oid(object_id);
  if (!rfs::exists(path)) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> store;
  try {
    store = rfs::z_decompress(rfs::read_file(path));
  } catch (const std::runtime_error &e) {
    throw ObjectError("object_store: " + to_hex(object_id) + ": " + e.what());
  }

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw ObjectError("object_store: invalid header in " + to_hex(object_id));
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw ObjectError("object_store: invalid header in " + to_hex(object_id));
  }
  const std::string type_str(store.begin(), it_space);
  const auto type = parse_type_name(type_str);
  if (!type) {
    throw ObjectError("object_store: unknown object type '" + type_str + "'");
  }
  const std::string size_str(it_space + 1, it_nul);
  const std::size_t payload_off = static_cast<std::size_t>(it_nul - store.begin()) + 1;
  if (size_str != std::to_string(store.size() - payload_off)) {
    throw ObjectError("object_store: size mismatch in " + to_hex(object_id));
  }
  return Object{.type = *type, .data = {store.begin() + static_cast<std::ptrdiff_t>(payload_off), store.end()}};
}

} // namespace repochurn
