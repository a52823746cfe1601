#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace repochurn {

/**
 * Change counts keyed by absolute path: "/" for the root, "/dir/" for
 * directories (trailing slash), "/dir/file" for files.
 * Counts only ever grow. Every call is atomic. Parallel diff workers each
 * charge a map of their own and merge it into the shared one when joined.
 */
class PathChangeMap {
public:
  void charge(const std::string &path);

  // Add every count of `other` to this map.
  void merge(const PathChangeMap &other);

  // 0 for paths never charged
  [[nodiscard]] auto count(const std::string &path) const -> std::uint32_t;

  [[nodiscard]] auto size() const -> std::size_t;

  // Copy of the current counts
  [[nodiscard]] auto snapshot() const -> std::unordered_map<std::string, std::uint32_t>;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::uint32_t> counts_;
};

} // namespace repochurn
