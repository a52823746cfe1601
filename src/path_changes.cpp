#include "repochurn/path_changes.hpp"

namespace repochurn {

void PathChangeMap::charge(const std::string &path) {
  const std::lock_guard<std::mutex> lock(mu_);
  ++counts_[path];
}

void PathChangeMap::merge(const PathChangeMap &other) {
  if (&other == this) {
    return;
  }
  const std::scoped_lock lock(mu_, other.mu_);
  for (const auto &[path, n] : other.counts_) {
    counts_[path] += n;
  }
}

auto PathChangeMap::count(const std::string &path) const -> std::uint32_t {
  const std::lock_guard<std::mutex> lock(mu_);
  const auto it = counts_.find(path);
  return it == counts_.end() ? 0 : it->second;
}

auto PathChangeMap::size() const -> std::size_t {
  const std::lock_guard<std::mutex> lock(mu_);
  return counts_.size();
}

auto PathChangeMap::snapshot() const -> std::unordered_map<std::string, std::uint32_t> {
  const std::lock_guard<std::mutex> lock(mu_);
  return counts_;
}

} // namespace repochurn
