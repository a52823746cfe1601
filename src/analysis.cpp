#include "repochurn/analysis.hpp"

namespace repochurn {

namespace {

void add_file_upward(AnalysisNode *dir) {
  for (AnalysisNode *p = dir; p != nullptr; p = p->parent) {
    ++p->num_files;
  }
}

// `path` is the directory's absolute path with trailing '/'
void populate(const ObjectGraph &graph, const oid &tree, const std::string &path,
              const PathChangeMap &changes, AnalysisNode &dir) {
  for (auto &entry : graph.resolve_tree(tree)) {
    auto child = std::make_unique<AnalysisNode>();
    child->name = entry.name;
    child->parent = &dir;
    AnalysisNode &node = *child;
    dir.children.push_back(std::move(child));

    if (entry.kind == EntryKind::blob) {
      node.kind = NodeKind::file;
      node.num_changes = changes.count(path + entry.name);
      node.num_files = 1;
      add_file_upward(&dir);
    } else {
      const std::string sub = path + entry.name + "/";
      node.kind = NodeKind::directory;
      node.num_changes = changes.count(sub);
      populate(graph, entry.id, sub, changes, node);
    }
  }
}

} // namespace

auto AnalysisNode::find_child(std::string_view child_name) const -> const AnalysisNode * {
  for (const auto &c : children) {
    if (c->name == child_name) {
      return c.get();
    }
  }
  return nullptr;
}

auto build_analysis_tree(const ObjectGraph &graph, const oid &root_tree,
                         const PathChangeMap &changes) -> std::unique_ptr<AnalysisNode> {
  auto root = std::make_unique<AnalysisNode>();
  root->kind = NodeKind::directory;
  root->num_changes = changes.count("/");
  populate(graph, root_tree, "/", changes, *root);
  return root;
}

auto follow_path(const AnalysisNode &root, std::string_view path) -> const AnalysisNode * {
  if (path.empty()) {
    return &root;
  }
  const AnalysisNode *current = &root;
  for (;;) {
    const std::size_t slash = path.find('/');
    current = current->find_child(path.substr(0, slash));
    if (current == nullptr || slash == std::string_view::npos) {
      return current;
    }
    path.remove_prefix(slash + 1);
  }
}

} // namespace repochurn
