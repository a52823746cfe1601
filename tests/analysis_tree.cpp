#include "repochurn/analysis.hpp"
#include "repochurn/analyzer.hpp"
#include "repochurn/errors.hpp"

#include "test_support.hpp"

#include <iostream>
#include <string>

using namespace repochurn;
using testsupport::dir;
using testsupport::file;
using testsupport::throws;

// num_files of a directory is the sum over its children; a file counts 1.
static bool files_consistent(const AnalysisNode& n) {
  if (!n.is_directory()) return n.num_files == 1 && n.children.empty();
  std::uint32_t sum = 0;
  for (const auto& c : n.children) {
    if (c->parent != &n || !files_consistent(*c)) return false;
    sum += c->num_files;
  }
  return sum == n.num_files;
}

int main() {
  try {
    testsupport::GraphBuilder g;
    const oid sub = g.tree({file("b.txt", "b\n")});
    const oid tree1 = g.tree({file("a.txt", "one\n"), dir("dir", sub)});
    const oid tree2 = g.tree({file("a.txt", "two\n"), dir("dir", sub)});
    const oid commit1 = g.commit(tree1, {}, "first\n");
    const oid commit2 = g.commit(tree2, {commit1}, "second\n");

    // a lone root commit: all files, no changes
    {
      const auto root = analyze_graph(g.graph(), commit1);
      if (!root->is_directory() || !root->name.empty() || root->parent != nullptr) {
        std::cerr << "single: root shape\n"; return 1;
      }
      if (root->num_files != 2 || root->num_changes != 0) { std::cerr << "single: root counts\n"; return 1; }
      const auto* a = follow_path(*root, "a.txt");
      const auto* b = follow_path(*root, "dir/b.txt");
      if (!a || !b || a->num_changes != 0 || b->num_changes != 0) { std::cerr << "single: leaves\n"; return 1; }
      if (!files_consistent(*root)) { std::cerr << "single: num_files invariant\n"; return 1; }
    }

    // one modification of a.txt
    {
      WalkStats stats;
      const auto root = analyze_graph(g.graph(), commit2, 1, &stats);
      if (stats.commits != 2 || stats.diffs != 1) { std::cerr << "two: walk stats\n"; return 1; }
      const auto* a = follow_path(*root, "a.txt");
      const auto* d = follow_path(*root, "dir");
      const auto* b = follow_path(*root, "dir/b.txt");
      if (!a || a->num_changes != 1 || a->is_directory()) { std::cerr << "two: a.txt\n"; return 1; }
      if (root->num_changes != 1) { std::cerr << "two: root\n"; return 1; }
      if (!d || !d->is_directory() || d->num_changes != 0 || d->num_files != 1) { std::cerr << "two: dir\n"; return 1; }
      if (!b || b->num_changes != 0 || b->parent != d) { std::cerr << "two: dir/b.txt\n"; return 1; }
      if (!files_consistent(*root)) { std::cerr << "two: num_files invariant\n"; return 1; }
    }

    // children keep tree order
    {
      const auto root = analyze_graph(g.graph(), commit2);
      if (root->children.size() != 2 || root->children[0]->name != "a.txt" || root->children[1]->name != "dir") {
        std::cerr << "order: children\n"; return 1;
      }
    }

    // path lookup misses are not errors
    {
      const auto root = analyze_graph(g.graph(), commit2);
      if (follow_path(*root, "") != root.get()) { std::cerr << "lookup: empty path\n"; return 1; }
      if (follow_path(*root, "dir/missing.txt") != nullptr) { std::cerr << "lookup: missing leaf\n"; return 1; }
      if (follow_path(*root, "nope/b.txt") != nullptr) { std::cerr << "lookup: missing dir\n"; return 1; }
      if (follow_path(*root, "a.txt/x") != nullptr) { std::cerr << "lookup: through a file\n"; return 1; }
      if (follow_path(*root, "dir/") != nullptr) { std::cerr << "lookup: trailing slash\n"; return 1; }
    }

    // deeper aggregation: counts of every file roll up into num_files
    {
      const oid deep = g.tree({file("x", "1\n"), file("y", "2\n"), dir("z", g.tree({file("w", "3\n")}))});
      const oid top = g.tree({dir("deep", deep), dir("dir", sub), file("top", "t\n")});
      const oid c = g.commit(top, {});
      const auto root = analyze_graph(g.graph(), c);
      if (root->num_files != 5 || follow_path(*root, "deep")->num_files != 3) { std::cerr << "deep: num_files\n"; return 1; }
      if (!files_consistent(*root)) { std::cerr << "deep: num_files invariant\n"; return 1; }
    }

    // changes are read from the map by absolute path
    {
      PathChangeMap changes;
      changes.charge("/");
      changes.charge("/dir/");
      changes.charge("/dir/b.txt");
      changes.charge("/dir/b.txt");
      const auto root = build_analysis_tree(g.graph(), tree1, changes);
      if (root->num_changes != 1 || follow_path(*root, "dir")->num_changes != 1 ||
          follow_path(*root, "dir/b.txt")->num_changes != 2) {
        std::cerr << "build: counts from map\n"; return 1;
      }
    }

    // unknown head
    if (!throws<ObjectError>([&] { (void)analyze_graph(g.graph(), testsupport::blob_id("?")); })) {
      std::cerr << "unknown head: not reported\n"; return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "analysis_tree test failed: " << e.what() << "\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
