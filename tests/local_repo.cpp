#include "repochurn/analyzer.hpp"
#include "repochurn/errors.hpp"
#include "repochurn/local_repo.hpp"
#include "repochurn/refs.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <system_error>
#include <vector>

using namespace repochurn;
using testsupport::dir;
using testsupport::file;
using testsupport::throws;

static void write_file(const std::filesystem::path& p, std::string_view s) {
  std::filesystem::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::filesystem::path fresh_dir(const std::string& tag) {
  const std::filesystem::path p = std::filesystem::temp_directory_path() / ("repochurn_" + tag + "_" + std::to_string(std::random_device{}()));
  std::filesystem::create_directories(p);
  return p;
}

// Removes the scratch repositories however the test exits.
struct Cleanup {
  std::vector<std::filesystem::path> dirs;
  ~Cleanup() {
    std::error_code ec;
    for (const auto& d : dirs) std::filesystem::remove_all(d, ec);
  }
};

int main() {
  const std::filesystem::path work = fresh_dir("work");
  const std::filesystem::path bare = fresh_dir("bare");
  const std::filesystem::path empty = fresh_dir("empty");
  const Cleanup cleanup{{work, bare, empty}};

  try {
    // work tree with loose objects: c1 -> c2, src/app.cpp modified
    const std::filesystem::path git_dir = work / ".git";
    std::filesystem::create_directories(git_dir / "objects");
    const auto write_tree = [&](std::vector<TreeRecord> recs) {
      return testsupport::write_loose_object(git_dir, ObjectType::tree, encode_tree(std::move(recs)));
    };

    const oid src1 = write_tree({file("app.cpp", "v1\n"), file("util.cpp", "u\n")});
    const oid src2 = write_tree({file("app.cpp", "v2\n"), file("util.cpp", "u\n")});
    const oid root1 = write_tree({file("README.md", "hi\n"), dir("src", src1)});
    const oid root2 = write_tree({file("README.md", "hi\n"), dir("src", src2)});
    const oid c1 = testsupport::write_loose_object(git_dir, ObjectType::commit, testsupport::commit_payload(root1, {}, "one\n"));
    const oid c2 = testsupport::write_loose_object(git_dir, ObjectType::commit, testsupport::commit_payload(root2, {c1}, "two\n"));
    testsupport::write_branch(git_dir, "main", &c2);

    {
      const auto found = find_git_dir(work);
      if (!found || *found != git_dir) { std::cerr << "find_git_dir: work tree\n"; return 1; }
      if (resolve_head(git_dir) != to_hex(c2)) { std::cerr << "resolve_head: symbolic\n"; return 1; }
    }

    {
      const auto res = analyze_local(work, Config{});
      if (!res) { std::cerr << "analyze_local: " << res.error_message << "\n"; return 1; }
      if (res.head_ref != to_hex(c2) || res.stats.commits != 2) { std::cerr << "analyze_local: head/stats\n"; return 1; }
      const auto* app = follow_path(*res.root, "src/app.cpp");
      const auto* src = follow_path(*res.root, "src");
      if (!app || app->num_changes != 1 || !src || src->num_changes != 1 || res.root->num_changes != 1) {
        std::cerr << "analyze_local: change counts\n"; return 1;
      }
      if (res.root->num_files != 3) { std::cerr << "analyze_local: num_files\n"; return 1; }
    }

    // loose object of the wrong type
    {
      const LocalObjectGraph graph{git_dir};
      if (graph.pack_count() != 0) { std::cerr << "local graph: unexpected packs\n"; return 1; }
      if (!throws<ObjectError>([&] { (void)graph.resolve_commit(root1); })) {
        std::cerr << "local graph: tree read as commit\n"; return 1;
      }
    }

    // bare repository: history in a pack, branch in packed-refs, a third commit loose
    {
      std::filesystem::create_directories(bare / "objects");
      const auto tree1 = encode_tree({file("notes.txt", "a\n")});
      const auto tree2 = encode_tree({file("notes.txt", "b\n")});
      const oid t1 = hash_object(consts::kTypeTree, tree1);
      const oid t2 = hash_object(consts::kTypeTree, tree2);
      const auto commit1 = testsupport::commit_payload(t1, {}, "1\n");
      const oid b1 = hash_object(consts::kTypeCommit, commit1);
      const auto commit2 = testsupport::commit_payload(t2, {b1}, "2\n");
      const oid b2 = hash_object(consts::kTypeCommit, commit2);

      testsupport::PackWriter w;
      (void)w.add(consts::kPackTree, tree1);
      (void)w.add(consts::kPackTree, tree2);
      (void)w.add(consts::kPackCommit, commit1);
      (void)w.add(consts::kPackCommit, commit2);
      const auto pack = w.finish();
      write_file(bare / "objects" / "pack" / "pack-test.pack", std::string(pack.begin(), pack.end()));

      const oid t3 = testsupport::write_loose_object(bare, ObjectType::tree, encode_tree({file("notes.txt", "c\n")}));
      const oid b3 = testsupport::write_loose_object(bare, ObjectType::commit, testsupport::commit_payload(t3, {b2}, "3\n"));

      write_file(bare / "HEAD", "ref: refs/heads/trunk\n");
      write_file(bare / "packed-refs", "# pack-refs with: peeled fully-peeled sorted\n" + to_hex(b3) +
                                           " refs/heads/trunk\n^" + to_hex(b1) + "\n");

      if (find_git_dir(bare) != bare) { std::cerr << "find_git_dir: bare\n"; return 1; }
      if (read_ref(bare, "refs/heads/trunk") != to_hex(b3)) { std::cerr << "read_ref: packed-refs\n"; return 1; }

      const LocalObjectGraph graph{bare};
      if (graph.pack_count() != 1) { std::cerr << "local graph: pack not loaded\n"; return 1; }

      const auto res = analyze_local(bare, Config{});
      if (!res) { std::cerr << "analyze bare: " << res.error_message << "\n"; return 1; }
      const auto* notes = follow_path(*res.root, "notes.txt");
      if (!notes || notes->num_changes != 2 || res.stats.commits != 3) {
        std::cerr << "analyze bare: counts\n"; return 1;
      }
    }

    // unborn branch and non-repositories
    {
      std::filesystem::create_directories(empty / ".git" / "objects");
      testsupport::write_branch(empty / ".git", "main");
      if (!throws<EmptyRepositoryError>([&] { (void)resolve_head(empty / ".git"); })) {
        std::cerr << "unborn: not reported\n"; return 1;
      }
      const auto res = analyze_local(empty, Config{});
      if (res || res.error_message.empty() || res.root) { std::cerr << "unborn: analysis should fail\n"; return 1; }

      const auto none = analyze_local(empty / "nowhere", Config{});
      if (none.success) { std::cerr << "not a repo: analysis should fail\n"; return 1; }
    }
  } catch (const std::exception& e) {
    std::cerr << "local_repo test failed: " << e.what() << "\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
