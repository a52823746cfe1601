#include "repochurn/errors.hpp"
#include "repochurn/pack.hpp"

#include "test_support.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace repochurn;
using testsupport::bytes;
using testsupport::throws;

// Recompute the trailing checksum after editing a pack in place.
static void reseal(std::vector<std::uint8_t>& pack) {
  const std::size_t body = pack.size() - consts::kOidRawLen;
  const oid sum = sha1(std::span<const std::uint8_t>(pack.data(), body));
  std::copy(sum.begin(), sum.end(), pack.begin() + static_cast<std::ptrdiff_t>(body));
}

int main() {
  try {
    const auto tree1 = encode_tree({testsupport::file("a.txt", "hello\n")});
    const auto tree2 = encode_tree({testsupport::file("a.txt", "hello\n"), testsupport::file("b.txt", "world\n")});
    const auto tree3 = encode_tree({testsupport::file("a.txt", "hello\n"), testsupport::file("b.txt", "world\n"),
                                    testsupport::file("c.txt", "!\n")});
    const oid t1 = hash_object(consts::kTypeTree, tree1);
    const oid t2 = hash_object(consts::kTypeTree, tree2);
    const oid t3 = hash_object(consts::kTypeTree, tree3);
    const auto commit1 = testsupport::commit_payload(t1, {}, "first\n");
    const oid c1 = hash_object(consts::kTypeCommit, commit1);
    const auto commit2 = testsupport::commit_payload(t3, {c1}, "second\n");
    const oid c2 = hash_object(consts::kTypeCommit, commit2);

    // tree3 is a ref-delta whose base (tree2) is itself a delta further on
    testsupport::PackWriter w;
    (void)w.add_ref_delta(t2, testsupport::make_delta(tree2, tree3, tree2.size()));
    (void)w.add(consts::kPackBlob, bytes("hello\n"));
    const std::size_t t1_at = w.add(consts::kPackTree, tree1);
    (void)w.add_ofs_delta(t1_at, testsupport::make_delta(tree1, tree2, tree1.size()));
    (void)w.add(consts::kPackCommit, commit1);
    (void)w.add_ref_delta(c1, testsupport::make_delta(commit1, commit2, 0));
    const auto pack = w.finish();

    {
      MemoryObjectGraph graph;
      const auto stats = pack::decode_pack(pack, graph);
      if (stats.version != 2 || stats.objects != 6 || stats.deltas != 3) {
        std::cerr << "decode: stats objects=" << stats.objects << " deltas=" << stats.deltas << "\n"; return 1;
      }
      if (stats.commits != 2 || stats.trees != 3) { std::cerr << "decode: commit/tree counts\n"; return 1; }
      if (!graph.has_tree(t1) || !graph.has_tree(t2) || !graph.has_tree(t3)) { std::cerr << "decode: trees missing\n"; return 1; }
      if (graph.tree_count() != 3 || graph.commit_count() != 2) { std::cerr << "decode: blobs must not be kept\n"; return 1; }
      const auto head = graph.resolve_commit(c2);
      if (head.tree != t3 || head.parents.size() != 1 || head.parents[0] != c1) {
        std::cerr << "decode: commit2 fields\n"; return 1;
      }
      const auto entries = graph.resolve_tree(t3);
      if (entries.size() != 3 || entries[2].name != "c.txt" || entries[2].kind != EntryKind::blob) {
        std::cerr << "decode: tree3 entries\n"; return 1;
      }
    }

    // corrupt body byte
    {
      auto bad = pack;
      bad[consts::kPackHeaderLen + 3] ^= 0x01;
      MemoryObjectGraph graph;
      if (!throws<ObjectError>([&] { (void)pack::decode_pack(bad, graph); })) {
        std::cerr << "checksum: corruption accepted\n"; return 1;
      }
    }

    // unsupported version
    {
      auto bad = pack;
      bad[7] = 4;
      reseal(bad);
      MemoryObjectGraph graph;
      if (!throws<ObjectError>([&] { (void)pack::decode_pack(bad, graph); })) {
        std::cerr << "version: v4 accepted\n"; return 1;
      }
    }

    // object count larger than the entries present
    {
      auto bad = pack;
      bad[11] = 7;
      reseal(bad);
      MemoryObjectGraph graph;
      if (!throws<ObjectError>([&] { (void)pack::decode_pack(bad, graph); })) {
        std::cerr << "count: missing entry accepted\n"; return 1;
      }
    }

    // too short to hold header and trailer
    {
      MemoryObjectGraph graph;
      if (!throws<ObjectError>([&] { (void)pack::decode_pack(bytes("PACK0002"), graph); })) {
        std::cerr << "short: accepted\n"; return 1;
      }
    }

    // thin pack: base not present
    {
      testsupport::PackWriter thin;
      (void)thin.add_ref_delta(t1, testsupport::make_delta(tree1, tree2, tree1.size()));
      MemoryObjectGraph graph;
      if (!throws<ObjectError>([&] { (void)pack::decode_pack(thin.finish(), graph); })) {
        std::cerr << "thin: external base accepted\n"; return 1;
      }
    }

    // copy with an omitted size copies 0x10000 bytes
    {
      const std::vector<std::uint8_t> base(0x10000, 'x');
      std::vector<std::uint8_t> delta;
      testsupport::put_delta_size(delta, base.size());
      testsupport::put_delta_size(delta, base.size());
      delta.push_back(0x80);
      if (pack::apply_delta(base, delta) != base) { std::cerr << "delta: implicit 0x10000 copy\n"; return 1; }
    }

    // reserved opcode and mismatched base size
    {
      const auto base = bytes("abc");
      std::vector<std::uint8_t> delta{3, 3, 0};
      if (!throws<ObjectError>([&] { (void)pack::apply_delta(base, delta); })) {
        std::cerr << "delta: opcode 0 accepted\n"; return 1;
      }
      std::vector<std::uint8_t> wrong{4, 1, 1, 'z'};
      if (!throws<ObjectError>([&] { (void)pack::apply_delta(base, wrong); })) {
        std::cerr << "delta: base size mismatch accepted\n"; return 1;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "pack_decode test failed: " << e.what() << "\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
