#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <vector>

namespace repochurn::fs {

// File and zlib helpers. Failures throw std::runtime_error; callers that
// know what the bytes were wrap it into their own error type.

bool exists(const std::filesystem::path &p);
void ensure_parent_dir(const std::filesystem::path &p);

std::vector<std::uint8_t> read_file(const std::filesystem::path &p);

// Write to "<p>.lock" and rename over p.
void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data);

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

struct Inflated {
  std::vector<std::uint8_t> data;
  std::size_t consumed = 0; // compressed bytes read from the input, trailer included
};

// Inflate one zlib stream from the front of `input`, which may be followed by
// unrelated bytes (as inside a pack). `expected_size` is the inflated size the
// caller already knows; a mismatch is an error.
Inflated z_inflate_prefix(std::span<const std::uint8_t> input, std::size_t expected_size);

using ChunkSink = std::function<void(std::span<const std::uint8_t>)>;

// Like z_inflate_prefix, but hands the output to `sink` in bounded chunks
// instead of keeping it. Returns the compressed bytes consumed.
std::size_t z_inflate_stream(std::span<const std::uint8_t> input, std::size_t expected_size,
                             const ChunkSink &sink);

} // namespace repochurn::fs
