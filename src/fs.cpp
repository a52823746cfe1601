#include "repochurn/fs.hpp"

#include <algorithm>
#include <climits>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <zlib.h>

namespace stdfs = std::filesystem;

namespace repochurn::fs {

namespace {

constexpr std::size_t kInflateChunk = 16 * 1024;

// Owns one inflate stream; inflateEnd runs however the caller exits.
struct Inflater {
  z_stream zs{};

  Inflater() {
    if (inflateInit(&zs) != Z_OK) {
      throw std::runtime_error("zlib: inflateInit failed");
    }
  }
  ~Inflater() { inflateEnd(&zs); }

  Inflater(const Inflater &) = delete;
  Inflater &operator=(const Inflater &) = delete;

  void feed(std::span<const std::uint8_t> input) {
    zs.next_in = const_cast<Bytef *>(input.data());
    zs.avail_in = static_cast<uInt>(std::min<std::size_t>(input.size(), UINT_MAX));
  }

  // Inflate into out[zs.total_out, out.size()); returns the zlib status.
  int step(std::vector<std::uint8_t> &out) {
    zs.next_out = out.data() + zs.total_out;
    zs.avail_out = static_cast<uInt>(std::min<std::size_t>(out.size() - zs.total_out, UINT_MAX));
    return inflate(&zs, Z_NO_FLUSH);
  }
};

[[noreturn]] void throw_zlib(const char *what, int rc, const z_stream &zs) {
  std::string msg = std::string("zlib: ") + what + " (" + std::to_string(rc);
  if (zs.msg != nullptr) {
    msg += ", ";
    msg += zs.msg;
  }
  throw std::runtime_error(msg + ")");
}

} // namespace

bool exists(const stdfs::path &p) {
  std::error_code ec;
  return stdfs::exists(p, ec);
}

void ensure_parent_dir(const stdfs::path &p) {
  if (!p.has_parent_path()) {
    return;
  }
  std::error_code ec;
  stdfs::create_directories(p.parent_path(), ec);
  if (ec) {
    throw std::runtime_error("cannot create " + p.parent_path().string() + ": " + ec.message());
  }
}

std::vector<std::uint8_t> read_file(const stdfs::path &p) {
  std::error_code ec;
  const auto size = stdfs::file_size(p, ec);
  if (ec) {
    throw std::runtime_error("cannot read " + p.string() + ": " + ec.message());
  }
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(size));
  std::ifstream in(p, std::ios::binary);
  if (!in.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()))) {
    throw std::runtime_error("short read from " + p.string());
  }
  return buf;
}

void write_file_atomic(const stdfs::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  stdfs::path tmp = p;
  tmp += ".lock";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out.flush()) {
      throw std::runtime_error("cannot write " + tmp.string());
    }
  }
  std::error_code ec;
  stdfs::rename(tmp, p, ec);
  if (ec) {
    stdfs::remove(tmp, ec);
    throw std::runtime_error("cannot replace " + p.string());
  }
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  Inflater z;
  z.feed(data);
  std::vector<std::uint8_t> out(std::max(data.size() * 2, kInflateChunk));
  for (;;) {
    const int rc = z.step(out);
    if (rc == Z_STREAM_END) {
      out.resize(z.zs.total_out);
      return out;
    }
    if (rc != Z_OK && rc != Z_BUF_ERROR) {
      throw_zlib("corrupt stream", rc, z.zs);
    }
    if (z.zs.avail_in == 0 && z.zs.avail_out != 0) {
      throw std::runtime_error("zlib: truncated stream");
    }
    out.resize(out.size() * 2);
  }
}

Inflated z_inflate_prefix(std::span<const std::uint8_t> input, std::size_t expected_size) {
  Inflater z;
  z.feed(input);
  Inflated result;
  // One spare byte so a stream longer than announced is caught.
  result.data.resize(expected_size + 1);
  const int rc = z.step(result.data);
  if (rc != Z_STREAM_END) {
    if (rc == Z_OK || rc == Z_BUF_ERROR) {
      throw std::runtime_error(z.zs.avail_out == 0 ? "zlib: stream longer than declared size"
                                                   : "zlib: truncated stream");
    }
    throw_zlib("corrupt stream", rc, z.zs);
  }
  if (z.zs.total_out != expected_size) {
    throw std::runtime_error("zlib: inflated " + std::to_string(z.zs.total_out) +
                             " bytes, expected " + std::to_string(expected_size));
  }
  result.data.resize(expected_size);
  result.consumed = z.zs.total_in;
  return result;
}

std::size_t z_inflate_stream(std::span<const std::uint8_t> input, std::size_t expected_size,
                             const ChunkSink &sink) {
  Inflater z;
  z.feed(input);
  std::vector<std::uint8_t> chunk(kInflateChunk);
  for (;;) {
    z.zs.next_out = chunk.data();
    z.zs.avail_out = static_cast<uInt>(chunk.size());
    const int rc = inflate(&z.zs, Z_NO_FLUSH);
    const std::size_t produced = chunk.size() - z.zs.avail_out;
    if (z.zs.total_out > expected_size) {
      throw std::runtime_error("zlib: stream longer than declared size");
    }
    if (produced != 0) {
      sink(std::span<const std::uint8_t>(chunk.data(), produced));
    }
    if (rc == Z_STREAM_END) {
      break;
    }
    if (rc != Z_OK && rc != Z_BUF_ERROR) {
      throw_zlib("corrupt stream", rc, z.zs);
    }
    if (z.zs.avail_in == 0 && produced == 0) {
      throw std::runtime_error("zlib: truncated stream");
    }
  }
  if (z.zs.total_out != expected_size) {
    throw std::runtime_error("zlib: inflated " + std::to_string(z.zs.total_out) +
                             " bytes, expected " + std::to_string(expected_size));
  }
  return z.zs.total_in;
}

} // namespace repochurn::fs
