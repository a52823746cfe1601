#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace repochurn {

// Binary SHA-1 object id
using oid = std::array<std::uint8_t, 20>;

// SHA-1 output is uniformly distributed; the leading bytes make a fine hash.
struct OidHash {
  std::size_t operator()(const oid &id) const noexcept {
    std::size_t h = 0;
    std::memcpy(&h, id.data(), sizeof(h));
    return h;
  }
};

// Incremental SHA-1 for data that arrives in pieces (streamed pack entries).
class Sha1 {
public:
  Sha1();
  ~Sha1();
  Sha1(const Sha1 &) = delete;
  Sha1 &operator=(const Sha1 &) = delete;

  Sha1 &update(std::span<const std::uint8_t> data);
  Sha1 &update(std::string_view s) {
    return update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
  }
  oid finish();

private:
  struct Ctx;
  std::unique_ptr<Ctx> ctx_;
};

// Plain SHA-1 of `data` (pack trailers). Object ids use hash_object.
oid sha1(std::span<const std::uint8_t> data);

inline oid sha1(std::string_view s) {
  return sha1(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

// 40 lowercase hex digits
std::string to_hex(const oid &id);

// Lowercase hex only; `out` is left untouched on failure.
bool from_hex(std::string_view hex, oid &out);

// "<type> <size>\0"
inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s(type);
  s += ' ';
  s += std::to_string(size);
  s += '\0';
  return s;
}

// Id of an object: SHA-1 over header and payload.
oid hash_object(std::string_view type, std::span<const std::uint8_t> payload);

} // namespace repochurn
