#include "repochurn/hash.hpp"

#include "repochurn/consts.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace repochurn {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";

int hex_digit(char c) {
  const auto at = kHexDigits.find(c);
  return at == std::string_view::npos ? -1 : static_cast<int>(at);
}

struct MdCtxFree {
  void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

} // namespace

struct Sha1::Ctx {
  std::unique_ptr<EVP_MD_CTX, MdCtxFree> md{EVP_MD_CTX_new()};
};

Sha1::Sha1() : ctx_(std::make_unique<Ctx>()) {
  if (!ctx_->md || EVP_DigestInit_ex(ctx_->md.get(), EVP_sha1(), nullptr) != 1) {
    throw std::runtime_error("openssl: cannot initialise SHA-1");
  }
}

Sha1::~Sha1() = default;

Sha1 &Sha1::update(std::span<const std::uint8_t> data) {
  if (!data.empty() && EVP_DigestUpdate(ctx_->md.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("openssl: SHA-1 update failed");
  }
  return *this;
}

oid Sha1::finish() {
  oid out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_->md.get(), out.data(), &len) != 1 || len != out.size()) {
    throw std::runtime_error("openssl: SHA-1 finalisation failed");
  }
  return out;
}

oid sha1(std::span<const std::uint8_t> data) { return Sha1{}.update(data).finish(); }

oid hash_object(std::string_view type, std::span<const std::uint8_t> payload) {
  return Sha1{}.update(object_header(type, payload.size())).update(payload).finish();
}

std::string to_hex(const oid &id) {
  std::string s;
  s.reserve(consts::kOidHexLen);
  for (const std::uint8_t b : id) {
    s.push_back(kHexDigits[b >> 4U]);
    s.push_back(kHexDigits[b & 0x0fU]);
  }
  return s;
}

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != consts::kOidHexLen) {
    return false;
  }
  oid parsed{};
  for (std::size_t i = 0; i < parsed.size(); ++i) {
    const int hi = hex_digit(hex[2 * i]);
    const int lo = hex_digit(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    parsed[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  out = parsed;
  return true;
}

} // namespace repochurn
