#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace repochurn {

// Exactly 40 lowercase hex digits, the only spelling the wire format uses
auto looks_hex40(std::string_view str) -> bool;

inline auto as_bytes(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

namespace strutil {

// Drop trailing CR/LF in place
void rstrip_newlines(std::string &str);

// Strip surrounding spaces, tabs and CR
auto trim(std::string_view sv) -> std::string;

} // namespace strutil

} // namespace repochurn
