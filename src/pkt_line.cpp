#include "repochurn/pkt_line.hpp"

#include "repochurn/consts.hpp"
#include "repochurn/errors.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <string>

namespace repochurn::pkt {

namespace {

[[nodiscard]] auto hex_value(std::uint8_t c) -> int {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

[[nodiscard]] auto token_equals(std::span<const std::uint8_t> token, std::string_view literal)
    -> bool {
  return token.size() == literal.size() &&
         std::equal(token.begin(), token.end(), literal.begin(),
                    [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); });
}

[[nodiscard]] auto parse_length(std::span<const std::uint8_t> token, std::size_t at)
    -> std::size_t {
  std::size_t len = 0;
  for (const std::uint8_t c : token) {
    if (c < 0x20 || c > 0x7e) {
      throw ProtocolError("non-ASCII byte in frame length at offset " + std::to_string(at));
    }
    const int v = hex_value(c);
    if (v < 0) {
      throw ProtocolError("malformed frame length at offset " + std::to_string(at));
    }
    len = (len << 4U) | static_cast<std::size_t>(v);
  }
  return len;
}

} // namespace

auto FrameReader::next() -> std::optional<Frame> {
  if (done_ || pos_ >= input_.size()) {
    done_ = true;
    return std::nullopt;
  }
  if (input_.size() - pos_ < consts::kPktLenSize) {
    throw ProtocolError("truncated frame length at offset " + std::to_string(pos_));
  }
  const auto token = input_.subspan(pos_, consts::kPktLenSize);

  if (token_equals(token, consts::kFlushPkt)) {
    pos_ += consts::kPktLenSize;
    return Frame{.kind = FrameKind::flush, .payload = {}, .declared_length = 0};
  }

  if (token_equals(token, consts::kPackMagic)) {
    // Everything from here on is the binary transfer; never frame-decoded.
    done_ = true;
    const auto rest = input_.subspan(pos_);
    pos_ = input_.size();
    return Frame{.kind = FrameKind::pack, .payload = rest, .declared_length = 0};
  }

  const std::size_t len = parse_length(token, pos_);
  if (len < consts::kPktLenSize) {
    throw ProtocolError("invalid frame length " + std::to_string(len) + " at offset " +
                        std::to_string(pos_));
  }
  if (len > input_.size() - pos_) {
    throw ProtocolError("frame at offset " + std::to_string(pos_) + " runs past end of input");
  }
  Frame f{.kind = FrameKind::data,
          .payload = input_.subspan(pos_ + consts::kPktLenSize, len - consts::kPktLenSize),
          .declared_length = len};
  pos_ += len;
  return f;
}

auto FrameReader::next_data() -> std::optional<Frame> {
  while (auto f = next()) {
    if (f->kind == FrameKind::data) {
      return f;
    }
    if (f->kind == FrameKind::pack) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

auto ascii_text(std::span<const std::uint8_t> bytes) -> std::string {
  std::string s;
  s.reserve(bytes.size());
  for (const std::uint8_t b : bytes) {
    if (b > 0x7f) {
      throw ProtocolError("invalid ASCII character in protocol text");
    }
    s.push_back(static_cast<char>(b));
  }
  return s;
}

auto encode_frame(std::string_view payload) -> std::string {
  const std::size_t len = payload.size() + consts::kPktLenSize;
  if (len > consts::kPktMaxLen) {
    throw ProtocolError("frame payload too large: " + std::to_string(payload.size()));
  }
  std::array<char, 5> hdr{};
  std::snprintf(hdr.data(), hdr.size(), "%04zx", len);
  std::string out(hdr.data(), consts::kPktLenSize);
  out.append(payload);
  return out;
}

} // namespace repochurn::pkt
