#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace repochurn::pkt {

enum class FrameKind {
  flush, // "0000", a boundary marker, never a payload
  data,  // length-prefixed record
  pack,  // "PACK": the rest of the stream is binary
};

struct Frame {
  FrameKind kind = FrameKind::data;
  std::span<const std::uint8_t> payload; // views into the reader's input
  std::size_t declared_length = 0;       // includes the 4-byte prefix; 0 for flush/pack
};

/**
 * Lazy decoder over an immutable buffer of pkt-line records.
 * Each reader walks its input once; construct a new one to start over.
 * Iteration ends when the buffer is exhausted or right after a pack frame.
 * Malformed length tokens throw ProtocolError.
 */
class FrameReader {
public:
  explicit FrameReader(std::span<const std::uint8_t> input) : input_(input) {}

  [[nodiscard]] auto next() -> std::optional<Frame>;

  // Next data frame, skipping flush markers. Stops (nullopt) at a pack frame.
  [[nodiscard]] auto next_data() -> std::optional<Frame>;

  [[nodiscard]] auto position() const noexcept -> std::size_t { return pos_; }

private:
  std::span<const std::uint8_t> input_;
  std::size_t pos_ = 0;
  bool done_ = false;
};

// Decode a payload that must be plain ASCII (bytes above 0x7f are rejected).
auto ascii_text(std::span<const std::uint8_t> bytes) -> std::string;

// "<4 lowercase hex digits of size+4><payload>"
auto encode_frame(std::string_view payload) -> std::string;

} // namespace repochurn::pkt
