#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace glyphseed::util {

// Pack a boolean sequence MSB-first into bytes. The final byte is zero
// padded when the sequence length is not a multiple of eight.
std::vector<std::uint8_t> PackBits(const std::vector<bool>& bits);

// Sequential MSB-first view over a byte buffer. The reader does not copy the
// buffer; it can be rewound with Reset() and iterated again.
class BitReader {
 public:
  explicit BitReader(std::span<const std::uint8_t> bytes) : bytes_(bytes) {}

  std::size_t size() const { return bytes_.size() * 8; }
  std::size_t position() const { return position_; }
  bool AtEnd() const { return position_ >= size(); }

  // Random access to bit `index` (0 is the MSB of the first byte).
  bool operator[](std::size_t index) const;

  // Returns false once every bit has been read.
  bool Next(bool* bit);

  void Reset() { position_ = 0; }

 private:
  std::span<const std::uint8_t> bytes_;
  std::size_t position_{0};
};

std::vector<bool> UnpackBits(std::span<const std::uint8_t> bytes);

// Split a byte stream into successive `width`-bit values (1 <= width <= 16),
// MSB-first. The stream is zero padded at the tail and yields
// floor((8 * bytes.size() + width - 1) / width) values, so a partial final
// chunk is emitted with its low bits zero. Throws std::invalid_argument on a
// bad width.
std::vector<std::uint16_t> ChunkBits(std::span<const std::uint8_t> bytes, unsigned width);

// Inverse of ChunkBits for complete chunks: concatenates the low `width` bits
// of every value MSB-first and packs them into bytes, zero padding the last
// byte.
std::vector<std::uint8_t> JoinBitChunks(std::span<const std::uint16_t> values, unsigned width);

}  // namespace glyphseed::util
