#include "util/bits.hpp"

#include <stdexcept>

namespace glyphseed::util {

namespace {

constexpr unsigned kMaxChunkWidth = 16;

void CheckWidth(unsigned width) {
  if (width == 0 || width > kMaxChunkWidth) {
    throw std::invalid_argument("bit chunk width must be within 1..16");
  }
}

std::uint32_t LoadWindow(std::span<const std::uint8_t> bytes, std::size_t first) {
  std::uint32_t window = 0;
  for (std::size_t i = 0; i < 4; ++i) {
    const std::size_t pos = first + i;
    const std::uint8_t byte = pos < bytes.size() ? bytes[pos] : 0;
    window = (window << 8) | byte;
  }
  return window;
}

}  // namespace

std::vector<std::uint8_t> PackBits(const std::vector<bool>& bits) {
  std::vector<std::uint8_t> out((bits.size() + 7) / 8, 0);
  for (std::size_t i = 0; i < bits.size(); ++i) {
    if (bits[i]) {
      out[i / 8] |= static_cast<std::uint8_t>(0x80u >> (i % 8));
    }
  }
  return out;
}

bool BitReader::operator[](std::size_t index) const {
  return ((bytes_[index / 8] >> (7 - index % 8)) & 1u) != 0;
}

bool BitReader::Next(bool* bit) {
  if (AtEnd()) {
    return false;
  }
  *bit = (*this)[position_++];
  return true;
}

std::vector<bool> UnpackBits(std::span<const std::uint8_t> bytes) {
  std::vector<bool> out;
  out.reserve(bytes.size() * 8);
  BitReader reader(bytes);
  bool bit = false;
  while (reader.Next(&bit)) {
    out.push_back(bit);
  }
  return out;
}

std::vector<std::uint16_t> ChunkBits(std::span<const std::uint8_t> bytes, unsigned width) {
  CheckWidth(width);
  const std::size_t total_bits = bytes.size() * 8;
  const std::size_t count = (total_bits + width - 1) / width;
  const std::uint32_t mask = (1u << width) - 1u;

  std::vector<std::uint16_t> out;
  out.reserve(count);
  for (std::size_t k = 0; k < count; ++k) {
    const std::size_t offset = k * width;
    // A 32-bit window starting at the containing byte always covers the
    // chunk: at most 7 leading bits plus 16 chunk bits.
    const std::uint32_t window = LoadWindow(bytes, offset / 8);
    const unsigned shift = 32u - static_cast<unsigned>(offset % 8) - width;
    out.push_back(static_cast<std::uint16_t>((window >> shift) & mask));
  }
  return out;
}

std::vector<std::uint8_t> JoinBitChunks(std::span<const std::uint16_t> values, unsigned width) {
  CheckWidth(width);
  std::vector<std::uint8_t> out((values.size() * width + 7) / 8, 0);
  std::size_t bit = 0;
  for (const auto value : values) {
    for (unsigned i = width; i-- > 0; ++bit) {
      if ((value >> i) & 1u) {
        out[bit / 8] |= static_cast<std::uint8_t>(0x80u >> (bit % 8));
      }
    }
  }
  return out;
}

}  // namespace glyphseed::util
