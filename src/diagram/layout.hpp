#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "diagram/grid.hpp"

namespace glyphseed::diagram {

// One byte per row; bit (6 - col) marks a populated cell. The top bit is
// reserved for format markers.
using IndicesBlock = std::array<std::uint8_t, kDiagramSize>;

constexpr std::size_t kIndicesBytes = kDiagramSize;
constexpr std::size_t kChecksumBytes = 1;
constexpr std::uint8_t kMarkerBit = 0x80;
constexpr std::uint8_t kCellBits = 0x7F;

constexpr std::uint8_t ColumnMask(std::size_t col) {
  return static_cast<std::uint8_t>(1u << (kDiagramSize - 1 - col));
}

// Cells are serialized bottom-right first: columns 6..0, and within each
// column rows 6..0. Every layout uses this order for both encode and decode.
template <typename Fn>
void ForEachCellInSecretOrder(Fn&& fn) {
  for (std::size_t col = kDiagramSize; col-- > 0;) {
    for (std::size_t row = kDiagramSize; row-- > 0;) {
      fn(row, col);
    }
  }
}

inline bool IsCellMarked(const IndicesBlock& indices, std::size_t row, std::size_t col) {
  return (indices[row] & ColumnMask(col)) != 0;
}

std::size_t CountMarkedCells(const IndicesBlock& indices);

IndicesBlock ReadIndicesBlock(std::span<const std::uint8_t> bytes);

// First byte of SHA-256 over `data`.
std::uint8_t SecretChecksum(std::span<const std::uint8_t> data);

void AppendChecksum(std::vector<std::uint8_t>* secret);

// Verifies the trailing checksum byte and returns everything before it in
// `body`.
bool SplitChecksum(std::span<const std::uint8_t> secret, std::span<const std::uint8_t>* body);

}  // namespace glyphseed::diagram
