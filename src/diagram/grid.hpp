#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace glyphseed::diagram {

constexpr std::size_t kDiagramSize = 7;

struct CellPosition {
  std::size_t row;
  std::size_t col;

  bool operator==(const CellPosition&) const = default;
};

// Fixed 7x7 matrix of optional cells. Accessors throw std::out_of_range for
// row or col >= 7.
template <typename T>
class DiagramGrid {
 public:
  using Cell = std::optional<T>;

  const Cell& Get(std::size_t row, std::size_t col) const { return cells_.at(row).at(col); }
  void Set(std::size_t row, std::size_t col, T value) { cells_.at(row).at(col) = std::move(value); }
  void Clear(std::size_t row, std::size_t col) { cells_.at(row).at(col).reset(); }

  bool IsEmpty() const { return PopulatedCount() == 0; }

  std::size_t PopulatedCount() const {
    std::size_t count = 0;
    for (const auto& row : cells_) {
      for (const auto& cell : row) {
        if (cell) ++count;
      }
    }
    return count;
  }

  // Populated cells in row-major order.
  std::vector<CellPosition> Positions() const {
    std::vector<CellPosition> out;
    for (std::size_t r = 0; r < kDiagramSize; ++r) {
      for (std::size_t c = 0; c < kDiagramSize; ++c) {
        if (cells_[r][c]) out.push_back({r, c});
      }
    }
    return out;
  }

  bool operator==(const DiagramGrid&) const = default;

 protected:
  std::array<std::array<Cell, kDiagramSize>, kDiagramSize> cells_{};
};

}  // namespace glyphseed::diagram
