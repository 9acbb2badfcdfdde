#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "diagram/diagram_error.hpp"
#include "diagram/grid.hpp"

namespace glyphseed::diagram {

// A 7x7 grid holding at most one Unicode scalar per cell.
//
// Wire layout: [UTF-8 characters][7 indices bytes][1 checksum byte]. Every
// indices byte keeps its top bit clear.
class SimpleDiagram : public DiagramGrid<char32_t> {
 public:
  SimpleDiagram() = default;

  // Fails with kEmptyDiagram when no cell is populated and kInvalidParameter
  // when a cell holds a non-scalar code point.
  bool Encode(std::vector<std::uint8_t>* out, DiagramError* error = nullptr) const;

  static bool Decode(std::span<const std::uint8_t> secret,
                     SimpleDiagram* out,
                     DiagramError* error = nullptr);

  // Parallel lists of characters and positions.
  static bool FromItems(std::span<const char32_t> values,
                        std::span<const CellPosition> positions,
                        SimpleDiagram* out,
                        DiagramError* error = nullptr);

  // Up to 49 row-major cell strings; each non-empty string contributes its
  // first scalar. Extra entries are ignored.
  static bool FromCellStrings(std::span<const std::string> cells,
                              SimpleDiagram* out,
                              DiagramError* error = nullptr);

 private:
  friend class AnimateDiagram;

  // Appends the cell characters in secret order and marks them in `indices`.
  bool AppendCells(std::string* chars, std::uint8_t* indices) const;
};

}  // namespace glyphseed::diagram
