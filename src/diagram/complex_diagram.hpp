#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "diagram/diagram_error.hpp"
#include "diagram/grid.hpp"

namespace glyphseed::diagram {

// Longest cell content, in Unicode scalars.
constexpr std::size_t kMaxComplexCellChars = 50;

// A 7x7 grid of short UTF-8 strings.
//
// Wire layout: [cell strings][one length byte per cell][7 indices bytes]
// [1 checksum byte]. Strings and lengths follow the secret traversal order.
// indices[0] carries the version bit; the other indices bytes keep their top
// bit clear.
class ComplexDiagram : public DiagramGrid<std::string> {
 public:
  ComplexDiagram() = default;

  // Fails with kEmptyDiagram, kInvalidParameter (empty cell string),
  // kInvalidUtf8 or kCellOverflow (> 50 scalars).
  bool Encode(std::vector<std::uint8_t>* out, DiagramError* error = nullptr) const;

  static bool Decode(std::span<const std::uint8_t> secret,
                     ComplexDiagram* out,
                     DiagramError* error = nullptr);

  static bool FromItems(std::span<const std::string> values,
                        std::span<const CellPosition> positions,
                        ComplexDiagram* out,
                        DiagramError* error = nullptr);

  // Up to 49 row-major cell strings, each truncated to 50 scalars.
  static bool FromCellStrings(std::span<const std::string> cells,
                              ComplexDiagram* out,
                              DiagramError* error = nullptr);
};

}  // namespace glyphseed::diagram
