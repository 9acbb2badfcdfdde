#include "diagram/simple_diagram.hpp"

#include <algorithm>
#include <string_view>

#include "diagram/layout.hpp"
#include "util/utf8.hpp"

namespace glyphseed::diagram {

bool SimpleDiagram::AppendCells(std::string* chars, std::uint8_t* indices) const {
  bool ok = true;
  ForEachCellInSecretOrder([&](std::size_t row, std::size_t col) {
    const auto& cell = cells_[row][col];
    if (!cell) {
      return;
    }
    if (!util::AppendUtf8(*cell, chars)) {
      ok = false;
      return;
    }
    indices[row] |= ColumnMask(col);
  });
  return ok;
}

bool SimpleDiagram::Encode(std::vector<std::uint8_t>* out, DiagramError* error) const {
  if (IsEmpty()) {
    return Fail(error, DiagramError::kEmptyDiagram);
  }
  std::string chars;
  IndicesBlock indices{};
  if (!AppendCells(&chars, indices.data())) {
    return Fail(error, DiagramError::kInvalidParameter);
  }
  std::vector<std::uint8_t> secret(chars.begin(), chars.end());
  secret.insert(secret.end(), indices.begin(), indices.end());
  AppendChecksum(&secret);
  *out = std::move(secret);
  return true;
}

bool SimpleDiagram::Decode(std::span<const std::uint8_t> secret,
                           SimpleDiagram* out,
                           DiagramError* error) {
  if (secret.size() <= kIndicesBytes + kChecksumBytes) {
    return Fail(error, DiagramError::kInvalidLength);
  }
  std::span<const std::uint8_t> body;
  if (!SplitChecksum(secret, &body)) {
    return Fail(error, DiagramError::kInvalidChecksum);
  }
  const IndicesBlock indices = ReadIndicesBlock(body.last(kIndicesBytes));
  for (const auto byte : indices) {
    if (byte & kMarkerBit) {
      return Fail(error, DiagramError::kInvalidVersion);
    }
  }
  const auto prefix = body.first(body.size() - kIndicesBytes);
  std::u32string chars;
  if (!util::DecodeUtf8(std::string_view(reinterpret_cast<const char*>(prefix.data()),
                                         prefix.size()),
                        &chars)) {
    return Fail(error, DiagramError::kInvalidUtf8);
  }
  if (CountMarkedCells(indices) != chars.size()) {
    return Fail(error, DiagramError::kInvalidParameter);
  }

  SimpleDiagram diagram;
  std::size_t next = 0;
  ForEachCellInSecretOrder([&](std::size_t row, std::size_t col) {
    if (IsCellMarked(indices, row, col)) {
      diagram.cells_[row][col] = chars[next++];
    }
  });
  *out = std::move(diagram);
  return true;
}

bool SimpleDiagram::FromItems(std::span<const char32_t> values,
                              std::span<const CellPosition> positions,
                              SimpleDiagram* out,
                              DiagramError* error) {
  if (values.empty() || values.size() != positions.size()) {
    return Fail(error, DiagramError::kInvalidParameter);
  }
  SimpleDiagram diagram;
  for (std::size_t i = 0; i < values.size(); ++i) {
    const auto& pos = positions[i];
    if (pos.row >= kDiagramSize || pos.col >= kDiagramSize ||
        !util::IsUnicodeScalar(values[i])) {
      return Fail(error, DiagramError::kInvalidParameter);
    }
    diagram.cells_[pos.row][pos.col] = values[i];
  }
  *out = std::move(diagram);
  return true;
}

bool SimpleDiagram::FromCellStrings(std::span<const std::string> cells,
                                    SimpleDiagram* out,
                                    DiagramError* error) {
  SimpleDiagram diagram;
  const std::size_t count = std::min(cells.size(), kDiagramSize * kDiagramSize);
  for (std::size_t i = 0; i < count; ++i) {
    if (cells[i].empty()) {
      continue;
    }
    std::u32string scalars;
    if (!util::DecodeUtf8(cells[i], &scalars)) {
      return Fail(error, DiagramError::kInvalidUtf8);
    }
    diagram.cells_[i / kDiagramSize][i % kDiagramSize] = scalars.front();
  }
  *out = std::move(diagram);
  return true;
}

}  // namespace glyphseed::diagram
