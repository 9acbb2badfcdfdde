#include "diagram/complex_diagram.hpp"

#include <algorithm>
#include <string_view>

#include "diagram/layout.hpp"
#include "util/utf8.hpp"

namespace glyphseed::diagram {

namespace {

constexpr std::uint8_t kComplexVersion = kMarkerBit;

DiagramError ValidateCell(const std::string& value) {
  if (value.empty()) {
    return DiagramError::kInvalidParameter;
  }
  const std::size_t scalars = util::CountScalars(value);
  if (scalars == std::string::npos) {
    return DiagramError::kInvalidUtf8;
  }
  // 50 scalars of at most 4 bytes stay below the 255-byte length limit.
  if (scalars > kMaxComplexCellChars) {
    return DiagramError::kCellOverflow;
  }
  return DiagramError::kNone;
}

}  // namespace

bool ComplexDiagram::Encode(std::vector<std::uint8_t>* out, DiagramError* error) const {
  if (IsEmpty()) {
    return Fail(error, DiagramError::kEmptyDiagram);
  }
  std::vector<std::uint8_t> strings;
  std::vector<std::uint8_t> lengths;
  IndicesBlock indices{};
  DiagramError failure = DiagramError::kNone;
  ForEachCellInSecretOrder([&](std::size_t row, std::size_t col) {
    const auto& cell = cells_[row][col];
    if (!cell || failure != DiagramError::kNone) {
      return;
    }
    failure = ValidateCell(*cell);
    if (failure != DiagramError::kNone) {
      return;
    }
    strings.insert(strings.end(), cell->begin(), cell->end());
    lengths.push_back(static_cast<std::uint8_t>(cell->size()));
    indices[row] |= ColumnMask(col);
  });
  if (failure != DiagramError::kNone) {
    return Fail(error, failure);
  }
  indices[0] |= kComplexVersion;

  std::vector<std::uint8_t> secret = std::move(strings);
  secret.insert(secret.end(), lengths.begin(), lengths.end());
  secret.insert(secret.end(), indices.begin(), indices.end());
  AppendChecksum(&secret);
  *out = std::move(secret);
  return true;
}

bool ComplexDiagram::Decode(std::span<const std::uint8_t> secret,
                            ComplexDiagram* out,
                            DiagramError* error) {
  if (secret.size() <= kIndicesBytes + kChecksumBytes) {
    return Fail(error, DiagramError::kInvalidLength);
  }
  std::span<const std::uint8_t> body;
  if (!SplitChecksum(secret, &body)) {
    return Fail(error, DiagramError::kInvalidChecksum);
  }
  const IndicesBlock indices = ReadIndicesBlock(body.last(kIndicesBytes));
  if ((indices[0] & kMarkerBit) != kComplexVersion) {
    return Fail(error, DiagramError::kInvalidVersion);
  }
  for (std::size_t row = 1; row < indices.size(); ++row) {
    if (indices[row] & kMarkerBit) {
      return Fail(error, DiagramError::kInvalidVersion);
    }
  }
  const std::size_t cell_count = CountMarkedCells(indices);
  if (cell_count == 0) {
    return Fail(error, DiagramError::kEmptyDiagram);
  }
  const auto payload = body.first(body.size() - kIndicesBytes);
  if (payload.size() < cell_count) {
    return Fail(error, DiagramError::kInvalidLength);
  }
  const auto lengths = payload.last(cell_count);
  const auto strings = payload.first(payload.size() - cell_count);
  std::size_t total = 0;
  for (const auto length : lengths) {
    if (length == 0) {
      return Fail(error, DiagramError::kParameterOverflow);
    }
    total += length;
  }
  if (total != strings.size()) {
    return Fail(error, DiagramError::kParameterOverflow);
  }

  ComplexDiagram diagram;
  std::size_t next_length = 0;
  std::size_t offset = 0;
  DiagramError failure = DiagramError::kNone;
  ForEachCellInSecretOrder([&](std::size_t row, std::size_t col) {
    if (!IsCellMarked(indices, row, col) || failure != DiagramError::kNone) {
      return;
    }
    const std::size_t length = lengths[next_length++];
    std::string value(reinterpret_cast<const char*>(strings.data()) + offset, length);
    offset += length;
    failure = ValidateCell(value);
    if (failure == DiagramError::kNone) {
      diagram.cells_[row][col] = std::move(value);
    }
  });
  if (failure != DiagramError::kNone) {
    return Fail(error, failure);
  }
  *out = std::move(diagram);
  return true;
}

bool ComplexDiagram::FromItems(std::span<const std::string> values,
                               std::span<const CellPosition> positions,
                               ComplexDiagram* out,
                               DiagramError* error) {
  if (values.empty() || values.size() != positions.size()) {
    return Fail(error, DiagramError::kInvalidParameter);
  }
  ComplexDiagram diagram;
  for (std::size_t i = 0; i < values.size(); ++i) {
    const auto& pos = positions[i];
    if (pos.row >= kDiagramSize || pos.col >= kDiagramSize) {
      return Fail(error, DiagramError::kInvalidParameter);
    }
    const DiagramError cell_error = ValidateCell(values[i]);
    if (cell_error != DiagramError::kNone) {
      return Fail(error, cell_error);
    }
    diagram.cells_[pos.row][pos.col] = values[i];
  }
  *out = std::move(diagram);
  return true;
}

bool ComplexDiagram::FromCellStrings(std::span<const std::string> cells,
                                     ComplexDiagram* out,
                                     DiagramError* error) {
  ComplexDiagram diagram;
  const std::size_t count = std::min(cells.size(), kDiagramSize * kDiagramSize);
  for (std::size_t i = 0; i < count; ++i) {
    if (cells[i].empty()) {
      continue;
    }
    std::u32string scalars;
    if (!util::DecodeUtf8(cells[i], &scalars)) {
      return Fail(error, DiagramError::kInvalidUtf8);
    }
    if (scalars.size() > kMaxComplexCellChars) {
      scalars.resize(kMaxComplexCellChars);
    }
    diagram.cells_[i / kDiagramSize][i % kDiagramSize] = util::EncodeUtf8(scalars);
  }
  *out = std::move(diagram);
  return true;
}

}  // namespace glyphseed::diagram
