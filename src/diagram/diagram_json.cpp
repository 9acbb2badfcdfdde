#include "diagram/diagram_json.hpp"

#include "util/utf8.hpp"

namespace glyphseed::diagram {

namespace {

bool SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

// Flattens a 7x7 JSON cell matrix into 49 row-major strings.
bool ReadCellMatrix(const nlohmann::json& matrix,
                    std::vector<std::string>* cells,
                    std::string* error) {
  if (!matrix.is_array() || matrix.size() != kDiagramSize) {
    return SetError(error, "cells must be an array of 7 rows");
  }
  std::vector<std::string> out;
  out.reserve(kDiagramSize * kDiagramSize);
  for (const auto& row : matrix) {
    if (!row.is_array() || row.size() != kDiagramSize) {
      return SetError(error, "each row must be an array of 7 cells");
    }
    for (const auto& cell : row) {
      if (cell.is_null()) {
        out.emplace_back();
      } else if (cell.is_string()) {
        out.push_back(cell.get<std::string>());
      } else {
        return SetError(error, "cells must be strings or null");
      }
    }
  }
  *cells = std::move(out);
  return true;
}

bool ReadSimpleFrame(const nlohmann::json& matrix, SimpleDiagram* out, std::string* error) {
  std::vector<std::string> cells;
  if (!ReadCellMatrix(matrix, &cells, error)) {
    return false;
  }
  for (const auto& cell : cells) {
    if (!cell.empty() && util::CountScalars(cell) != 1) {
      return SetError(error, "simple cells hold exactly one character");
    }
  }
  DiagramError diagram_error = DiagramError::kNone;
  if (!SimpleDiagram::FromCellStrings(cells, out, &diagram_error)) {
    return SetError(error, DiagramErrorString(diagram_error));
  }
  return true;
}

template <typename Grid, typename ToString>
nlohmann::json WriteCellMatrix(const Grid& grid, ToString to_string) {
  nlohmann::json rows = nlohmann::json::array();
  for (std::size_t r = 0; r < kDiagramSize; ++r) {
    nlohmann::json row = nlohmann::json::array();
    for (std::size_t c = 0; c < kDiagramSize; ++c) {
      const auto& cell = grid.Get(r, c);
      if (cell) {
        row.push_back(to_string(*cell));
      } else {
        row.push_back(nullptr);
      }
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

nlohmann::json WriteSimpleFrame(const SimpleDiagram& frame) {
  return WriteCellMatrix(frame, [](char32_t ch) { return util::EncodeUtf8(std::u32string(1, ch)); });
}

}  // namespace

bool DiagramDocumentFromJson(const nlohmann::json& root,
                             std::optional<DiagramFormat> format_override,
                             DiagramDocument* out,
                             std::string* error) {
  if (!root.is_object()) {
    return SetError(error, "diagram document must be a JSON object");
  }
  DiagramDocument document;
  if (format_override) {
    document.format = *format_override;
  } else {
    if (!root.contains("format") || !root.at("format").is_string()) {
      return SetError(error, "missing \"format\" member");
    }
    const auto name = root.at("format").get<std::string>();
    const auto format = ParseDiagramFormat(name);
    if (!format) {
      return SetError(error, "unknown diagram format: " + name);
    }
    document.format = *format;
  }

  switch (document.format) {
    case DiagramFormat::kSimple: {
      if (!root.contains("cells")) {
        return SetError(error, "missing \"cells\" member");
      }
      if (!ReadSimpleFrame(root.at("cells"), &document.simple, error)) {
        return false;
      }
      break;
    }
    case DiagramFormat::kComplex: {
      if (!root.contains("cells")) {
        return SetError(error, "missing \"cells\" member");
      }
      std::vector<std::string> cells;
      if (!ReadCellMatrix(root.at("cells"), &cells, error)) {
        return false;
      }
      for (const auto& cell : cells) {
        const std::size_t scalars = util::CountScalars(cell);
        if (scalars == std::string::npos) {
          return SetError(error, DiagramErrorString(DiagramError::kInvalidUtf8));
        }
        if (scalars > kMaxComplexCellChars) {
          return SetError(error, DiagramErrorString(DiagramError::kCellOverflow));
        }
      }
      DiagramError diagram_error = DiagramError::kNone;
      if (!ComplexDiagram::FromCellStrings(cells, &document.complex, &diagram_error)) {
        return SetError(error, DiagramErrorString(diagram_error));
      }
      break;
    }
    case DiagramFormat::kAnimate: {
      if (!root.contains("frames") || !root.at("frames").is_array()) {
        return SetError(error, "missing \"frames\" array");
      }
      std::vector<SimpleDiagram> frames;
      for (const auto& matrix : root.at("frames")) {
        SimpleDiagram frame;
        if (!ReadSimpleFrame(matrix, &frame, error)) {
          return false;
        }
        frames.push_back(std::move(frame));
      }
      document.animate = AnimateDiagram(std::move(frames));
      break;
    }
  }
  *out = std::move(document);
  return true;
}

bool ParseDiagramDocument(const std::string& text,
                          std::optional<DiagramFormat> format_override,
                          DiagramDocument* out,
                          std::string* error) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(text);
  } catch (const std::exception& ex) {
    return SetError(error, std::string("invalid json: ") + ex.what());
  }
  return DiagramDocumentFromJson(root, format_override, out, error);
}

nlohmann::json DiagramDocumentToJson(const DiagramDocument& document) {
  nlohmann::json root;
  root["format"] = std::string(DiagramFormatName(document.format));
  switch (document.format) {
    case DiagramFormat::kSimple:
      root["cells"] = WriteSimpleFrame(document.simple);
      break;
    case DiagramFormat::kComplex:
      root["cells"] = WriteCellMatrix(document.complex, [](const std::string& s) { return s; });
      break;
    case DiagramFormat::kAnimate: {
      nlohmann::json frames = nlohmann::json::array();
      for (const auto& frame : document.animate.frames()) {
        frames.push_back(WriteSimpleFrame(frame));
      }
      root["frames"] = std::move(frames);
      break;
    }
  }
  return root;
}

bool EncodeDiagramDocument(const DiagramDocument& document,
                           std::vector<std::uint8_t>* out,
                           DiagramError* error) {
  switch (document.format) {
    case DiagramFormat::kSimple:
      return document.simple.Encode(out, error);
    case DiagramFormat::kComplex:
      return document.complex.Encode(out, error);
    case DiagramFormat::kAnimate:
      return document.animate.Encode(out, error);
  }
  return Fail(error, DiagramError::kInvalidParameter);
}

bool DecodeDiagramDocument(std::span<const std::uint8_t> secret,
                           DiagramDocument* out,
                           DiagramError* error) {
  DiagramDocument document;
  if (!DetectDiagramFormat(secret, &document.format, error)) {
    return false;
  }
  bool ok = false;
  switch (document.format) {
    case DiagramFormat::kSimple:
      ok = SimpleDiagram::Decode(secret, &document.simple, error);
      break;
    case DiagramFormat::kComplex:
      ok = ComplexDiagram::Decode(secret, &document.complex, error);
      break;
    case DiagramFormat::kAnimate:
      ok = AnimateDiagram::Decode(secret, &document.animate, error);
      break;
  }
  if (!ok) {
    return false;
  }
  *out = std::move(document);
  return true;
}

}  // namespace glyphseed::diagram
