#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "diagram/animate_diagram.hpp"
#include "diagram/complex_diagram.hpp"
#include "diagram/diagram_error.hpp"
#include "diagram/diagram_format.hpp"
#include "diagram/simple_diagram.hpp"

namespace glyphseed::diagram {

// A diagram of any layout as exchanged by the command-line tool:
//   {"format":"simple","cells":[[7 cells] x 7]}
//   {"format":"animate","frames":[[[7 cells] x 7], ...]}
// A cell is a string, or null / "" when empty.
struct DiagramDocument {
  DiagramFormat format{DiagramFormat::kSimple};
  SimpleDiagram simple;
  ComplexDiagram complex;
  AnimateDiagram animate;
};

// `format_override`, when set, replaces the document's "format" member
// (which is then optional).
bool DiagramDocumentFromJson(const nlohmann::json& root,
                             std::optional<DiagramFormat> format_override,
                             DiagramDocument* out,
                             std::string* error = nullptr);

bool ParseDiagramDocument(const std::string& text,
                          std::optional<DiagramFormat> format_override,
                          DiagramDocument* out,
                          std::string* error = nullptr);

nlohmann::json DiagramDocumentToJson(const DiagramDocument& document);

bool EncodeDiagramDocument(const DiagramDocument& document,
                           std::vector<std::uint8_t>* out,
                           DiagramError* error = nullptr);

// Detects the layout of `secret` and decodes it.
bool DecodeDiagramDocument(std::span<const std::uint8_t> secret,
                           DiagramDocument* out,
                           DiagramError* error = nullptr);

}  // namespace glyphseed::diagram
