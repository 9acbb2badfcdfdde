#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "diagram/diagram_error.hpp"

namespace glyphseed::diagram {

enum class DiagramFormat {
  kSimple,
  kComplex,
  kAnimate,
};

std::string_view DiagramFormatName(DiagramFormat format);
std::optional<DiagramFormat> ParseDiagramFormat(std::string_view name);

// Classifies an encoded diagram by the marker bits of its trailing indices
// block after verifying the checksum. Only the classification is checked;
// the matching Decode still validates the rest.
bool DetectDiagramFormat(std::span<const std::uint8_t> secret,
                         DiagramFormat* out,
                         DiagramError* error = nullptr);

}  // namespace glyphseed::diagram
