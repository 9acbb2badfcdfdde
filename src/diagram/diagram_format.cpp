#include "diagram/diagram_format.hpp"

#include "diagram/layout.hpp"

namespace glyphseed::diagram {

std::string_view DiagramFormatName(DiagramFormat format) {
  switch (format) {
    case DiagramFormat::kSimple:
      return "simple";
    case DiagramFormat::kComplex:
      return "complex";
    case DiagramFormat::kAnimate:
      return "animate";
  }
  return "unknown";
}

std::optional<DiagramFormat> ParseDiagramFormat(std::string_view name) {
  if (name == "simple") return DiagramFormat::kSimple;
  if (name == "complex") return DiagramFormat::kComplex;
  if (name == "animate") return DiagramFormat::kAnimate;
  return std::nullopt;
}

bool DetectDiagramFormat(std::span<const std::uint8_t> secret,
                         DiagramFormat* out,
                         DiagramError* error) {
  if (secret.size() <= kIndicesBytes + kChecksumBytes) {
    return Fail(error, DiagramError::kInvalidLength);
  }
  std::span<const std::uint8_t> body;
  if (!SplitChecksum(secret, &body)) {
    return Fail(error, DiagramError::kInvalidChecksum);
  }
  // The last block on the wire belongs to the first animate frame, which
  // always carries the frame marker in row 1.
  const IndicesBlock indices = ReadIndicesBlock(body.last(kIndicesBytes));
  for (std::size_t row = 2; row < indices.size(); ++row) {
    if (indices[row] & kMarkerBit) {
      return Fail(error, DiagramError::kInvalidVersion);
    }
  }
  if (indices[1] & kMarkerBit) {
    *out = DiagramFormat::kAnimate;
  } else if (indices[0] & kMarkerBit) {
    *out = DiagramFormat::kComplex;
  } else {
    *out = DiagramFormat::kSimple;
  }
  return true;
}

}  // namespace glyphseed::diagram
