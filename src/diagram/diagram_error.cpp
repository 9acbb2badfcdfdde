#include "diagram/diagram_error.hpp"

namespace glyphseed::diagram {

const char* DiagramErrorString(DiagramError error) {
  switch (error) {
    case DiagramError::kNone:
      return "no error";
    case DiagramError::kInvalidChecksum:
      return "checksum mismatch";
    case DiagramError::kInvalidVersion:
      return "unexpected version bits in indices block";
    case DiagramError::kInvalidLength:
      return "encoded diagram is too short";
    case DiagramError::kInvalidUtf8:
      return "cell content is not valid UTF-8";
    case DiagramError::kEmptyDiagram:
      return "diagram has no populated cells";
    case DiagramError::kCellOverflow:
      return "cell content exceeds 50 characters";
    case DiagramError::kParameterOverflow:
      return "cell lengths do not match the encoded content";
    case DiagramError::kInvalidParameter:
      return "cell layout does not match the encoded content";
  }
  return "unknown diagram error";
}

}  // namespace glyphseed::diagram
