#pragma once

namespace glyphseed::diagram {

enum class DiagramError {
  kNone = 0,
  kInvalidChecksum,
  kInvalidVersion,
  kInvalidLength,
  kInvalidUtf8,
  kEmptyDiagram,
  kCellOverflow,
  kParameterOverflow,
  kInvalidParameter,
};

const char* DiagramErrorString(DiagramError error);

// Stores `kind` in `error` (when non-null) and returns false, so codec paths
// can `return Fail(error, ...)`.
inline bool Fail(DiagramError* error, DiagramError kind) {
  if (error) {
    *error = kind;
  }
  return false;
}

}  // namespace glyphseed::diagram
