#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "diagram/complex_diagram.hpp"
#include "util/hex.hpp"

using glyphseed::diagram::CellPosition;
using glyphseed::diagram::ComplexDiagram;
using glyphseed::diagram::DiagramError;
using glyphseed::diagram::DiagramErrorString;

namespace {

std::vector<std::uint8_t> FromHex(const std::string& hex) {
  std::vector<std::uint8_t> out;
  if (!glyphseed::util::HexDecode(hex, &out)) {
    throw std::runtime_error("bad hex in test: " + hex);
  }
  return out;
}

bool ExpectEncoding(const ComplexDiagram& diagram, const std::string& expected, const char* label) {
  std::vector<std::uint8_t> encoded;
  DiagramError error = DiagramError::kNone;
  if (!diagram.Encode(&encoded, &error)) {
    std::cerr << label << ": encode failed: " << DiagramErrorString(error) << "\n";
    return false;
  }
  if (glyphseed::util::HexEncode(encoded) != expected) {
    std::cerr << label << ": got " << glyphseed::util::HexEncode(encoded) << "\n";
    return false;
  }
  ComplexDiagram decoded;
  if (!ComplexDiagram::Decode(encoded, &decoded, &error) || !(decoded == diagram)) {
    std::cerr << label << ": round trip failed: " << DiagramErrorString(error) << "\n";
    return false;
  }
  return true;
}

bool ExpectDecodeError(const std::string& hex, DiagramError expected, const char* label) {
  ComplexDiagram decoded;
  DiagramError error = DiagramError::kNone;
  if (ComplexDiagram::Decode(FromHex(hex), &decoded, &error)) {
    std::cerr << label << ": decode unexpectedly succeeded\n";
    return false;
  }
  if (error != expected) {
    std::cerr << label << ": got " << DiagramErrorString(error) << ", expected "
              << DiagramErrorString(expected) << "\n";
    return false;
  }
  if (!decoded.IsEmpty()) {
    std::cerr << label << ": output was modified on failure\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    const std::vector<CellPosition> positions = {{0, 6}, {1, 1}, {1, 3}, {4, 2}, {6, 6}};

    {
      const std::vector<std::string> values = {"ABC", "123", "测试", "混A1", "A&*王😊"};
      ComplexDiagram diagram;
      DiagramError error = DiagramError::kNone;
      if (!ComplexDiagram::FromItems(values, positions, &diagram, &error)) {
        std::cerr << "FromItems failed: " << DiagramErrorString(error) << "\n";
        return EXIT_FAILURE;
      }
      if (!ExpectEncoding(diagram,
                          "41262ae78e8bf09f988a414243e6b58be8af95e6b7b741313132330a03060503812800"
                          "00100001c8",
                          "reference grid")) {
        return EXIT_FAILURE;
      }
    }

    {
      const std::vector<CellPosition> moved = {{0, 6}, {1, 1}, {1, 3}, {4, 2}, {6, 0}};
      const std::vector<std::string> values = {"ABC", "混A1", "123", "测试", "A&*王😊"};
      ComplexDiagram diagram;
      if (!ComplexDiagram::FromItems(values, moved, &diagram) ||
          !ExpectEncoding(diagram,
                          "414243313233e6b58be8af95e6b7b7413141262ae78e8bf09f988a030306050a812800"
                          "0010004052",
                          "bottom-left grid")) {
        std::cerr << "second reference grid failed\n";
        return EXIT_FAILURE;
      }
    }

    {
      // 50 characters fit; 51 overflow.
      std::string fifty;
      for (int i = 0; i < 50; ++i) fifty += "\xF0\x9F\x98\x8A";
      ComplexDiagram diagram;
      diagram.Set(3, 4, fifty);
      std::vector<std::uint8_t> encoded;
      DiagramError error = DiagramError::kNone;
      ComplexDiagram decoded;
      if (!diagram.Encode(&encoded, &error) || !ComplexDiagram::Decode(encoded, &decoded, &error) ||
          !(decoded == diagram)) {
        std::cerr << "50-character cell failed: " << DiagramErrorString(error) << "\n";
        return EXIT_FAILURE;
      }
      diagram.Set(3, 4, fifty + "x");
      if (diagram.Encode(&encoded, &error) || error != DiagramError::kCellOverflow) {
        std::cerr << "51-character cell was accepted\n";
        return EXIT_FAILURE;
      }
      diagram.Set(3, 4, "");
      if (diagram.Encode(&encoded, &error) || error != DiagramError::kInvalidParameter) {
        std::cerr << "empty cell string was accepted\n";
        return EXIT_FAILURE;
      }
      diagram.Set(3, 4, "\xC3");
      if (diagram.Encode(&encoded, &error) || error != DiagramError::kInvalidUtf8) {
        std::cerr << "malformed cell string was accepted\n";
        return EXIT_FAILURE;
      }
      ComplexDiagram empty;
      if (empty.Encode(&encoded, &error) || error != DiagramError::kEmptyDiagram) {
        std::cerr << "empty diagram encoded\n";
        return EXIT_FAILURE;
      }
    }

    {
      // Builder truncates to 50 characters.
      std::vector<std::string> cells(3);
      cells[2] = std::string(60, 'q');
      ComplexDiagram diagram;
      if (!ComplexDiagram::FromCellStrings(cells, &diagram) ||
          diagram.Get(0, 2) != std::string(50, 'q') || diagram.PopulatedCount() != 1) {
        std::cerr << "FromCellStrings did not truncate\n";
        return EXIT_FAILURE;
      }
    }

    if (!ExpectDecodeError("414200028300000000000015", DiagramError::kParameterOverflow,
                           "zero length") ||
        !ExpectDecodeError("4142430101830000000000001f", DiagramError::kParameterOverflow,
                           "length sum mismatch") ||
        !ExpectDecodeError("41010100000000000046", DiagramError::kInvalidVersion,
                           "missing version bit") ||
        !ExpectDecodeError("6161616161616161616161616161616161616161616161616161616161616161616161"
                           "61616161616161616161616161616161613381000000000000d1",
                           DiagramError::kCellOverflow, "51-character cell") ||
        !ExpectDecodeError("c341010183000000000000d6", DiagramError::kInvalidUtf8,
                           "split code point") ||
        !ExpectDecodeError("f09f988a412ae78e8b26012800001000012d", DiagramError::kInvalidVersion,
                           "simple layout")) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "complex_diagram_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
