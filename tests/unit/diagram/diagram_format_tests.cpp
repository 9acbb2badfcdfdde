#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "diagram/diagram_format.hpp"
#include "util/hex.hpp"

using glyphseed::diagram::DetectDiagramFormat;
using glyphseed::diagram::DiagramError;
using glyphseed::diagram::DiagramFormat;
using glyphseed::diagram::DiagramFormatName;

namespace {

std::vector<std::uint8_t> FromHex(const std::string& hex) {
  std::vector<std::uint8_t> out;
  if (!glyphseed::util::HexDecode(hex, &out)) {
    throw std::runtime_error("bad hex in test: " + hex);
  }
  return out;
}

}  // namespace

int main() {
  try {
    struct Case {
      const char* hex;
      DiagramFormat format;
    };
    const Case cases[] = {
        {"f09f988a412ae78e8b26012800001000012d", DiagramFormat::kSimple},
        {"41262ae78e8bf09f988a414243e6b58be8af95e6b7b741313132330a0306050381280000100001c8",
         DiagramFormat::kComplex},
        {"f09f988a61e78e8b8080020000000140800000000000a6", DiagramFormat::kAnimate},
        {"41818000000000007b", DiagramFormat::kAnimate},
    };
    for (const auto& c : cases) {
      DiagramFormat format = DiagramFormat::kSimple;
      DiagramError error = DiagramError::kNone;
      if (!DetectDiagramFormat(FromHex(c.hex), &format, &error) || format != c.format) {
        std::cerr << "wrong format for " << c.hex << ": " << DiagramFormatName(format) << "\n";
        return EXIT_FAILURE;
      }
    }

    DiagramFormat format = DiagramFormat::kSimple;
    DiagramError error = DiagramError::kNone;
    if (DetectDiagramFormat(FromHex("f09f988a412ae78e8b26012800001000012e"), &format, &error) ||
        error != DiagramError::kInvalidChecksum) {
      std::cerr << "checksum not verified\n";
      return EXIT_FAILURE;
    }
    if (DetectDiagramFormat(FromHex("4101000080000000e8"), &format, &error) ||
        error != DiagramError::kInvalidVersion) {
      std::cerr << "stray marker bit accepted\n";
      return EXIT_FAILURE;
    }
    if (DetectDiagramFormat(FromHex("01"), &format, &error) ||
        error != DiagramError::kInvalidLength) {
      std::cerr << "short input accepted\n";
      return EXIT_FAILURE;
    }

    for (const auto f : {DiagramFormat::kSimple, DiagramFormat::kComplex, DiagramFormat::kAnimate}) {
      const auto parsed = glyphseed::diagram::ParseDiagramFormat(DiagramFormatName(f));
      if (!parsed || *parsed != f) {
        std::cerr << "format name does not round trip\n";
        return EXIT_FAILURE;
      }
    }
    if (glyphseed::diagram::ParseDiagramFormat("grid")) {
      std::cerr << "unknown format name parsed\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "diagram_format_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
