#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "diagram/simple_diagram.hpp"
#include "util/hex.hpp"

using glyphseed::diagram::CellPosition;
using glyphseed::diagram::DiagramError;
using glyphseed::diagram::DiagramErrorString;
using glyphseed::diagram::SimpleDiagram;

namespace {

std::vector<std::uint8_t> FromHex(const std::string& hex) {
  std::vector<std::uint8_t> out;
  if (!glyphseed::util::HexDecode(hex, &out)) {
    throw std::runtime_error("bad hex in test: " + hex);
  }
  return out;
}

bool ExpectDecodeError(const std::string& hex, DiagramError expected, const char* label) {
  SimpleDiagram decoded;
  decoded.Set(3, 3, U'Z');
  DiagramError error = DiagramError::kNone;
  if (SimpleDiagram::Decode(FromHex(hex), &decoded, &error)) {
    std::cerr << label << ": decode unexpectedly succeeded\n";
    return false;
  }
  if (error != expected) {
    std::cerr << label << ": got " << DiagramErrorString(error) << ", expected "
              << DiagramErrorString(expected) << "\n";
    return false;
  }
  if (decoded.Get(3, 3) != U'Z' || decoded.PopulatedCount() != 1) {
    std::cerr << label << ": output was modified on failure\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    const std::string kReferenceHex = "f09f988a412ae78e8b26012800001000012d";

    SimpleDiagram diagram;
    diagram.Set(0, 6, U'A');
    diagram.Set(1, 1, U'&');
    diagram.Set(1, 3, U'*');
    diagram.Set(4, 2, U'王');
    diagram.Set(6, 6, U'\U0001F60A');

    std::vector<std::uint8_t> encoded;
    DiagramError error = DiagramError::kNone;
    if (!diagram.Encode(&encoded, &error)) {
      std::cerr << "encode failed: " << DiagramErrorString(error) << "\n";
      return EXIT_FAILURE;
    }
    if (glyphseed::util::HexEncode(encoded) != kReferenceHex) {
      std::cerr << "unexpected encoding " << glyphseed::util::HexEncode(encoded) << "\n";
      return EXIT_FAILURE;
    }

    SimpleDiagram decoded;
    if (!SimpleDiagram::Decode(encoded, &decoded, &error) || !(decoded == diagram)) {
      std::cerr << "round trip failed: " << DiagramErrorString(error) << "\n";
      return EXIT_FAILURE;
    }
    const std::vector<CellPosition> positions = {{0, 6}, {1, 1}, {1, 3}, {4, 2}, {6, 6}};
    if (decoded.Positions() != positions) {
      std::cerr << "Positions() is not row-major\n";
      return EXIT_FAILURE;
    }

    // Any single-bit flip must be caught by the checksum for this vector.
    for (std::size_t bit = 0; bit < encoded.size() * 8; ++bit) {
      auto corrupted = encoded;
      corrupted[bit / 8] ^= static_cast<std::uint8_t>(0x80u >> (bit % 8));
      SimpleDiagram out;
      if (SimpleDiagram::Decode(corrupted, &out, &error) ||
          error != DiagramError::kInvalidChecksum) {
        std::cerr << "bit flip " << bit << " not detected\n";
        return EXIT_FAILURE;
      }
    }

    // FromItems builds the same grid.
    const std::vector<char32_t> values = {U'A', U'&', U'*', U'王', U'\U0001F60A'};
    SimpleDiagram from_items;
    if (!SimpleDiagram::FromItems(values, positions, &from_items, &error) ||
        !(from_items == diagram)) {
      std::cerr << "FromItems mismatch\n";
      return EXIT_FAILURE;
    }
    const std::vector<CellPosition> short_positions = {{0, 6}};
    const std::vector<CellPosition> bad_positions = {{0, 6}, {1, 1}, {1, 3}, {4, 2}, {6, 7}};
    if (SimpleDiagram::FromItems(values, short_positions, &from_items, &error) ||
        error != DiagramError::kInvalidParameter ||
        SimpleDiagram::FromItems(values, bad_positions, &from_items, &error) ||
        error != DiagramError::kInvalidParameter) {
      std::cerr << "FromItems accepted mismatched input\n";
      return EXIT_FAILURE;
    }

    // Builder from row-major strings keeps the first character.
    std::vector<std::string> cells(49);
    cells[6] = "Abc";
    cells[7 + 1] = "&";
    cells[7 + 3] = "*";
    cells[4 * 7 + 2] = "王国";
    cells[48] = "\xF0\x9F\x98\x8A";
    SimpleDiagram from_strings;
    if (!SimpleDiagram::FromCellStrings(cells, &from_strings, &error) ||
        !(from_strings == diagram)) {
      std::cerr << "FromCellStrings mismatch\n";
      return EXIT_FAILURE;
    }

    SimpleDiagram empty;
    if (empty.Encode(&encoded, &error) || error != DiagramError::kEmptyDiagram) {
      std::cerr << "empty diagram encoded\n";
      return EXIT_FAILURE;
    }
    SimpleDiagram bad_scalar;
    bad_scalar.Set(0, 0, static_cast<char32_t>(0xD800));
    if (bad_scalar.Encode(&encoded, &error) || error != DiagramError::kInvalidParameter) {
      std::cerr << "surrogate cell encoded\n";
      return EXIT_FAILURE;
    }

    bool threw = false;
    try {
      diagram.Set(7, 0, U'x');
    } catch (const std::out_of_range&) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "Set accepted row 7\n";
      return EXIT_FAILURE;
    }
    diagram.Clear(6, 6);
    if (diagram.Get(6, 6).has_value() || diagram.PopulatedCount() != 4) {
      std::cerr << "Clear did not remove the cell\n";
      return EXIT_FAILURE;
    }

    if (!ExpectDecodeError("4101000000000000", DiagramError::kInvalidLength, "too short") ||
        !ExpectDecodeError("4103000000000000bf", DiagramError::kInvalidParameter,
                           "two marks, one char") ||
        !ExpectDecodeError("4101000080000000e8", DiagramError::kInvalidVersion,
                           "marker bit set") ||
        !ExpectDecodeError("ff0100000000000002", DiagramError::kInvalidUtf8, "bad utf8") ||
        !ExpectDecodeError("f09f988a412ae78e8b26012800001000012e", DiagramError::kInvalidChecksum,
                           "bad checksum")) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "simple_diagram_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
