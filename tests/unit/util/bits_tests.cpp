#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "util/bits.hpp"
#include "util/hex.hpp"

namespace {

template <typename T>
bool ExpectEq(const std::vector<T>& actual, const std::vector<T>& expected, const char* label) {
  if (actual != expected) {
    std::cerr << label << ": mismatch (size " << actual.size() << " vs " << expected.size()
              << ")\n";
    for (std::size_t i = 0; i < actual.size() && i < expected.size(); ++i) {
      if (actual[i] != expected[i]) {
        std::cerr << "  first difference at " << i << ": " << actual[i] << " vs " << expected[i]
                  << "\n";
        break;
      }
    }
    return false;
  }
  return true;
}

}  // namespace

int main() {
  using namespace glyphseed::util;

  {
    // 10 bits pad to two bytes.
    const std::vector<bool> bits = {true, false, true, false, true, false, true, true,
                                    true, true};
    if (!ExpectEq<std::uint8_t>(PackBits(bits), {0xAB, 0xC0}, "pack 10 bits")) return EXIT_FAILURE;
    if (!PackBits({}).empty()) {
      std::cerr << "packing no bits should yield no bytes\n";
      return EXIT_FAILURE;
    }
  }

  {
    const std::vector<std::uint8_t> bytes = {0xA5, 0x0F};
    const auto bits = UnpackBits(bytes);
    if (bits.size() != 16 || !bits[0] || bits[1] || !bits[2] || bits[4] || !bits[15]) {
      std::cerr << "unpack produced unexpected bits\n";
      return EXIT_FAILURE;
    }
    if (!ExpectEq<std::uint8_t>(PackBits(bits), bytes, "pack(unpack(x))")) return EXIT_FAILURE;

    BitReader reader(bytes);
    std::size_t ones = 0;
    bool bit = false;
    while (reader.Next(&bit)) {
      if (bit) ++ones;
    }
    if (ones != 8 || !reader.AtEnd()) {
      std::cerr << "reader counted " << ones << " set bits\n";
      return EXIT_FAILURE;
    }
    reader.Reset();
    if (reader.position() != 0 || !reader.Next(&bit) || !bit) {
      std::cerr << "reader did not restart from the first bit\n";
      return EXIT_FAILURE;
    }
    if (reader[12] != true || reader[11] != false) {
      std::cerr << "random access mismatch\n";
      return EXIT_FAILURE;
    }
  }

  {
    // A partial trailing chunk is emitted with zero padding.
    const std::vector<std::uint8_t> bytes = {0xAB, 0xCD};
    if (!ExpectEq<std::uint16_t>(ChunkBits(bytes, 5), {21, 15, 6, 16}, "chunk 5")) {
      return EXIT_FAILURE;
    }
    const std::vector<std::uint8_t> three = {0xAB, 0xCD, 0xEF};
    if (!ExpectEq<std::uint16_t>(ChunkBits(three, 16), {0xABCD, 0xEF00}, "chunk 16")) {
      return EXIT_FAILURE;
    }
    const std::vector<std::uint8_t> one = {0x80};
    if (!ExpectEq<std::uint16_t>(ChunkBits(one, 3), {4, 0, 0}, "chunk 3")) return EXIT_FAILURE;
    if (!ExpectEq<std::uint16_t>(ChunkBits(one, 8), {0x80}, "chunk 8")) return EXIT_FAILURE;
  }

  {
    // 160 bits of entropy split into 11-bit word indices.
    std::vector<std::uint8_t> entropy;
    if (!HexDecode("5174bb1dddfc6e2fef4e47df6fcc046a48d195b9", &entropy)) {
      std::cerr << "hex decode failed\n";
      return EXIT_FAILURE;
    }
    const std::vector<std::uint16_t> expected = {651,  1326, 1595, 1503, 1591, 191,  1513, 1607,
                                                 1787, 1011, 8,    1700, 1128, 1622, 1824};
    const auto chunks = ChunkBits(entropy, 11);
    if (!ExpectEq(chunks, expected, "chunk 11")) return EXIT_FAILURE;

    // Joining complete chunks restores the stream plus zero padding.
    auto joined = JoinBitChunks(chunks, 11);
    if (joined.size() != 21 || joined.back() != 0) {
      std::cerr << "joined size " << joined.size() << "\n";
      return EXIT_FAILURE;
    }
    joined.pop_back();
    if (!ExpectEq(joined, entropy, "join 11")) return EXIT_FAILURE;
  }

  for (const unsigned bad_width : {0u, 17u}) {
    bool threw = false;
    try {
      const std::vector<std::uint8_t> bytes = {0x01};
      (void)ChunkBits(bytes, bad_width);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "ChunkBits accepted width " << bad_width << "\n";
      return EXIT_FAILURE;
    }
  }

  return EXIT_SUCCESS;
}
