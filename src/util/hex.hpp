#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace glyphseed::util {

// Lowercase hex, two digits per byte.
std::string HexEncode(std::span<const std::uint8_t> data);

// Accepts an optional "0x" prefix and surrounding ASCII whitespace, then
// requires an even number of hex digits of either case.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

inline std::span<const std::uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace glyphseed::util
