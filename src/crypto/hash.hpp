#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace glyphseed::crypto {

using Sha256Hash = std::array<std::uint8_t, 32>;
using Sha512Hash = std::array<std::uint8_t, 64>;

// FIPS 180-4 one-shot digests.
Sha256Hash Sha256(std::span<const std::uint8_t> data);
Sha512Hash Sha512(std::span<const std::uint8_t> data);

// RFC 2104 HMAC over the digests above. Keys longer than the block size are
// hashed first.
Sha256Hash HmacSha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);
Sha512Hash HmacSha512(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);

}  // namespace glyphseed::crypto
