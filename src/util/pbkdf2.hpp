#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace glyphseed::util {

// PBKDF2 (RFC 8018) with HMAC-SHA256 / HMAC-SHA512 as the PRF.
// - password, salt: arbitrary bytes
// - iterations: c >= 1
// - dk_len: length of the derived key in bytes
//
// Throws std::invalid_argument when iterations or dk_len is zero.
std::vector<std::uint8_t> Pbkdf2HmacSha256(std::span<const std::uint8_t> password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len);

std::vector<std::uint8_t> Pbkdf2HmacSha512(std::span<const std::uint8_t> password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len);

}  // namespace glyphseed::util
