#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace glyphseed::wallet {

// A derivation formula with pinned costs. Schemes are not interchangeable:
// the same secret and salt give unrelated entropy under each one.
enum class EntropyScheme : std::uint8_t {
  // scrypt(N=2^18, r=8, p=1) XOR PBKDF2-HMAC-SHA256(c=65536).
  kWarpV1 = 1,
  // Argon2id(t=3, m=64 MiB, p=1) XOR PBKDF2-HMAC-SHA512(c=65536).
  kArgon2V2 = 2,
};

constexpr EntropyScheme kDefaultEntropyScheme = EntropyScheme::kWarpV1;

std::string_view EntropySchemeName(EntropyScheme scheme);
std::optional<EntropyScheme> ParseEntropyScheme(std::string_view name);

using Entropy = std::array<std::uint8_t, 32>;

// entropy = KDF1(secret || 0x01, salt || 0x01) XOR KDF2(secret || 0x02, salt || 0x02)
//
// Throws std::invalid_argument when the salt is too short for the scheme
// (argon2-v2 needs at least 7 bytes of user salt) and std::runtime_error when
// a KDF fails to run.
Entropy DeriveEntropy(std::span<const std::uint8_t> secret,
                      std::span<const std::uint8_t> salt,
                      EntropyScheme scheme = kDefaultEntropyScheme);

}  // namespace glyphseed::wallet
