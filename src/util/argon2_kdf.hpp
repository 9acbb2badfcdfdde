#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace glyphseed::util {

struct Argon2idParams {
  std::uint32_t t_cost;        // iterations
  std::uint32_t m_cost_kib;    // memory in KiB
  std::uint32_t parallelism;   // lanes
};

// Costs pinned by the argon2-v2 entropy scheme: 3 passes, 64 MiB, one lane.
Argon2idParams DefaultArgon2idParams();

// Salts shorter than this are rejected by libargon2.
constexpr std::size_t kArgon2MinSaltBytes = 8;

// Derive `key_len` bytes with Argon2id. Returns false when libargon2 rejects
// the inputs or cannot allocate; `key_out` is left empty in that case.
bool DeriveKeyArgon2id(std::span<const std::uint8_t> password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::size_t key_len,
                       std::vector<std::uint8_t>* key_out);

}  // namespace glyphseed::util
