#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace glyphseed::util {

struct ScryptParams {
  std::uint64_t n;              // CPU/memory cost, power of two
  std::uint64_t r;              // block size
  std::uint64_t p;              // parallelism
  std::uint64_t max_mem_bytes;  // allocation ceiling handed to OpenSSL
};

// Costs pinned by the warp-v1 entropy scheme: N=2^18, r=8, p=1.
ScryptParams DefaultScryptParams();

// Derive `key_len` bytes with scrypt (RFC 7914). Returns false when OpenSSL
// rejects the parameters or cannot allocate; `key_out` is left empty then.
bool DeriveKeyScrypt(std::span<const std::uint8_t> password,
                     std::span<const std::uint8_t> salt,
                     const ScryptParams& params,
                     std::size_t key_len,
                     std::vector<std::uint8_t>* key_out);

}  // namespace glyphseed::util
