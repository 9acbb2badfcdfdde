#include "util/pbkdf2.hpp"

#include <algorithm>
#include <stdexcept>

#include "crypto/hash.hpp"
#include "util/secure_wipe.hpp"

namespace glyphseed::util {

namespace {

template <typename Prf>
std::vector<std::uint8_t> Pbkdf2(Prf prf,
                                 std::span<const std::uint8_t> password,
                                 std::span<const std::uint8_t> salt,
                                 std::uint32_t iterations,
                                 std::size_t dk_len) {
  if (iterations == 0 || dk_len == 0) {
    throw std::invalid_argument("PBKDF2 requires iterations >= 1 and dk_len >= 1");
  }
  std::vector<std::uint8_t> out;
  out.reserve(dk_len);

  // U1 input: salt || INT_32_BE(block_index)
  std::vector<std::uint8_t> first(salt.begin(), salt.end());
  first.resize(salt.size() + 4);

  for (std::uint32_t block_index = 1; out.size() < dk_len; ++block_index) {
    first[salt.size()] = static_cast<std::uint8_t>(block_index >> 24);
    first[salt.size() + 1] = static_cast<std::uint8_t>(block_index >> 16);
    first[salt.size() + 2] = static_cast<std::uint8_t>(block_index >> 8);
    first[salt.size() + 3] = static_cast<std::uint8_t>(block_index);

    auto u = prf(password, first);
    auto t = u;
    for (std::uint32_t i = 1; i < iterations; ++i) {
      u = prf(password, u);
      for (std::size_t j = 0; j < t.size(); ++j) {
        t[j] ^= u[j];
      }
    }
    const std::size_t take = std::min(t.size(), dk_len - out.size());
    out.insert(out.end(), t.begin(), t.begin() + static_cast<std::ptrdiff_t>(take));
    SecureWipe(u);
    SecureWipe(t);
  }
  SecureWipe(first);
  return out;
}

}  // namespace

std::vector<std::uint8_t> Pbkdf2HmacSha256(std::span<const std::uint8_t> password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len) {
  return Pbkdf2(
      [](std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
        return crypto::HmacSha256(key, data);
      },
      password, salt, iterations, dk_len);
}

std::vector<std::uint8_t> Pbkdf2HmacSha512(std::span<const std::uint8_t> password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len) {
  return Pbkdf2(
      [](std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
        return crypto::HmacSha512(key, data);
      },
      password, salt, iterations, dk_len);
}

}  // namespace glyphseed::util
