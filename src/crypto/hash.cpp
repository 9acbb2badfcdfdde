#include "crypto/hash.hpp"

#include <algorithm>
#include <vector>

#include <oqs/sha2.h>

#include "util/secure_wipe.hpp"

namespace glyphseed::crypto {

namespace {

struct Sha256Traits {
  using Digest = Sha256Hash;
  static constexpr std::size_t kBlockSize = 64;
  static Digest Hash(std::span<const std::uint8_t> data) { return Sha256(data); }
};

struct Sha512Traits {
  using Digest = Sha512Hash;
  static constexpr std::size_t kBlockSize = 128;
  static Digest Hash(std::span<const std::uint8_t> data) { return Sha512(data); }
};

template <typename Traits>
typename Traits::Digest Hmac(std::span<const std::uint8_t> key,
                             std::span<const std::uint8_t> data) {
  using Digest = typename Traits::Digest;
  std::array<std::uint8_t, Traits::kBlockSize> block{};
  if (key.size() > Traits::kBlockSize) {
    const Digest hashed = Traits::Hash(key);
    std::copy(hashed.begin(), hashed.end(), block.begin());
  } else {
    std::copy(key.begin(), key.end(), block.begin());
  }

  std::vector<std::uint8_t> inner;
  inner.reserve(Traits::kBlockSize + data.size());
  for (const auto b : block) inner.push_back(static_cast<std::uint8_t>(b ^ 0x36));
  inner.insert(inner.end(), data.begin(), data.end());
  Digest inner_hash = Traits::Hash(inner);

  std::vector<std::uint8_t> outer;
  outer.reserve(Traits::kBlockSize + inner_hash.size());
  for (const auto b : block) outer.push_back(static_cast<std::uint8_t>(b ^ 0x5c));
  outer.insert(outer.end(), inner_hash.begin(), inner_hash.end());
  const Digest mac = Traits::Hash(outer);

  util::SecureWipe(block);
  util::SecureWipe(inner);
  util::SecureWipe(outer);
  util::SecureWipe(inner_hash);
  return mac;
}

}  // namespace

Sha256Hash Sha256(std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  OQS_SHA2_sha256(out.data(), data.data(), data.size());
  return out;
}

Sha512Hash Sha512(std::span<const std::uint8_t> data) {
  Sha512Hash out{};
  OQS_SHA2_sha512(out.data(), data.data(), data.size());
  return out;
}

Sha256Hash HmacSha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
  return Hmac<Sha256Traits>(key, data);
}

Sha512Hash HmacSha512(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
  return Hmac<Sha512Traits>(key, data);
}

}  // namespace glyphseed::crypto
