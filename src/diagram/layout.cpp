#include "diagram/layout.hpp"

#include <bit>

#include "crypto/hash.hpp"

namespace glyphseed::diagram {

std::size_t CountMarkedCells(const IndicesBlock& indices) {
  std::size_t count = 0;
  for (const auto byte : indices) {
    count += static_cast<std::size_t>(std::popcount(static_cast<unsigned>(byte & kCellBits)));
  }
  return count;
}

IndicesBlock ReadIndicesBlock(std::span<const std::uint8_t> bytes) {
  IndicesBlock block{};
  for (std::size_t i = 0; i < block.size(); ++i) {
    block[i] = bytes[i];
  }
  return block;
}

std::uint8_t SecretChecksum(std::span<const std::uint8_t> data) {
  return crypto::Sha256(data)[0];
}

void AppendChecksum(std::vector<std::uint8_t>* secret) {
  secret->push_back(SecretChecksum(*secret));
}

bool SplitChecksum(std::span<const std::uint8_t> secret, std::span<const std::uint8_t>* body) {
  if (secret.empty()) {
    return false;
  }
  const auto prefix = secret.first(secret.size() - kChecksumBytes);
  if (SecretChecksum(prefix) != secret.back()) {
    return false;
  }
  *body = prefix;
  return true;
}

}  // namespace glyphseed::diagram
