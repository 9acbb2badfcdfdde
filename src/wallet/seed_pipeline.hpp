#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "wallet/entropy.hpp"

namespace glyphseed::wallet {

// Receives the final seed and builds the hierarchical key tree from it.
// Implemented by the embedding wallet.
class KeyTreeBuilder {
 public:
  virtual ~KeyTreeBuilder() = default;

  // `seed` is 32 bytes for diagram entropy and 64 bytes for mnemonic seeds.
  // It is wiped by the caller once this returns.
  virtual bool BuildMaster(std::span<const std::uint8_t> seed, std::string* error) = 0;
};

// Validates user secrets, derives seed material and hands it to a
// KeyTreeBuilder. Errors are reported as human-readable strings in `error`.
class SeedPipeline {
 public:
  explicit SeedPipeline(KeyTreeBuilder* builder) : builder_(builder) {}

  // Accepts an encoded diagram of any layout; it must decode cleanly before
  // entropy is derived from it.
  bool FromDiagram(std::span<const std::uint8_t> encoded,
                   std::span<const std::uint8_t> salt,
                   EntropyScheme scheme = kDefaultEntropyScheme,
                   std::string* error = nullptr);

  // Validates the sentence (language detected from the words), rejoins it in
  // canonical form and derives the 64-byte mnemonic seed.
  bool FromMnemonic(std::string_view sentence,
                    const std::string& passphrase,
                    std::string* error = nullptr);

 private:
  bool Deliver(std::span<const std::uint8_t> seed, std::string* error);

  KeyTreeBuilder* builder_;
};

}  // namespace glyphseed::wallet
