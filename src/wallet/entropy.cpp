#include "wallet/entropy.hpp"

#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "util/argon2_kdf.hpp"
#include "util/logging.hpp"
#include "util/pbkdf2.hpp"
#include "util/scrypt_kdf.hpp"
#include "util/secure_wipe.hpp"

namespace glyphseed::wallet {

namespace {

constexpr std::uint8_t kMemoryHardDiscriminator = 0x01;
constexpr std::uint8_t kIterativeDiscriminator = 0x02;
constexpr std::uint32_t kPbkdf2Iterations = 65536;

std::vector<std::uint8_t> WithSuffix(std::span<const std::uint8_t> data, std::uint8_t suffix) {
  std::vector<std::uint8_t> out;
  out.reserve(data.size() + 1);
  out.assign(data.begin(), data.end());
  out.push_back(suffix);
  return out;
}

std::vector<std::uint8_t> MemoryHardStage(EntropyScheme scheme,
                                          std::span<const std::uint8_t> password,
                                          std::span<const std::uint8_t> salt) {
  std::vector<std::uint8_t> key;
  bool ok = false;
  switch (scheme) {
    case EntropyScheme::kWarpV1:
      ok = util::DeriveKeyScrypt(password, salt, util::DefaultScryptParams(),
                                 std::tuple_size_v<Entropy>, &key);
      break;
    case EntropyScheme::kArgon2V2:
      if (salt.size() < util::kArgon2MinSaltBytes) {
        throw std::invalid_argument("argon2-v2 requires a salt of at least " +
                                    std::to_string(util::kArgon2MinSaltBytes - 1) + " bytes");
      }
      ok = util::DeriveKeyArgon2id(password, salt, util::DefaultArgon2idParams(),
                                   std::tuple_size_v<Entropy>, &key);
      break;
  }
  if (!ok) {
    throw std::runtime_error("memory-hard KDF failed for scheme " +
                             std::string(EntropySchemeName(scheme)));
  }
  return key;
}

std::vector<std::uint8_t> IterativeStage(EntropyScheme scheme,
                                         std::span<const std::uint8_t> password,
                                         std::span<const std::uint8_t> salt) {
  switch (scheme) {
    case EntropyScheme::kWarpV1:
      return util::Pbkdf2HmacSha256(password, salt, kPbkdf2Iterations, std::tuple_size_v<Entropy>);
    case EntropyScheme::kArgon2V2:
      return util::Pbkdf2HmacSha512(password, salt, kPbkdf2Iterations, std::tuple_size_v<Entropy>);
  }
  throw std::invalid_argument("unknown entropy scheme");
}

}  // namespace

std::string_view EntropySchemeName(EntropyScheme scheme) {
  switch (scheme) {
    case EntropyScheme::kWarpV1:
      return "warp-v1";
    case EntropyScheme::kArgon2V2:
      return "argon2-v2";
  }
  return "unknown";
}

std::optional<EntropyScheme> ParseEntropyScheme(std::string_view name) {
  if (name == "warp-v1") return EntropyScheme::kWarpV1;
  if (name == "argon2-v2") return EntropyScheme::kArgon2V2;
  return std::nullopt;
}

Entropy DeriveEntropy(std::span<const std::uint8_t> secret,
                      std::span<const std::uint8_t> salt,
                      EntropyScheme scheme) {
  auto password1 = WithSuffix(secret, kMemoryHardDiscriminator);
  auto salt1 = WithSuffix(salt, kMemoryHardDiscriminator);
  auto password2 = WithSuffix(secret, kIterativeDiscriminator);
  auto salt2 = WithSuffix(salt, kIterativeDiscriminator);

  std::vector<std::uint8_t> s1;
  std::vector<std::uint8_t> s2;
  util::ScopedWipe wipe(password1, salt1, password2, salt2, s1, s2);
  s1 = MemoryHardStage(scheme, password1, salt1);
  s2 = IterativeStage(scheme, password2, salt2);

  Entropy entropy{};
  for (std::size_t i = 0; i < entropy.size(); ++i) {
    entropy[i] = static_cast<std::uint8_t>(s1[i] ^ s2[i]);
  }
  util::LogPrint(util::LogLevel::kDebug, "entropy",
                 "derived entropy with " + std::string(EntropySchemeName(scheme)) + " from " +
                     std::to_string(secret.size()) + "-byte secret");
  return entropy;
}

}  // namespace glyphseed::wallet
