#include "util/argon2_kdf.hpp"

#include <argon2.h>

#include "util/logging.hpp"

namespace glyphseed::util {

Argon2idParams DefaultArgon2idParams() {
  Argon2idParams params;
  params.t_cost = 3;
  params.m_cost_kib = 64 * 1024;  // 64 MiB
  params.parallelism = 1;
  return params;
}

bool DeriveKeyArgon2id(std::span<const std::uint8_t> password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::size_t key_len,
                       std::vector<std::uint8_t>* key_out) {
  if (!key_out) return false;
  std::vector<std::uint8_t> key(key_len, 0);

  const int rc = argon2id_hash_raw(
      params.t_cost,
      params.m_cost_kib,
      params.parallelism,
      password.data(), password.size(),
      salt.data(), salt.size(),
      key.data(), key.size());
  if (rc != ARGON2_OK) {
    LogPrint(LogLevel::kWarn, "kdf",
             std::string("argon2id failed: ") + argon2_error_message(rc));
    key_out->clear();
    return false;
  }
  *key_out = std::move(key);
  return true;
}

}  // namespace glyphseed::util
