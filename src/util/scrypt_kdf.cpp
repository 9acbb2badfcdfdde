#include "util/scrypt_kdf.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include "util/logging.hpp"

namespace glyphseed::util {

ScryptParams DefaultScryptParams() {
  ScryptParams params;
  params.n = 1ull << 18;
  params.r = 8;
  params.p = 1;
  // 128 * r * N is 256 MiB; leave headroom for OpenSSL's B buffer.
  params.max_mem_bytes = 512ull * 1024 * 1024;
  return params;
}

bool DeriveKeyScrypt(std::span<const std::uint8_t> password,
                     std::span<const std::uint8_t> salt,
                     const ScryptParams& params,
                     std::size_t key_len,
                     std::vector<std::uint8_t>* key_out) {
  if (!key_out) return false;
  std::vector<std::uint8_t> key(key_len, 0);
  const int rc = EVP_PBE_scrypt(reinterpret_cast<const char*>(password.data()),
                                password.size(),
                                salt.data(), salt.size(),
                                params.n, params.r, params.p, params.max_mem_bytes,
                                key.data(), key.size());
  if (rc != 1) {
    char reason[256] = {0};
    ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
    LogPrint(LogLevel::kWarn, "kdf", std::string("scrypt failed: ") + reason);
    key_out->clear();
    return false;
  }
  *key_out = std::move(key);
  return true;
}

}  // namespace glyphseed::util
