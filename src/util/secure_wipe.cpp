#include "util/secure_wipe.hpp"

#include <openssl/crypto.h>

namespace glyphseed::util {

void SecureWipe(void* data, std::size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }
  OPENSSL_cleanse(data, size);
}

void SecureWipe(std::vector<std::string>& words) noexcept {
  for (auto& word : words) {
    SecureWipe(word);
  }
  std::vector<std::string>().swap(words);
}

}  // namespace glyphseed::util
