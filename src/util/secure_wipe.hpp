#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <tuple>
#include <vector>

namespace glyphseed::util {

// Zeroes `size` bytes with OPENSSL_cleanse.
void SecureWipe(void* data, std::size_t size) noexcept;

inline void SecureWipe(std::span<std::uint8_t> data) noexcept {
  SecureWipe(data.data(), data.size());
}

// Containers are zeroed, then their storage is released.
inline void SecureWipe(std::vector<std::uint8_t>& data) noexcept {
  SecureWipe(data.data(), data.size());
  std::vector<std::uint8_t>().swap(data);
}

inline void SecureWipe(std::string& data) noexcept {
  SecureWipe(data.data(), data.size());
  std::string().swap(data);
}

void SecureWipe(std::vector<std::string>& words) noexcept;

template <typename T, std::size_t N>
inline void SecureWipe(std::array<T, N>& data) noexcept {
  SecureWipe(data.data(), data.size() * sizeof(T));
}

// Wipes every referenced buffer when the scope exits, by return or by throw.
template <typename... Buffers>
class ScopedWipe {
 public:
  explicit ScopedWipe(Buffers&... buffers) : buffers_(buffers...) {}
  ~ScopedWipe() {
    std::apply([](auto&... buffer) { (SecureWipe(buffer), ...); }, buffers_);
  }

  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

 private:
  std::tuple<Buffers&...> buffers_;
};

}  // namespace glyphseed::util
