#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "util/argon2_kdf.hpp"
#include "util/hex.hpp"
#include "util/pbkdf2.hpp"
#include "util/scrypt_kdf.hpp"

using glyphseed::util::AsBytes;
using glyphseed::util::HexEncode;

namespace {

bool ExpectHex(const std::string& actual, const std::string& expected, const char* label) {
  if (actual != expected) {
    std::cerr << label << ":\n  got      " << actual << "\n  expected " << expected << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  using namespace glyphseed;
  try {
    if (!ExpectHex(HexEncode(crypto::Sha256(AsBytes("abc"))),
                   "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256") ||
        !ExpectHex(HexEncode(crypto::Sha512(AsBytes("abc"))),
                   "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
                   "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f",
                   "sha512")) {
      return EXIT_FAILURE;
    }

    // RFC 4231 test cases 2 and 6.
    if (!ExpectHex(HexEncode(crypto::HmacSha256(AsBytes("Jefe"),
                                                AsBytes("what do ya want for nothing?"))),
                   "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
                   "hmac-sha256") ||
        !ExpectHex(HexEncode(crypto::HmacSha512(AsBytes("Jefe"),
                                                AsBytes("what do ya want for nothing?"))),
                   "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554"
                   "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737",
                   "hmac-sha512")) {
      return EXIT_FAILURE;
    }
    const std::vector<std::uint8_t> long_key(131, 0xAA);
    if (!ExpectHex(HexEncode(crypto::HmacSha256(
                       long_key, AsBytes("Test Using Larger Than Block-Size Key - Hash Key First"))),
                   "60e431591ee0b67f0d8a26aacbf5b77f8e0bc6213728c5140546040f0ee37f54",
                   "hmac-sha256 long key")) {
      return EXIT_FAILURE;
    }

    // RFC 7914 section 11 and common PBKDF2 vectors.
    if (!ExpectHex(HexEncode(util::Pbkdf2HmacSha256(AsBytes("passwd"), AsBytes("salt"), 1, 64)),
                   "55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc"
                   "49ca9cccf179b645991664b39d77ef317c71b845b1e30bd509112041d3a19783",
                   "pbkdf2-sha256 c=1") ||
        !ExpectHex(HexEncode(util::Pbkdf2HmacSha256(AsBytes("password"), AsBytes("salt"), 4096,
                                                    32)),
                   "c5e478d59288c841aa530db6845c4c8d962893a001ce4e11a4963873aa98134a",
                   "pbkdf2-sha256 c=4096") ||
        !ExpectHex(HexEncode(util::Pbkdf2HmacSha512(AsBytes("password"), AsBytes("salt"), 2, 64)),
                   "e1d9c16aa681708a45f5c7c4e215ceb66e011a2e9f0040713f18aefdb866d53c"
                   "f76cab2868a39b9f7840edce4fef5a82be67335c77a6068e04112754f27ccf4e",
                   "pbkdf2-sha512 c=2")) {
      return EXIT_FAILURE;
    }
    bool threw = false;
    try {
      (void)util::Pbkdf2HmacSha512(AsBytes("p"), AsBytes("s"), 0, 32);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "PBKDF2 accepted zero iterations\n";
      return EXIT_FAILURE;
    }

    util::ScryptParams scrypt_params{1024, 8, 16, 64ull * 1024 * 1024};
    std::vector<std::uint8_t> scrypt_key;
    if (!util::DeriveKeyScrypt(AsBytes("password"), AsBytes("NaCl"), scrypt_params, 64,
                               &scrypt_key) ||
        !ExpectHex(HexEncode(scrypt_key),
                   "fdbabe1c9d3472007856e7190d01e9fe7c6ad7cbc8237830e77376634b373162"
                   "2eaf30d92e22a3886ff109279d9830dac727afb94a83ee6d8360cbdfa2cc0640",
                   "scrypt N=1024")) {
      return EXIT_FAILURE;
    }
    util::ScryptParams bad_params{1000, 8, 1, 64ull * 1024 * 1024};  // N not a power of two
    if (util::DeriveKeyScrypt(AsBytes("password"), AsBytes("NaCl"), bad_params, 32,
                              &scrypt_key) ||
        !scrypt_key.empty()) {
      std::cerr << "scrypt accepted N=1000\n";
      return EXIT_FAILURE;
    }

    util::Argon2idParams argon_params{1, 1024, 1};
    std::vector<std::uint8_t> a1;
    std::vector<std::uint8_t> a2;
    if (!util::DeriveKeyArgon2id(AsBytes("secret"), AsBytes("saltsalt"), argon_params, 32, &a1) ||
        !util::DeriveKeyArgon2id(AsBytes("secret"), AsBytes("saltsalt"), argon_params, 32, &a2) ||
        a1 != a2 || a1.size() != 32) {
      std::cerr << "argon2id is not deterministic\n";
      return EXIT_FAILURE;
    }
    if (util::DeriveKeyArgon2id(AsBytes("secret"), AsBytes("short"), argon_params, 32, &a1) ||
        !a1.empty()) {
      std::cerr << "argon2id accepted a 5-byte salt\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "kdf_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
