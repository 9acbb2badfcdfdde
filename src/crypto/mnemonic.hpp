#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/mnemonic_language.hpp"

namespace glyphseed::crypto {

enum class MnemonicError {
  kNone = 0,
  kInvalidSize,
  kUnknownWord,
  kInvalidChecksum,
  kAmbiguousLanguage,
  kInvalidLanguage,
  kWordlistUnavailable,
};

const char* MnemonicErrorString(MnemonicError error);

// 12/15/18/21/24 words for 16/20/24/28/32 bytes of entropy; 0 for any other
// entropy length.
std::size_t MnemonicWordCountForEntropy(std::size_t entropy_bytes);
bool IsValidMnemonicWordCount(std::size_t words);

// Entropy followed by the top (words / 3) bits of SHA-256(entropy), split
// into 11-bit word indices.
bool EncodeMnemonic(std::span<const std::uint8_t> entropy,
                    Language language,
                    std::vector<std::string>* words,
                    MnemonicError* error = nullptr);

std::string JoinMnemonic(std::span<const std::string> words, Language language);

// Splits on ASCII whitespace and U+3000, folding ASCII letters to lowercase.
std::vector<std::string> SplitMnemonic(std::string_view sentence);

struct DecodedMnemonic {
  std::vector<std::uint8_t> entropy;
  Language language{Language::kEnglish};
};

// Detects the language from the words and their checksum. Fails with
// kAmbiguousLanguage when more than one language validates, except that a
// Simplified/Traditional Chinese tie resolves to Simplified.
bool DecodeMnemonic(std::span<const std::string> words,
                    DecodedMnemonic* out,
                    MnemonicError* error = nullptr);

// Decodes against a single known language; kInvalidLanguage when a word is
// not in that list.
bool DecodeMnemonicInLanguage(std::span<const std::string> words,
                              Language language,
                              DecodedMnemonic* out,
                              MnemonicError* error = nullptr);

bool DecodeMnemonicSentence(std::string_view sentence,
                            DecodedMnemonic* out,
                            MnemonicError* error = nullptr);

// The two Chinese lists share characters, so a checksum can validate under
// both. Returns Simplified when `survivors` is exactly that pair.
std::optional<Language> ResolveChineseScriptOverlap(std::span<const Language> survivors);

// Compute the 64-byte mnemonic seed from a sentence and optional passphrase
// using PBKDF2-HMAC-SHA512 with 2048 iterations:
//   seed = PBKDF2(sentence, "mnemonic" + passphrase, 2048, 64)
// Neither input is normalized; callers pass words joined the way
// JoinMnemonic does.
std::array<std::uint8_t, 64> MnemonicSeedFromSentence(const std::string& mnemonic_sentence,
                                                      const std::string& passphrase);

}  // namespace glyphseed::crypto
