#include "crypto/mnemonic.hpp"

#include <algorithm>

#include "crypto/hash.hpp"
#include "crypto/mnemonic_wordlist.hpp"
#include "util/bits.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/pbkdf2.hpp"
#include "util/secure_wipe.hpp"

namespace glyphseed::crypto {

namespace {

constexpr unsigned kBitsPerWord = 11;

bool Fail(MnemonicError* error, MnemonicError kind) {
  if (error) {
    *error = kind;
  }
  return false;
}

std::uint8_t ChecksumMask(std::size_t words) {
  return static_cast<std::uint8_t>(0xFFu << (8 - words / 3));
}

bool IsSeparatorAt(std::string_view text, std::size_t pos, std::size_t* width) {
  const char ch = text[pos];
  if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v') {
    *width = 1;
    return true;
  }
  if (text.substr(pos, 3) == "\xE3\x80\x80") {
    *width = 3;
    return true;
  }
  return false;
}

// Rebuilds entropy from word indices; false when the embedded checksum does
// not match.
bool EntropyFromIndices(std::span<const std::uint16_t> indices,
                        std::vector<std::uint8_t>* entropy) {
  auto packed = util::JoinBitChunks(indices, kBitsPerWord);
  const std::uint8_t checksum = packed.back();
  packed.pop_back();
  const std::uint8_t expected = Sha256(packed)[0] & ChecksumMask(indices.size());
  if (checksum != expected) {
    util::SecureWipe(packed);
    return false;
  }
  *entropy = std::move(packed);
  return true;
}

bool LookupIndices(std::span<const std::string> words,
                   Language language,
                   std::vector<std::uint16_t>* indices) {
  std::vector<std::uint16_t> out;
  out.reserve(words.size());
  for (const auto& word : words) {
    const auto index = WordIndex(language, word);
    if (!index) {
      return false;
    }
    out.push_back(*index);
  }
  *indices = std::move(out);
  return true;
}

}  // namespace

const char* MnemonicErrorString(MnemonicError error) {
  switch (error) {
    case MnemonicError::kNone:
      return "no error";
    case MnemonicError::kInvalidSize:
      return "mnemonic must have 12, 15, 18, 21 or 24 words";
    case MnemonicError::kUnknownWord:
      return "mnemonic contains a word not in any wordlist";
    case MnemonicError::kInvalidChecksum:
      return "mnemonic checksum mismatch";
    case MnemonicError::kAmbiguousLanguage:
      return "mnemonic is valid in more than one language";
    case MnemonicError::kInvalidLanguage:
      return "mnemonic contains a word not in the requested language";
    case MnemonicError::kWordlistUnavailable:
      return "wordlist for the language is not loaded";
  }
  return "unknown mnemonic error";
}

std::size_t MnemonicWordCountForEntropy(std::size_t entropy_bytes) {
  switch (entropy_bytes) {
    case 16:
    case 20:
    case 24:
    case 28:
    case 32:
      // 8 bits per byte plus one checksum bit per 4 bytes.
      return (entropy_bytes * 8 + entropy_bytes / 4) / kBitsPerWord;
    default:
      return 0;
  }
}

bool IsValidMnemonicWordCount(std::size_t words) {
  return words >= 12 && words <= 24 && words % 3 == 0;
}

bool EncodeMnemonic(std::span<const std::uint8_t> entropy,
                    Language language,
                    std::vector<std::string>* words,
                    MnemonicError* error) {
  const std::size_t word_count = MnemonicWordCountForEntropy(entropy.size());
  if (word_count == 0) {
    return Fail(error, MnemonicError::kInvalidSize);
  }
  const auto* wordlist = FindWordlist(language);
  if (wordlist == nullptr) {
    return Fail(error, MnemonicError::kWordlistUnavailable);
  }
  std::vector<std::uint8_t> data(entropy.begin(), entropy.end());
  data.push_back(Sha256(entropy)[0] & ChecksumMask(word_count));
  auto indices = util::ChunkBits(data, kBitsPerWord);
  util::SecureWipe(data);

  std::vector<std::string> out;
  out.reserve(word_count);
  for (std::size_t i = 0; i < word_count; ++i) {
    out.push_back((*wordlist)[indices[i]]);
  }
  std::fill(indices.begin(), indices.end(), 0);
  *words = std::move(out);
  return true;
}

std::string JoinMnemonic(std::span<const std::string> words, Language language) {
  const auto separator = WordSeparator(language);
  std::string out;
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      out.append(separator);
    }
    out.append(words[i]);
  }
  return out;
}

std::vector<std::string> SplitMnemonic(std::string_view sentence) {
  std::vector<std::string> words;
  std::string current;
  std::size_t pos = 0;
  while (pos < sentence.size()) {
    std::size_t width = 0;
    if (IsSeparatorAt(sentence, pos, &width)) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
      pos += width;
      continue;
    }
    const char ch = sentence[pos++];
    current.push_back(ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch - 'A' + 'a') : ch);
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

std::optional<Language> ResolveChineseScriptOverlap(std::span<const Language> survivors) {
  if (survivors.size() != 2) {
    return std::nullopt;
  }
  const bool has_simplified =
      std::find(survivors.begin(), survivors.end(), Language::kChineseSimplified) !=
      survivors.end();
  const bool has_traditional =
      std::find(survivors.begin(), survivors.end(), Language::kChineseTraditional) !=
      survivors.end();
  if (has_simplified && has_traditional) {
    return Language::kChineseSimplified;
  }
  return std::nullopt;
}

bool DecodeMnemonic(std::span<const std::string> words,
                    DecodedMnemonic* out,
                    MnemonicError* error) {
  if (!IsValidMnemonicWordCount(words.size())) {
    return Fail(error, MnemonicError::kInvalidSize);
  }

  // Intersect, word by word, the languages whose list holds the word.
  std::vector<Language> candidates(kAllLanguages.begin(), kAllLanguages.end());
  for (const auto& word : words) {
    const ScriptCandidates script = CandidateLanguagesForScript(word);
    std::vector<Language> matched;
    bool any_available = false;
    for (std::size_t i = 0; i < script.count; ++i) {
      const Language language = script.languages[i];
      if (!HasWordlist(language)) {
        continue;
      }
      any_available = true;
      if (std::find(candidates.begin(), candidates.end(), language) != candidates.end() &&
          WordIndex(language, word)) {
        matched.push_back(language);
      }
    }
    if (!any_available) {
      return Fail(error, script.count == 0 ? MnemonicError::kUnknownWord
                                           : MnemonicError::kWordlistUnavailable);
    }
    if (matched.empty()) {
      return Fail(error, MnemonicError::kUnknownWord);
    }
    candidates = std::move(matched);
  }

  std::vector<Language> survivors;
  std::vector<std::vector<std::uint8_t>> entropies;
  for (const auto language : candidates) {
    std::vector<std::uint16_t> indices;
    std::vector<std::uint8_t> entropy;
    if (LookupIndices(words, language, &indices) && EntropyFromIndices(indices, &entropy)) {
      survivors.push_back(language);
      entropies.push_back(std::move(entropy));
    }
  }

  std::optional<std::size_t> chosen;
  MnemonicError failure = MnemonicError::kNone;
  if (survivors.size() == 1) {
    chosen = std::size_t{0};
  } else if (survivors.empty()) {
    failure = MnemonicError::kInvalidChecksum;
  } else if (const auto resolved = ResolveChineseScriptOverlap(survivors)) {
    chosen = static_cast<std::size_t>(
        std::find(survivors.begin(), survivors.end(), *resolved) - survivors.begin());
  } else {
    failure = MnemonicError::kAmbiguousLanguage;
  }

  if (chosen) {
    out->entropy = std::move(entropies[*chosen]);
    out->language = survivors[*chosen];
  }
  for (auto& entropy : entropies) {
    util::SecureWipe(entropy);
  }
  if (!chosen) {
    util::LogPrint(util::LogLevel::kDebug, "mnemonic",
                   std::string("decode failed: ") + MnemonicErrorString(failure));
    return Fail(error, failure);
  }
  return true;
}

bool DecodeMnemonicInLanguage(std::span<const std::string> words,
                              Language language,
                              DecodedMnemonic* out,
                              MnemonicError* error) {
  if (!IsValidMnemonicWordCount(words.size())) {
    return Fail(error, MnemonicError::kInvalidSize);
  }
  if (!HasWordlist(language)) {
    return Fail(error, MnemonicError::kWordlistUnavailable);
  }
  std::vector<std::uint16_t> indices;
  if (!LookupIndices(words, language, &indices)) {
    return Fail(error, MnemonicError::kInvalidLanguage);
  }
  std::vector<std::uint8_t> entropy;
  if (!EntropyFromIndices(indices, &entropy)) {
    return Fail(error, MnemonicError::kInvalidChecksum);
  }
  out->entropy = std::move(entropy);
  out->language = language;
  return true;
}

bool DecodeMnemonicSentence(std::string_view sentence,
                            DecodedMnemonic* out,
                            MnemonicError* error) {
  const auto words = SplitMnemonic(sentence);
  return DecodeMnemonic(words, out, error);
}

std::array<std::uint8_t, 64> MnemonicSeedFromSentence(const std::string& mnemonic_sentence,
                                                      const std::string& passphrase) {
  // salt = "mnemonic" + passphrase (UTF-8, no NUL terminator).
  std::string salt = "mnemonic";
  salt.append(passphrase);

  auto seed_vec = util::Pbkdf2HmacSha512(util::AsBytes(mnemonic_sentence), util::AsBytes(salt),
                                         2048u, 64u);

  std::array<std::uint8_t, 64> seed{};
  std::copy_n(seed_vec.begin(), seed.size(), seed.begin());
  util::SecureWipe(seed_vec);
  util::SecureWipe(salt);
  return seed;
}

}  // namespace glyphseed::crypto
