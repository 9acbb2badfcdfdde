#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace glyphseed::crypto {

// Mnemonic languages, numbered in BIP-85 order.
enum class Language : std::uint8_t {
  kEnglish = 0,
  kJapanese = 1,
  kKorean = 2,
  kSpanish = 3,
  kChineseSimplified = 4,
  kChineseTraditional = 5,
  kFrench = 6,
  kItalian = 7,
  kCzech = 8,
  kPortuguese = 9,
};

inline constexpr std::array<Language, 10> kAllLanguages = {
    Language::kEnglish,           Language::kJapanese, Language::kKorean,
    Language::kSpanish,           Language::kChineseSimplified,
    Language::kChineseTraditional, Language::kFrench,  Language::kItalian,
    Language::kCzech,             Language::kPortuguese,
};

// Lowercase identifier, e.g. "chinese_simplified". Also the wordlist file
// stem used by LoadWordlistDirectory.
std::string_view LanguageName(Language language);

// Case-insensitive; accepts the names above and "chinese" for Simplified.
std::optional<Language> ParseLanguage(std::string_view name);

// Separator placed between words of a sentence: U+3000 for Japanese, an
// ASCII space otherwise.
std::string_view WordSeparator(Language language);

// Languages whose script matches the first scalar of `word`, before any
// wordlist lookup.
struct ScriptCandidates {
  std::array<Language, 10> languages{};
  std::size_t count{0};
};
ScriptCandidates CandidateLanguagesForScript(std::string_view word);

}  // namespace glyphseed::crypto
