#include "crypto/mnemonic_language.hpp"

#include <cctype>
#include <initializer_list>
#include <string>

#include "util/utf8.hpp"

namespace glyphseed::crypto {

namespace {

ScriptCandidates Candidates(std::initializer_list<Language> languages) {
  ScriptCandidates out;
  for (const auto language : languages) {
    out.languages[out.count++] = language;
  }
  return out;
}

bool IsAscii(std::string_view word) {
  for (const char ch : word) {
    if (static_cast<unsigned char>(ch) >= 0x80) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string_view LanguageName(Language language) {
  switch (language) {
    case Language::kEnglish:
      return "english";
    case Language::kJapanese:
      return "japanese";
    case Language::kKorean:
      return "korean";
    case Language::kSpanish:
      return "spanish";
    case Language::kChineseSimplified:
      return "chinese_simplified";
    case Language::kChineseTraditional:
      return "chinese_traditional";
    case Language::kFrench:
      return "french";
    case Language::kItalian:
      return "italian";
    case Language::kCzech:
      return "czech";
    case Language::kPortuguese:
      return "portuguese";
  }
  return "unknown";
}

std::optional<Language> ParseLanguage(std::string_view name) {
  std::string lower;
  lower.reserve(name.size());
  for (const char c : name) {
    const char folded = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    lower.push_back(folded == '-' ? '_' : folded);
  }
  if (lower == "chinese") {
    return Language::kChineseSimplified;
  }
  for (const auto language : kAllLanguages) {
    if (lower == LanguageName(language)) {
      return language;
    }
  }
  return std::nullopt;
}

std::string_view WordSeparator(Language language) {
  return language == Language::kJapanese ? std::string_view("\xE3\x80\x80") : std::string_view(" ");
}

ScriptCandidates CandidateLanguagesForScript(std::string_view word) {
  std::u32string scalars;
  if (word.empty() || !util::DecodeUtf8(word, &scalars)) {
    return {};
  }
  const char32_t first = scalars.front();
  if (first >= 0x1100 && first <= 0x11FF) {
    return Candidates({Language::kKorean});
  }
  if (first >= 0x3040 && first <= 0x309F) {
    return Candidates({Language::kJapanese});
  }
  if (first >= 0x4E00 && first <= 0x9F9F) {
    return Candidates({Language::kChineseSimplified, Language::kChineseTraditional});
  }
  if (IsAscii(word)) {
    return Candidates({Language::kEnglish, Language::kItalian, Language::kCzech,
                       Language::kPortuguese, Language::kFrench, Language::kSpanish});
  }
  return Candidates({Language::kFrench, Language::kSpanish});
}

}  // namespace glyphseed::crypto
