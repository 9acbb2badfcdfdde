#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "crypto/mnemonic.hpp"
#include "crypto/mnemonic_language.hpp"
#include "crypto/mnemonic_wordlist.hpp"
#include "util/synthetic_wordlists.hpp"

using namespace glyphseed::crypto;
using glyphseed::test::SyntheticWordlist;

namespace {

std::vector<std::uint8_t> PatternEntropy(std::size_t bytes) {
  std::vector<std::uint8_t> entropy(bytes);
  for (std::size_t i = 0; i < bytes; ++i) {
    entropy[i] = static_cast<std::uint8_t>((i * 37 + 11) & 0xFF);
  }
  return entropy;
}

bool WriteWordlist(const std::filesystem::path& path, const std::vector<std::string>& words) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return false;
  }
  for (const auto& word : words) {
    out << word << '\n';
  }
  return static_cast<bool>(out);
}

bool TestNames() {
  for (const auto language : kAllLanguages) {
    if (ParseLanguage(LanguageName(language)) != language) {
      std::cerr << "name round trip failed for " << LanguageName(language) << "\n";
      return false;
    }
  }
  if (ParseLanguage("Chinese-Traditional") != Language::kChineseTraditional ||
      ParseLanguage("CHINESE") != Language::kChineseSimplified ||
      ParseLanguage("klingon").has_value()) {
    std::cerr << "ParseLanguage mismatch\n";
    return false;
  }
  if (WordSeparator(Language::kJapanese) != "\xE3\x80\x80" ||
      WordSeparator(Language::kKorean) != " ") {
    std::cerr << "WordSeparator mismatch\n";
    return false;
  }
  return true;
}

bool TestScriptCandidates() {
  const auto korean = CandidateLanguagesForScript("\xE1\x84\x80\xE1\x85\xA1");
  const auto japanese = CandidateLanguagesForScript("\xE3\x81\x82");
  const auto chinese = CandidateLanguagesForScript("\xE4\xB8\x80");
  const auto latin = CandidateLanguagesForScript("abandon");
  const auto accented = CandidateLanguagesForScript("\xC3\xA9tude");
  if (korean.count != 1 || korean.languages[0] != Language::kKorean || japanese.count != 1 ||
      japanese.languages[0] != Language::kJapanese || chinese.count != 2 ||
      chinese.languages[0] != Language::kChineseSimplified ||
      chinese.languages[1] != Language::kChineseTraditional || latin.count != 6 ||
      latin.languages[0] != Language::kEnglish || accented.count != 2) {
    std::cerr << "script candidates mismatch\n";
    return false;
  }
  if (CandidateLanguagesForScript("").count != 0 ||
      CandidateLanguagesForScript("\xFF\xFE").count != 0) {
    std::cerr << "malformed words produced candidates\n";
    return false;
  }
  return true;
}

bool TestRegistrationRejects() {
  std::string error;
  auto short_list = SyntheticWordlist(Language::kKorean);
  short_list.pop_back();
  if (RegisterWordlist(Language::kKorean, short_list, &error) || error.empty()) {
    std::cerr << "short wordlist accepted\n";
    return false;
  }
  auto duplicated = SyntheticWordlist(Language::kKorean);
  duplicated[7] = duplicated[3];
  if (RegisterWordlist(Language::kKorean, duplicated, &error)) {
    std::cerr << "wordlist with duplicates accepted\n";
    return false;
  }
  if (RegisterWordlist(Language::kEnglish, SyntheticWordlist(Language::kItalian), &error)) {
    std::cerr << "built-in English list replaced\n";
    return false;
  }
  if (HasWordlist(Language::kKorean) || !HasWordlist(Language::kEnglish)) {
    std::cerr << "registry state changed by rejected lists\n";
    return false;
  }
  return true;
}

bool TestLoadFromFiles() {
  const auto dir = std::filesystem::temp_directory_path() / "glyphseed_wordlist_tests";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir);

  std::string error;
  if (LoadWordlistFile(Language::kPortuguese, dir / "missing.txt", &error) || error.empty()) {
    std::cerr << "missing wordlist file accepted\n";
    return false;
  }
  if (!WriteWordlist(dir / "portuguese.txt", SyntheticWordlist(Language::kPortuguese)) ||
      !WriteWordlist(dir / "czech.txt", SyntheticWordlist(Language::kCzech))) {
    std::cerr << "failed to write wordlist files\n";
    return false;
  }
  if (!LoadWordlistFile(Language::kPortuguese, dir / "portuguese.txt", &error)) {
    std::cerr << "LoadWordlistFile failed: " << error << "\n";
    return false;
  }
  // portuguese.txt is skipped because the language already has a list.
  if (!LoadWordlistDirectory(dir, &error)) {
    std::cerr << "LoadWordlistDirectory failed: " << error << "\n";
    return false;
  }
  const bool ok = HasWordlist(Language::kCzech) && HasWordlist(Language::kPortuguese) &&
                  WordIndex(Language::kCzech, "czaab") == std::optional<std::uint16_t>(1) &&
                  !HasWordlist(Language::kItalian);
  std::filesystem::remove_all(dir, ec);
  if (!ok) {
    std::cerr << "wordlists loaded from files are not visible\n";
    return false;
  }
  return true;
}

bool RegisterRemaining() {
  for (const auto language : kAllLanguages) {
    if (HasWordlist(language)) {
      continue;
    }
    std::string error;
    if (!RegisterWordlist(language, SyntheticWordlist(language), &error)) {
      std::cerr << "register " << LanguageName(language) << " failed: " << error << "\n";
      return false;
    }
  }
  std::string error;
  if (RegisterWordlist(Language::kKorean, SyntheticWordlist(Language::kKorean), &error)) {
    std::cerr << "second registration accepted\n";
    return false;
  }
  return true;
}

bool TestRoundTrips() {
  for (const auto language : kAllLanguages) {
    for (std::size_t bytes = 16; bytes <= 32; bytes += 4) {
      const auto entropy = PatternEntropy(bytes);
      std::vector<std::string> words;
      MnemonicError error = MnemonicError::kNone;
      if (!EncodeMnemonic(entropy, language, &words, &error) ||
          words.size() != MnemonicWordCountForEntropy(bytes)) {
        std::cerr << LanguageName(language) << "/" << bytes
                  << ": encode failed: " << MnemonicErrorString(error) << "\n";
        return false;
      }
      const std::string sentence = JoinMnemonic(words, language);
      DecodedMnemonic decoded;
      if (!DecodeMnemonicSentence(sentence, &decoded, &error)) {
        std::cerr << LanguageName(language) << "/" << bytes
                  << ": decode failed: " << MnemonicErrorString(error) << "\n";
        return false;
      }
      if (decoded.language != language || decoded.entropy != entropy) {
        std::cerr << LanguageName(language) << "/" << bytes << ": decoded as "
                  << LanguageName(decoded.language) << "\n";
        return false;
      }
    }
  }
  return true;
}

bool TestJapaneseSeparator() {
  std::vector<std::string> words;
  if (!EncodeMnemonic(PatternEntropy(16), Language::kJapanese, &words)) {
    std::cerr << "japanese encode failed\n";
    return false;
  }
  const std::string sentence = JoinMnemonic(words, Language::kJapanese);
  if (sentence.find(' ') != std::string::npos ||
      sentence.find("\xE3\x80\x80") == std::string::npos || SplitMnemonic(sentence) != words) {
    std::cerr << "japanese sentence not joined with ideographic spaces\n";
    return false;
  }
  return true;
}

bool TestOverlaps() {
  const std::vector<std::uint8_t> zeros(16, 0);
  MnemonicError error = MnemonicError::kNone;

  // Every index is below 1024, where both Chinese lists agree.
  std::vector<std::string> words;
  if (!EncodeMnemonic(zeros, Language::kChineseTraditional, &words)) {
    std::cerr << "chinese encode failed\n";
    return false;
  }
  DecodedMnemonic decoded;
  if (!DecodeMnemonic(words, &decoded, &error) ||
      decoded.language != Language::kChineseSimplified || decoded.entropy != zeros) {
    std::cerr << "chinese overlap did not resolve to simplified\n";
    return false;
  }

  if (!EncodeMnemonic(zeros, Language::kFrench, &words)) {
    std::cerr << "french encode failed\n";
    return false;
  }
  if (DecodeMnemonic(words, &decoded, &error) || error != MnemonicError::kAmbiguousLanguage) {
    std::cerr << "french/spanish overlap was not reported as ambiguous\n";
    return false;
  }
  if (!DecodeMnemonicInLanguage(words, Language::kSpanish, &decoded, &error) ||
      decoded.language != Language::kSpanish || decoded.entropy != zeros) {
    std::cerr << "explicit spanish decode failed\n";
    return false;
  }

  const std::vector<Language> pair = {Language::kChineseTraditional,
                                      Language::kChineseSimplified};
  const std::vector<Language> other = {Language::kFrench, Language::kSpanish};
  if (ResolveChineseScriptOverlap(pair) != Language::kChineseSimplified ||
      ResolveChineseScriptOverlap(other).has_value()) {
    std::cerr << "ResolveChineseScriptOverlap mismatch\n";
    return false;
  }
  return true;
}

bool TestMixedLanguages() {
  std::vector<std::string> italian;
  std::vector<std::string> czech;
  if (!EncodeMnemonic(PatternEntropy(16), Language::kItalian, &italian) ||
      !EncodeMnemonic(PatternEntropy(16), Language::kCzech, &czech)) {
    std::cerr << "encode failed\n";
    return false;
  }
  auto mixed = italian;
  mixed[5] = czech[5];
  DecodedMnemonic decoded;
  MnemonicError error = MnemonicError::kNone;
  if (DecodeMnemonic(mixed, &decoded, &error) || error != MnemonicError::kUnknownWord) {
    std::cerr << "mixed-language mnemonic not rejected\n";
    return false;
  }
  if (DecodeMnemonicInLanguage(italian, Language::kCzech, &decoded, &error) ||
      error != MnemonicError::kInvalidLanguage) {
    std::cerr << "decode in the wrong language not rejected\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!TestNames() || !TestScriptCandidates() || !TestRegistrationRejects() ||
      !TestLoadFromFiles() || !RegisterRemaining() || !TestRoundTrips() ||
      !TestJapaneseSeparator() || !TestOverlaps() || !TestMixedLanguages()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
