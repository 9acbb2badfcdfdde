#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/mnemonic_language.hpp"

namespace glyphseed::crypto {

constexpr std::size_t kMnemonicWordlistSize = 2048;

// The canonical English list; valid for the lifetime of the process.
const std::vector<std::string>& EnglishMnemonicWordlist();

// Installs the wordlist for `language`. English is built in. A list must
// have exactly 2048 distinct, non-empty, NFKD-normalized words and can be
// registered only once; it is immutable afterwards.
bool RegisterWordlist(Language language, std::vector<std::string> words,
                      std::string* error = nullptr);

// One word per line; blank lines and a trailing newline are ignored.
bool LoadWordlistFile(Language language, const std::filesystem::path& path,
                      std::string* error = nullptr);

// Loads "<LanguageName>.txt" for every language that has no list yet and
// whose file exists in `dir`. Returns false on the first malformed file.
bool LoadWordlistDirectory(const std::filesystem::path& dir, std::string* error = nullptr);

bool HasWordlist(Language language);

// nullptr when the language has no registered list.
const std::vector<std::string>* FindWordlist(Language language);

// Position of `word` in the language's list. Index maps are built on first
// use, once per language.
std::optional<std::uint16_t> WordIndex(Language language, std::string_view word);

}  // namespace glyphseed::crypto
