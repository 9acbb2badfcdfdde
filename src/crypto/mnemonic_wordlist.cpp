#include "crypto/mnemonic_wordlist.hpp"

#include <array>
#include <fstream>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "crypto/mnemonic_wordlist_en.hpp"
#include "util/logging.hpp"

namespace glyphseed::crypto {

namespace {

struct WordlistSlot {
  std::shared_ptr<const std::vector<std::string>> words;
  std::once_flag index_once;
  std::unordered_map<std::string, std::uint16_t> index;
};

class WordlistRegistry {
 public:
  WordlistRegistry() {
    slots_[static_cast<std::size_t>(Language::kEnglish)].words =
        std::shared_ptr<const std::vector<std::string>>(&EnglishMnemonicWordlist(),
                                                        [](const std::vector<std::string>*) {});
  }

  bool Register(Language language, std::vector<std::string> words, std::string* error) {
    if (words.size() != kMnemonicWordlistSize) {
      return SetError(error, "wordlist for " + std::string(LanguageName(language)) +
                                 " must have 2048 words, got " + std::to_string(words.size()));
    }
    std::unordered_set<std::string_view> seen;
    seen.reserve(words.size());
    for (const auto& word : words) {
      if (word.empty() || !seen.insert(word).second) {
        return SetError(error, "wordlist for " + std::string(LanguageName(language)) +
                                   " has empty or duplicate entries");
      }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = SlotFor(language);
    if (slot.words) {
      return SetError(error, "wordlist for " + std::string(LanguageName(language)) +
                                 " is already registered");
    }
    slot.words = std::make_shared<const std::vector<std::string>>(std::move(words));
    util::LogPrint(util::LogLevel::kDebug, "mnemonic",
                   "registered wordlist " + std::string(LanguageName(language)));
    return true;
  }

  const std::vector<std::string>* Find(Language language) {
    std::lock_guard<std::mutex> lock(mutex_);
    return SlotFor(language).words.get();
  }

  std::optional<std::uint16_t> Index(Language language, std::string_view word) {
    auto& slot = SlotFor(language);
    const std::vector<std::string>* words = Find(language);
    if (words == nullptr) {
      return std::nullopt;
    }
    // Lists never change once present, so the first caller to get here may
    // build the map without holding the registry mutex.
    std::call_once(slot.index_once, [&] {
      slot.index.reserve(words->size());
      for (std::size_t i = 0; i < words->size(); ++i) {
        slot.index.emplace((*words)[i], static_cast<std::uint16_t>(i));
      }
    });
    const auto it = slot.index.find(std::string(word));
    if (it == slot.index.end()) {
      return std::nullopt;
    }
    return it->second;
  }

 private:
  static bool SetError(std::string* error, std::string message) {
    if (error) {
      *error = std::move(message);
    }
    return false;
  }

  WordlistSlot& SlotFor(Language language) {
    return slots_.at(static_cast<std::size_t>(language));
  }

  std::mutex mutex_;
  std::array<WordlistSlot, kAllLanguages.size()> slots_;
};

WordlistRegistry& Registry() {
  static WordlistRegistry registry;
  return registry;
}

}  // namespace

const std::vector<std::string>& EnglishMnemonicWordlist() {
  static const std::vector<std::string> wordlist = []() {
    std::vector<std::string> out;
    out.reserve(kEnglishMnemonicWordlistEn.size());
    for (const auto word : kEnglishMnemonicWordlistEn) {
      out.emplace_back(word);
    }
    return out;
  }();
  return wordlist;
}

bool RegisterWordlist(Language language, std::vector<std::string> words, std::string* error) {
  return Registry().Register(language, std::move(words), error);
}

bool LoadWordlistFile(Language language, const std::filesystem::path& path, std::string* error) {
  std::ifstream in(path);
  if (!in) {
    if (error) {
      *error = "failed to open wordlist: " + path.string();
    }
    return false;
  }
  std::vector<std::string> words;
  words.reserve(kMnemonicWordlistSize);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    words.push_back(line);
  }
  std::string register_error;
  if (!RegisterWordlist(language, std::move(words), &register_error)) {
    if (error) {
      *error = path.string() + ": " + register_error;
    }
    return false;
  }
  return true;
}

bool LoadWordlistDirectory(const std::filesystem::path& dir, std::string* error) {
  for (const auto language : kAllLanguages) {
    if (HasWordlist(language)) {
      continue;
    }
    const auto path = dir / (std::string(LanguageName(language)) + ".txt");
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      continue;
    }
    if (!LoadWordlistFile(language, path, error)) {
      return false;
    }
  }
  return true;
}

bool HasWordlist(Language language) { return Registry().Find(language) != nullptr; }

const std::vector<std::string>* FindWordlist(Language language) {
  return Registry().Find(language);
}

std::optional<std::uint16_t> WordIndex(Language language, std::string_view word) {
  return Registry().Index(language, word);
}

}  // namespace glyphseed::crypto
