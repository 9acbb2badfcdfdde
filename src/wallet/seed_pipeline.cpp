#include "wallet/seed_pipeline.hpp"

#include <exception>

#include "crypto/mnemonic.hpp"
#include "diagram/diagram_json.hpp"
#include "util/logging.hpp"
#include "util/secure_wipe.hpp"

namespace glyphseed::wallet {

namespace {

bool SetError(std::string* error, std::string message) {
  if (error) {
    *error = std::move(message);
  }
  return false;
}

}  // namespace

bool SeedPipeline::Deliver(std::span<const std::uint8_t> seed, std::string* error) {
  if (builder_ == nullptr) {
    return SetError(error, "no key tree builder configured");
  }
  std::string builder_error;
  if (!builder_->BuildMaster(seed, &builder_error)) {
    return SetError(error, builder_error.empty() ? "key tree builder rejected the seed"
                                                 : "key tree builder: " + builder_error);
  }
  return true;
}

bool SeedPipeline::FromDiagram(std::span<const std::uint8_t> encoded,
                               std::span<const std::uint8_t> salt,
                               EntropyScheme scheme,
                               std::string* error) {
  diagram::DiagramDocument document;
  diagram::DiagramError diagram_error = diagram::DiagramError::kNone;
  if (!diagram::DecodeDiagramDocument(encoded, &document, &diagram_error)) {
    return SetError(error, std::string("invalid diagram: ") +
                               diagram::DiagramErrorString(diagram_error));
  }
  Entropy entropy{};
  try {
    entropy = DeriveEntropy(encoded, salt, scheme);
  } catch (const std::exception& ex) {
    return SetError(error, std::string("entropy derivation failed: ") + ex.what());
  }
  util::LogPrint(util::LogLevel::kInfo, "seed",
                 "derived diagram entropy (" +
                     std::string(diagram::DiagramFormatName(document.format)) + ", " +
                     std::string(EntropySchemeName(scheme)) + ")");
  const bool ok = Deliver(entropy, error);
  util::SecureWipe(entropy);
  return ok;
}

bool SeedPipeline::FromMnemonic(std::string_view sentence,
                                const std::string& passphrase,
                                std::string* error) {
  auto words = crypto::SplitMnemonic(sentence);
  crypto::DecodedMnemonic decoded;
  crypto::MnemonicError mnemonic_error = crypto::MnemonicError::kNone;
  if (!crypto::DecodeMnemonic(words, &decoded, &mnemonic_error)) {
    util::SecureWipe(words);
    return SetError(error, std::string("invalid mnemonic: ") +
                               crypto::MnemonicErrorString(mnemonic_error));
  }
  std::string canonical = crypto::JoinMnemonic(words, decoded.language);
  auto seed = crypto::MnemonicSeedFromSentence(canonical, passphrase);
  util::LogPrint(util::LogLevel::kInfo, "seed",
                 "derived mnemonic seed (" + std::string(crypto::LanguageName(decoded.language)) +
                     ", " + std::to_string(words.size()) + " words)");

  const bool ok = Deliver(seed, error);
  util::SecureWipe(seed);
  util::SecureWipe(canonical);
  util::SecureWipe(decoded.entropy);
  util::SecureWipe(words);
  return ok;
}

}  // namespace glyphseed::wallet
