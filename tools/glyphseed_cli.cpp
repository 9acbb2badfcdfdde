#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/cli_options.hpp"
#include "crypto/mnemonic.hpp"
#include "crypto/mnemonic_wordlist.hpp"
#include "diagram/diagram_json.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/secure_wipe.hpp"
#include "wallet/entropy.hpp"

namespace {

using glyphseed::config::CliOptions;
using glyphseed::config::CliUsageError;

void PrintUsage() {
  std::cout
      << "Usage: glyphseed [options] <command> [args]\n"
      << "Commands:\n"
      << "  encode --diagram <file.json> [--format simple|complex|animate]\n"
      << "  decode <hex>\n"
      << "  entropy (--diagram <file.json> | <hex>) [--salt <text>]\n"
      << "  mnemonic-encode <entropy-hex>\n"
      << "  mnemonic-decode <words...>\n"
      << "Options:\n"
      << "  --conf <path>            config file (default ./glyphseed.conf)\n"
      << "  --no-conf                skip the config file\n"
      << "  --debug-log <path>       write a debug log\n"
      << "  --log-level <level>      debug|info|warn|error (default info)\n"
      << "  --log-max-size-mb <n>    rotate the debug log at n MiB (default 10)\n"
      << "  --log-max-files <n>      rotated logs to keep (default 5)\n"
      << "  --language <name>        mnemonic language (default english)\n"
      << "  --scheme <name>          warp-v1|argon2-v2 (default warp-v1)\n"
      << "  --wordlist-dir <dir>     directory with <language>.txt wordlists\n";
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open " + path);
  }
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::vector<std::uint8_t> EncodeDiagramFile(const CliOptions& opts) {
  if (opts.diagram_path.empty()) {
    throw CliUsageError("--diagram <file.json> is required");
  }
  std::optional<glyphseed::diagram::DiagramFormat> format;
  if (!opts.format.empty()) {
    format = glyphseed::diagram::ParseDiagramFormat(opts.format);
    if (!format) {
      throw CliUsageError("unknown diagram format: " + opts.format);
    }
  }
  glyphseed::diagram::DiagramDocument document;
  std::string error;
  if (!glyphseed::diagram::ParseDiagramDocument(ReadFile(opts.diagram_path), format, &document,
                                                &error)) {
    throw std::runtime_error(opts.diagram_path + ": " + error);
  }
  std::vector<std::uint8_t> secret;
  glyphseed::diagram::DiagramError diagram_error = glyphseed::diagram::DiagramError::kNone;
  if (!glyphseed::diagram::EncodeDiagramDocument(document, &secret, &diagram_error)) {
    throw std::runtime_error(std::string("encode failed: ") +
                             glyphseed::diagram::DiagramErrorString(diagram_error));
  }
  return secret;
}

std::vector<std::uint8_t> RequireHexArg(const CliOptions& opts, const char* what) {
  if (opts.args.size() != 1) {
    throw CliUsageError(std::string("expected one ") + what + " argument");
  }
  std::vector<std::uint8_t> bytes;
  if (!glyphseed::util::HexDecode(opts.args[0], &bytes)) {
    throw std::runtime_error(std::string("invalid ") + what + " hex");
  }
  return bytes;
}

int RunEncode(const CliOptions& opts) {
  const auto secret = EncodeDiagramFile(opts);
  std::cout << glyphseed::util::HexEncode(secret) << '\n';
  return EXIT_SUCCESS;
}

int RunDecode(const CliOptions& opts) {
  const auto secret = RequireHexArg(opts, "encoded diagram");
  glyphseed::diagram::DiagramDocument document;
  glyphseed::diagram::DiagramError error = glyphseed::diagram::DiagramError::kNone;
  if (!glyphseed::diagram::DecodeDiagramDocument(secret, &document, &error)) {
    throw std::runtime_error(std::string("decode failed: ") +
                             glyphseed::diagram::DiagramErrorString(error));
  }
  std::cout << glyphseed::diagram::DiagramDocumentToJson(document).dump(2) << '\n';
  return EXIT_SUCCESS;
}

int RunEntropy(const CliOptions& opts) {
  std::vector<std::uint8_t> secret;
  if (!opts.diagram_path.empty()) {
    secret = EncodeDiagramFile(opts);
  } else {
    secret = RequireHexArg(opts, "encoded diagram");
    glyphseed::diagram::DiagramDocument document;
    glyphseed::diagram::DiagramError error = glyphseed::diagram::DiagramError::kNone;
    if (!glyphseed::diagram::DecodeDiagramDocument(secret, &document, &error)) {
      throw std::runtime_error(std::string("invalid diagram: ") +
                               glyphseed::diagram::DiagramErrorString(error));
    }
  }
  const auto scheme = glyphseed::wallet::ParseEntropyScheme(opts.scheme);
  auto entropy = glyphseed::wallet::DeriveEntropy(secret, glyphseed::util::AsBytes(opts.salt),
                                                  *scheme);
  std::cout << glyphseed::util::HexEncode(entropy) << '\n';
  glyphseed::util::SecureWipe(entropy);
  glyphseed::util::SecureWipe(secret);
  return EXIT_SUCCESS;
}

int RunMnemonicEncode(const CliOptions& opts) {
  auto entropy = RequireHexArg(opts, "entropy");
  const auto language = glyphseed::crypto::ParseLanguage(opts.language);
  std::vector<std::string> words;
  glyphseed::crypto::MnemonicError error = glyphseed::crypto::MnemonicError::kNone;
  const bool ok = glyphseed::crypto::EncodeMnemonic(entropy, *language, &words, &error);
  glyphseed::util::SecureWipe(entropy);
  if (!ok) {
    throw std::runtime_error(std::string("mnemonic-encode failed: ") +
                             glyphseed::crypto::MnemonicErrorString(error));
  }
  std::cout << glyphseed::crypto::JoinMnemonic(words, *language) << '\n';
  return EXIT_SUCCESS;
}

int RunMnemonicDecode(const CliOptions& opts) {
  if (opts.args.empty()) {
    throw CliUsageError("expected mnemonic words");
  }
  std::string sentence;
  for (const auto& arg : opts.args) {
    if (!sentence.empty()) sentence.push_back(' ');
    sentence.append(arg);
  }
  glyphseed::crypto::DecodedMnemonic decoded;
  glyphseed::crypto::MnemonicError error = glyphseed::crypto::MnemonicError::kNone;
  const bool ok = glyphseed::crypto::DecodeMnemonicSentence(sentence, &decoded, &error);
  glyphseed::util::SecureWipe(sentence);
  if (!ok) {
    throw std::runtime_error(std::string("mnemonic-decode failed: ") +
                             glyphseed::crypto::MnemonicErrorString(error));
  }
  std::cout << glyphseed::util::HexEncode(decoded.entropy) << '\n'
            << glyphseed::crypto::LanguageName(decoded.language) << '\n';
  glyphseed::util::SecureWipe(decoded.entropy);
  return EXIT_SUCCESS;
}

void SetupLogging(const CliOptions& opts) {
  auto& logger = glyphseed::util::GlobalLogger();
  logger.Configure(glyphseed::util::ParseLogLevel(opts.log_level),
                   static_cast<std::uintmax_t>(opts.log_max_size_mb) * 1024 * 1024,
                   opts.log_max_files);
  if (!opts.debug_log_path.empty()) {
    logger.Enable(opts.debug_log_path);
  }
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions opts;
  try {
    opts = glyphseed::config::ParseCliOptions(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const CliUsageError& ex) {
    std::cerr << "[glyphseed] error: " << ex.what() << "\n";
    PrintUsage();
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "[glyphseed] error: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  if (opts.show_help || opts.command.empty()) {
    PrintUsage();
    return opts.show_help ? EXIT_SUCCESS : 2;
  }

  try {
    SetupLogging(opts);
    if (!opts.wordlist_dir.empty()) {
      std::string error;
      if (!glyphseed::crypto::LoadWordlistDirectory(opts.wordlist_dir, &error)) {
        throw std::runtime_error(error);
      }
    }
    glyphseed::util::LogPrint(glyphseed::util::LogLevel::kDebug, "cli",
                              "running command " + opts.command);
    if (opts.command == "encode") {
      return RunEncode(opts);
    }
    if (opts.command == "decode") {
      return RunDecode(opts);
    }
    if (opts.command == "entropy") {
      return RunEntropy(opts);
    }
    if (opts.command == "mnemonic-encode") {
      return RunMnemonicEncode(opts);
    }
    if (opts.command == "mnemonic-decode") {
      return RunMnemonicDecode(opts);
    }
    throw CliUsageError("unknown command: " + opts.command);
  } catch (const CliUsageError& ex) {
    std::cerr << "[glyphseed] error: " << ex.what() << "\n";
    PrintUsage();
    return 2;
  } catch (const std::exception& ex) {
    glyphseed::util::LogPrint(glyphseed::util::LogLevel::kError, "cli", ex.what());
    std::cerr << "[glyphseed] error: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
