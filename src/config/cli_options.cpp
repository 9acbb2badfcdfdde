#include "config/cli_options.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string_view>

#include "crypto/mnemonic_language.hpp"
#include "util/logging.hpp"
#include "wallet/entropy.hpp"

namespace glyphseed::config {

namespace {

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

std::string NormalizeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::size_t ParseCount(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  unsigned long parsed = 0;
  try {
    parsed = std::stoul(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid " + key + " (expected a non-negative integer)");
  }
  if (consumed != value.size()) {
    throw std::runtime_error("invalid " + key + " (expected a non-negative integer)");
  }
  return static_cast<std::size_t>(parsed);
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

bool TakesValue(std::string_view flag) {
  return flag == "--conf" || flag == "--debug-log" || flag == "--log-level" ||
         flag == "--log-max-size-mb" || flag == "--log-max-files" || flag == "--language" ||
         flag == "--scheme" || flag == "--wordlist-dir" || flag == "--format" ||
         flag == "--diagram" || flag == "--salt";
}

}  // namespace

void ApplyConfigOption(const std::string& raw_key, const std::string& value, CliOptions* opts) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "debuglog") {
    opts->debug_log_path = value;
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_size_mb = ParseCount(raw_key, value);
  } else if (key == "logmaxfiles") {
    opts->log_max_files = ParseCount(raw_key, value);
  } else if (key == "language") {
    opts->language = value;
  } else if (key == "scheme") {
    opts->scheme = value;
  } else if (key == "wordlistdir") {
    opts->wordlist_dir = value;
  } else {
    std::cerr << "[glyphseed] warn: unknown config key '" << raw_key << "'\n";
  }
}

void LoadConfigFile(const std::filesystem::path& path, CliOptions* opts) {
  if (path.empty()) {
    return;
  }
  if (!std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) +
                               ": expected key=value");
    }
    const std::string key = Trim(line.substr(0, eq_pos));
    const std::string value = Trim(line.substr(eq_pos + 1));
    try {
      ApplyConfigOption(key, value, opts);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

void ApplyEnvironmentOverrides(CliOptions* opts) {
  auto apply_string = [&](std::string_view name, std::string* target) {
    if (auto value = GetEnvValue(name)) {
      *target = std::move(*value);
    }
  };
  apply_string("GLYPHSEED_LOG_LEVEL", &opts->log_level);
  apply_string("GLYPHSEED_DEBUG_LOG", &opts->debug_log_path);
  apply_string("GLYPHSEED_LANGUAGE", &opts->language);
  apply_string("GLYPHSEED_SCHEME", &opts->scheme);
}

CliOptions ParseCliOptions(const std::vector<std::string>& raw_args) {
  CliOptions opts;
  std::vector<std::string> args;
  args.reserve(raw_args.size());
  for (const auto& token : raw_args) {
    const auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(token);
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw CliUsageError("missing value for " + args[idx]);
    }
    return args[++idx];
  };

  // The config file location must be known before anything else applies.
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--conf") {
      opts.config_path = ensure_value(i);
    } else if (args[i] == "--no-conf") {
      opts.disable_config_file = true;
    } else if (TakesValue(args[i])) {
      ++i;
    }
  }

  if (!opts.disable_config_file) {
    const std::filesystem::path config_path = opts.config_path.empty()
                                                  ? std::filesystem::path("glyphseed.conf")
                                                  : std::filesystem::path(opts.config_path);
    LoadConfigFile(config_path, &opts);
  }

  ApplyEnvironmentOverrides(&opts);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      opts.show_help = true;
    } else if (arg == "--conf") {
      ++i;
    } else if (arg == "--no-conf") {
      continue;
    } else if (arg == "--debug-log") {
      opts.debug_log_path = ensure_value(i);
    } else if (arg == "--log-level") {
      opts.log_level = ensure_value(i);
    } else if (arg == "--log-max-size-mb") {
      opts.log_max_size_mb = ParseCount(arg, ensure_value(i));
    } else if (arg == "--log-max-files") {
      opts.log_max_files = ParseCount(arg, ensure_value(i));
    } else if (arg == "--language") {
      opts.language = ensure_value(i);
    } else if (arg == "--scheme") {
      opts.scheme = ensure_value(i);
    } else if (arg == "--wordlist-dir") {
      opts.wordlist_dir = ensure_value(i);
    } else if (arg == "--format") {
      opts.format = ensure_value(i);
    } else if (arg == "--diagram") {
      opts.diagram_path = ensure_value(i);
    } else if (arg == "--salt") {
      opts.salt = ensure_value(i);
    } else if (arg.rfind("--", 0) == 0) {
      throw CliUsageError("unknown option: " + arg);
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else {
      opts.args.push_back(arg);
    }
  }

  ValidateCliOptions(opts);
  return opts;
}

void ValidateCliOptions(const CliOptions& opts) {
  (void)util::ParseLogLevel(opts.log_level);
  if (!crypto::ParseLanguage(opts.language)) {
    throw std::runtime_error("unknown language: " + opts.language);
  }
  if (!wallet::ParseEntropyScheme(opts.scheme)) {
    throw std::runtime_error("unknown entropy scheme: " + opts.scheme);
  }
}

}  // namespace glyphseed::config
