#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace glyphseed::config {

// Raised for malformed command lines; the tool exits with status 2.
class CliUsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct CliOptions {
  std::string command;
  std::vector<std::string> args;
  std::string config_path;
  bool disable_config_file{false};
  bool show_help{false};
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{10};
  std::size_t log_max_files{5};
  std::string language{"english"};
  std::string scheme{"warp-v1"};
  std::string wordlist_dir;
  std::string format;
  std::string diagram_path;
  std::string salt;
};

// Keys are matched case-insensitively with '-' and '_' ignored, so
// "log-level", "log_level" and "loglevel" are the same key. Unknown keys are
// reported on stderr and skipped; bad values throw std::runtime_error.
void ApplyConfigOption(const std::string& raw_key, const std::string& value, CliOptions* opts);

// key=value lines with '#' comments. A missing file is not an error.
void LoadConfigFile(const std::filesystem::path& path, CliOptions* opts);

// GLYPHSEED_LOG_LEVEL, GLYPHSEED_DEBUG_LOG, GLYPHSEED_LANGUAGE,
// GLYPHSEED_SCHEME.
void ApplyEnvironmentOverrides(CliOptions* opts);

// Parses `args` (without the program name). Precedence, lowest first:
// config file, environment, flags. Flags take "--flag value" or
// "--flag=value". Throws CliUsageError for unknown flags or missing values
// and std::runtime_error for invalid settings.
CliOptions ParseCliOptions(const std::vector<std::string>& args);

// Checks log level, language and scheme names.
void ValidateCliOptions(const CliOptions& opts);

}  // namespace glyphseed::config
