#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace glyphseed::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Accepts debug|info|warn|warning|error in any case; throws
// std::runtime_error otherwise.
LogLevel ParseLogLevel(const std::string& value);

std::string FormatTimestamp();

// Leveled, size-rotated debug log. Every call is a no-op until Enable() has
// opened a file.
class Logger {
 public:
  void Enable(const std::string& path);
  void Disable();
  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files);

  void Log(LogLevel level, std::string_view category, const std::string& message);

  bool Enabled() const;
  LogLevel threshold() const;

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kInfo};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
};

Logger& GlobalLogger();

void LogPrint(LogLevel level, std::string_view category, const std::string& message);

}  // namespace glyphseed::util
