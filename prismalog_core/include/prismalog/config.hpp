#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "log_level.hpp"
#include "platform.hpp"

namespace prismalog
{

inline constexpr uint64_t kDefaultRotationBytes = 10ULL * 1024 * 1024;
inline constexpr uint64_t kMinRotationBytes = 1024;

struct LoggerLevel
{
  std::string prefix;
  LogLevel level;

  bool operator==(const LoggerLevel& other) const
  {
    return prefix == other.prefix && level == other.level;
  }
};

// Resolved, immutable once published.
struct Config
{
  LogLevel default_level = LogLevel::Info;
  std::vector<LoggerLevel> logger_levels;

  std::string log_dir = "logs";
  std::string base_filename = "app.log";
  uint64_t rotation_threshold_bytes = kDefaultRotationBytes;
  uint32_t backup_count = 5;
  bool disable_rotation = false;
  // "Log file rotated" line at the top of each new file.
  bool rotation_notice = true;

  bool colored_console = true;
  bool colored_file = false;
  bool exit_on_critical = true;
  bool console_output = true;
  bool file_output = true;

  size_t queue_capacity = PRISMALOG_DEFAULT_QUEUE_CAPACITY;
  std::chrono::milliseconds lock_timeout{2000};
  uint32_t sync_every = 0;

  bool numeric_timestamps = false;
  // Empty selects the built-in layout.
  std::string file_pattern;
  std::string console_pattern;

  std::string FilePath() const;

  // Longest dotted-prefix match in logger_levels, else default_level.
  // "a.b" matches "a.b" and "a.b.c" but not "a.bc".
  LogLevel EffectiveLevel(std::string_view logger_name) const;

  // Adds or replaces the level for a prefix.
  void SetLoggerLevel(std::string prefix, LogLevel level);

  bool operator==(const Config& other) const;
  bool operator!=(const Config& other) const { return !(*this == other); }
};

bool prefix_matches(std::string_view prefix, std::string_view logger_name);

}  // namespace prismalog
