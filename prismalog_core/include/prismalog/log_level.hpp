#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace prismalog
{

enum class LogLevel : uint8_t
{
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  Critical = 4,
  Off = 5
};

constexpr std::string_view to_string(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Critical:
      return "CRITICAL";
    case LogLevel::Off:
      return "OFF";
  }
  return "UNKNOWN";
}

constexpr char to_short_char(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Debug:
      return 'D';
    case LogLevel::Info:
      return 'I';
    case LogLevel::Warning:
      return 'W';
    case LogLevel::Error:
      return 'E';
    case LogLevel::Critical:
      return 'C';
    case LogLevel::Off:
      return 'O';
  }
  return '?';
}

// Case-insensitive. Accepts the canonical names plus WARN and FATAL aliases.
std::optional<LogLevel> parse_level(std::string_view text);

}  // namespace prismalog
