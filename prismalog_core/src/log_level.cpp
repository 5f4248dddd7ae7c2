#include "prismalog/log_level.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace prismalog
{

std::optional<LogLevel> parse_level(std::string_view text)
{
  std::string upper(text);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG") return LogLevel::Debug;
  if (upper == "INFO") return LogLevel::Info;
  if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
  if (upper == "ERROR") return LogLevel::Error;
  if (upper == "CRITICAL" || upper == "FATAL") return LogLevel::Critical;
  if (upper == "OFF") return LogLevel::Off;
  return std::nullopt;
}

}  // namespace prismalog
