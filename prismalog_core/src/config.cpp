#include "prismalog/config.hpp"

namespace prismalog
{

bool prefix_matches(std::string_view prefix, std::string_view logger_name)
{
  if (prefix.empty() || logger_name.size() < prefix.size())
  {
    return false;
  }
  if (logger_name.compare(0, prefix.size(), prefix) != 0)
  {
    return false;
  }
  return logger_name.size() == prefix.size() || logger_name[prefix.size()] == '.';
}

std::string Config::FilePath() const
{
  if (log_dir.empty())
  {
    return base_filename;
  }
  if (log_dir.back() == '/')
  {
    return log_dir + base_filename;
  }
  return log_dir + "/" + base_filename;
}

LogLevel Config::EffectiveLevel(std::string_view logger_name) const
{
  const LoggerLevel* best = nullptr;
  for (const auto& entry : logger_levels)
  {
    if (prefix_matches(entry.prefix, logger_name) &&
        (best == nullptr || entry.prefix.size() > best->prefix.size()))
    {
      best = &entry;
    }
  }
  return best != nullptr ? best->level : default_level;
}

void Config::SetLoggerLevel(std::string prefix, LogLevel level)
{
  for (auto& entry : logger_levels)
  {
    if (entry.prefix == prefix)
    {
      entry.level = level;
      return;
    }
  }
  logger_levels.push_back({std::move(prefix), level});
}

bool Config::operator==(const Config& other) const
{
  return default_level == other.default_level && logger_levels == other.logger_levels &&
         log_dir == other.log_dir && base_filename == other.base_filename &&
         rotation_threshold_bytes == other.rotation_threshold_bytes &&
         backup_count == other.backup_count && disable_rotation == other.disable_rotation &&
         rotation_notice == other.rotation_notice &&
         colored_console == other.colored_console && colored_file == other.colored_file &&
         exit_on_critical == other.exit_on_critical &&
         console_output == other.console_output && file_output == other.file_output &&
         queue_capacity == other.queue_capacity && lock_timeout == other.lock_timeout &&
         sync_every == other.sync_every && numeric_timestamps == other.numeric_timestamps &&
         file_pattern == other.file_pattern && console_pattern == other.console_pattern;
}

}  // namespace prismalog
