#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "log_level.hpp"

namespace prismalog
{

// One partial configuration layer. Unset fields fall through to the layer
// below.
struct ConfigOverrides
{
  std::optional<LogLevel> default_level;
  std::vector<LoggerLevel> logger_levels;
  std::optional<std::string> log_dir;
  std::optional<std::string> base_filename;
  std::optional<uint64_t> rotation_threshold_bytes;
  std::optional<uint32_t> backup_count;
  std::optional<bool> disable_rotation;
  std::optional<bool> rotation_notice;
  std::optional<bool> colored_console;
  std::optional<bool> colored_file;
  std::optional<bool> exit_on_critical;
  std::optional<bool> console_output;
  std::optional<bool> file_output;
  std::optional<size_t> queue_capacity;
  std::optional<std::chrono::milliseconds> lock_timeout;
  std::optional<uint32_t> sync_every;
  std::optional<bool> numeric_timestamps;
  std::optional<std::string> file_pattern;
  std::optional<std::string> console_pattern;

  void ApplyTo(Config& config) const;
};

struct CommandLineOptions
{
  std::optional<std::string> config_path;
  ConfigOverrides overrides;
  // Recognized flags with unusable values.
  std::vector<std::string> warnings;
};

struct ResolvedConfig
{
  Config config;
  std::vector<std::string> warnings;
};

// Known logging flags only; everything else on the command line is ignored.
// Accepts "--flag value" and "--flag=value".
CommandLineOptions ParseCommandLine(int argc, const char* const* argv);

// "key: value" lines with '#' comments, plus the nested maps module_levels:
// and external_loggers:. Throws ConfigurationError when the file cannot be
// read or a known key has an invalid value. Unknown keys go to warnings.
ConfigOverrides LoadConfigFile(const std::string& path, std::vector<std::string>* warnings);

// Reads the LOG_* / LOGGING_* variables. Invalid values go to warnings.
ConfigOverrides ReadEnvironment(std::vector<std::string>* warnings);

// Value parsers shared by the three sources. Throw ConfigurationError.
bool parse_bool_value(const std::string& text);
LogLevel parse_level_value(const std::string& text);
uint64_t parse_rotation_mb(const std::string& text);

// Precedence, highest first: explicit overrides, command line, environment,
// config file, defaults. A malformed source is skipped with a warning.
class ConfigResolver
{
 public:
  ConfigResolver& WithConfigFile(std::string path);
  ConfigResolver& WithCommandLine(int argc, const char* const* argv);
  ConfigResolver& WithCommandLine(CommandLineOptions options);
  ConfigResolver& WithEnvironment(bool enabled = true);
  ConfigResolver& WithOverrides(ConfigOverrides overrides);

  ResolvedConfig Resolve() const;

 private:
  std::optional<std::string> config_file_;
  std::optional<CommandLineOptions> command_line_;
  bool use_environment_ = false;
  std::optional<ConfigOverrides> overrides_;
};

}  // namespace prismalog
