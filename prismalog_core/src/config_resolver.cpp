#include "prismalog/config_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string_view>

#include <fmt/format.h>

#include "prismalog/errors.hpp"

namespace prismalog {

namespace {

std::string trim(const std::string& input) {
    const char* whitespace = " \t\r\n";
    auto begin = input.find_first_not_of(whitespace);
    auto end = input.find_last_not_of(whitespace);
    if (begin == std::string::npos) return "";
    return input.substr(begin, end - begin + 1);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// "value   # comment" -> "value". A '#' glued to text is kept.
std::string strip_comment(const std::string& line) {
    if (!line.empty() && line[0] == '#') return "";
    for (size_t i = 1; i < line.size(); ++i) {
        if (line[i] == '#' && (line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

uint64_t parse_unsigned(const std::string& text, const char* what) {
    std::string value = trim(text);
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ConfigurationError(fmt::format("invalid {} '{}'", what, text));
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw ConfigurationError(fmt::format("{} '{}' out of range", what, text));
    }
}

uint32_t parse_u32(const std::string& text, const char* what) {
    uint64_t value = parse_unsigned(text, what);
    if (value > UINT32_MAX) {
        throw ConfigurationError(fmt::format("{} '{}' out of range", what, text));
    }
    return static_cast<uint32_t>(value);
}

void set_logger_level(ConfigOverrides& layer, std::string prefix, LogLevel level) {
    for (auto& entry : layer.logger_levels) {
        if (entry.prefix == prefix) {
            entry.level = level;
            return;
        }
    }
    layer.logger_levels.push_back({std::move(prefix), level});
}

// Returns false for keys this loader does not know.
bool apply_file_key(ConfigOverrides& layer, const std::string& key, const std::string& value) {
    if (key == "log_dir") {
        layer.log_dir = value;
    } else if (key == "log_filename") {
        layer.base_filename = value;
    } else if (key == "default_level") {
        layer.default_level = parse_level_value(value);
    } else if (key == "rotation_size_mb") {
        layer.rotation_threshold_bytes = parse_rotation_mb(value);
    } else if (key == "rotation_size_bytes") {
        layer.rotation_threshold_bytes = std::max(kMinRotationBytes,
                                                  parse_unsigned(value, "rotation size"));
    } else if (key == "backup_count") {
        layer.backup_count = parse_u32(value, "backup count");
    } else if (key == "colored_console") {
        layer.colored_console = parse_bool_value(value);
    } else if (key == "colored_file") {
        layer.colored_file = parse_bool_value(value);
    } else if (key == "disable_rotation") {
        layer.disable_rotation = parse_bool_value(value);
    } else if (key == "rotation_notice") {
        layer.rotation_notice = parse_bool_value(value);
    } else if (key == "exit_on_critical") {
        layer.exit_on_critical = parse_bool_value(value);
    } else if (key == "console_output") {
        layer.console_output = parse_bool_value(value);
    } else if (key == "file_output") {
        layer.file_output = parse_bool_value(value);
    } else if (key == "queue_capacity") {
        layer.queue_capacity = static_cast<size_t>(parse_u32(value, "queue capacity"));
    } else if (key == "lock_timeout_ms") {
        layer.lock_timeout = std::chrono::milliseconds(parse_u32(value, "lock timeout"));
    } else if (key == "sync_every") {
        layer.sync_every = parse_u32(value, "sync interval");
    } else if (key == "numeric_timestamps") {
        layer.numeric_timestamps = parse_bool_value(value);
    } else if (key == "log_format") {
        layer.file_pattern = value;
    } else if (key == "console_format") {
        layer.console_pattern = value;
    } else {
        return false;
    }
    return true;
}

const char* first_env(std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (const char* value = std::getenv(name)) {
            return value;
        }
    }
    return nullptr;
}

template <typename Fn>
void read_env(std::initializer_list<const char*> names, std::vector<std::string>* warnings,
              Fn&& apply) {
    const char* value = first_env(names);
    if (value == nullptr) {
        return;
    }
    try {
        apply(std::string(value));
    } catch (const ConfigurationError& e) {
        if (warnings) {
            warnings->push_back(fmt::format("ignoring environment value: {}", e.what()));
        }
    }
}

} // namespace

bool parse_bool_value(const std::string& text) {
    std::string value = to_lower(trim(unquote(trim(text))));
    if (value == "1" || value == "true" || value == "yes" || value == "y" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "n" || value == "off") {
        return false;
    }
    throw ConfigurationError(fmt::format("invalid boolean '{}'", text));
}

LogLevel parse_level_value(const std::string& text) {
    auto level = parse_level(trim(unquote(trim(text))));
    if (!level) {
        throw ConfigurationError(fmt::format("invalid log level '{}'", text));
    }
    return *level;
}

uint64_t parse_rotation_mb(const std::string& text) {
    std::string value = trim(unquote(trim(text)));
    size_t consumed = 0;
    double mb = 0.0;
    try {
        mb = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError(fmt::format("invalid rotation size '{}'", text));
    }
    if (consumed != value.size() || !(mb >= 0.0)) {
        throw ConfigurationError(fmt::format("invalid rotation size '{}'", text));
    }
    double bytes = mb * 1024.0 * 1024.0;
    if (bytes > 1.0e18) {
        throw ConfigurationError(fmt::format("rotation size '{}' out of range", text));
    }
    return std::max(kMinRotationBytes, static_cast<uint64_t>(bytes));
}

void ConfigOverrides::ApplyTo(Config& config) const {
    if (default_level) config.default_level = *default_level;
    for (const auto& entry : logger_levels) {
        config.SetLoggerLevel(entry.prefix, entry.level);
    }
    if (log_dir) config.log_dir = *log_dir;
    if (base_filename) config.base_filename = *base_filename;
    if (rotation_threshold_bytes) config.rotation_threshold_bytes = *rotation_threshold_bytes;
    if (backup_count) config.backup_count = *backup_count;
    if (disable_rotation) config.disable_rotation = *disable_rotation;
    if (rotation_notice) config.rotation_notice = *rotation_notice;
    if (colored_console) config.colored_console = *colored_console;
    if (colored_file) config.colored_file = *colored_file;
    if (exit_on_critical) config.exit_on_critical = *exit_on_critical;
    if (console_output) config.console_output = *console_output;
    if (file_output) config.file_output = *file_output;
    if (queue_capacity) config.queue_capacity = *queue_capacity;
    if (lock_timeout) config.lock_timeout = *lock_timeout;
    if (sync_every) config.sync_every = *sync_every;
    if (numeric_timestamps) config.numeric_timestamps = *numeric_timestamps;
    if (file_pattern) config.file_pattern = *file_pattern;
    if (console_pattern) config.console_pattern = *console_pattern;
}

ConfigOverrides LoadConfigFile(const std::string& path, std::vector<std::string>* warnings) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationError(fmt::format("cannot open config file '{}'", path));
    }

    ConfigOverrides layer;
    std::string section;
    std::string raw;
    size_t line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = strip_comment(raw);
        if (trim(line).empty() || trim(line) == "---") continue;

        bool indented = line[0] == ' ' || line[0] == '\t';
        line = trim(line);
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            throw ConfigurationError(
                fmt::format("{}:{}: expected 'key: value'", path, line_no));
        }
        std::string key = unquote(trim(line.substr(0, colon)));
        std::string value = unquote(trim(line.substr(colon + 1)));

        if (indented && section == "?") {
            continue;
        }
        if (indented && !section.empty()) {
            try {
                set_logger_level(layer, key, parse_level_value(value));
            } catch (const ConfigurationError& e) {
                throw ConfigurationError(fmt::format("{}:{}: {}", path, line_no, e.what()));
            }
            continue;
        }
        if (indented) {
            throw ConfigurationError(fmt::format("{}:{}: unexpected indentation", path, line_no));
        }

        section.clear();
        if (value.empty()) {
            if (key == "module_levels" || key == "external_loggers") {
                section = key;
            } else {
                // Unknown section: its entries are skipped.
                section = "?";
                if (warnings) {
                    warnings->push_back(fmt::format("{}:{}: ignoring unknown section '{}'",
                                                    path, line_no, key));
                }
            }
            continue;
        }

        try {
            if (!apply_file_key(layer, key, value) && warnings) {
                warnings->push_back(
                    fmt::format("{}:{}: ignoring unknown key '{}'", path, line_no, key));
            }
        } catch (const ConfigurationError& e) {
            throw ConfigurationError(fmt::format("{}:{}: {}", path, line_no, e.what()));
        }
    }
    return layer;
}

ConfigOverrides ReadEnvironment(std::vector<std::string>* warnings) {
    ConfigOverrides layer;
    read_env({"GITHUB_LOGGING_DIR", "LOGGING_DIR", "LOG_DIR"}, warnings,
             [&](const std::string& v) { layer.log_dir = v; });
    read_env({"GITHUB_LOGGING_VERBOSE", "LOGGING_VERBOSE", "LOG_LEVEL", "LOGGING_LEVEL"}, warnings,
             [&](const std::string& v) { layer.default_level = parse_level_value(v); });
    read_env({"LOG_FILENAME", "LOGGING_FILENAME"}, warnings,
             [&](const std::string& v) { layer.base_filename = v; });
    read_env({"LOG_ROTATION_SIZE", "LOG_ROTATION_SIZE_MB", "LOG_MAX_SIZE"}, warnings,
             [&](const std::string& v) { layer.rotation_threshold_bytes = parse_rotation_mb(v); });
    read_env({"LOG_BACKUP_COUNT", "LOGGING_BACKUP_COUNT"}, warnings,
             [&](const std::string& v) { layer.backup_count = parse_u32(v, "backup count"); });
    read_env({"LOG_COLORED_CONSOLE", "LOG_COLOR"}, warnings,
             [&](const std::string& v) { layer.colored_console = parse_bool_value(v); });
    read_env({"LOG_COLORED_FILE"}, warnings,
             [&](const std::string& v) { layer.colored_file = parse_bool_value(v); });
    read_env({"LOG_DISABLE_ROTATION"}, warnings,
             [&](const std::string& v) { layer.disable_rotation = parse_bool_value(v); });
    read_env({"LOG_EXIT_ON_CRITICAL", "LOGGING_EXIT_ON_CRITICAL"}, warnings,
             [&](const std::string& v) { layer.exit_on_critical = parse_bool_value(v); });
    return layer;
}

CommandLineOptions ParseCommandLine(int argc, const char* const* argv) {
    CommandLineOptions options;
    auto& layer = options.overrides;

    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) continue;
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) continue;

        std::string flag = arg;
        std::optional<std::string> inline_value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            flag = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        // Switches.
        if (flag == "--colored-file" || flag == "--no-color" || flag == "--exit-on-critical") {
            bool value = true;
            if (inline_value) {
                try {
                    value = parse_bool_value(*inline_value);
                } catch (const ConfigurationError& e) {
                    options.warnings.push_back(fmt::format("{}: {}", flag, e.what()));
                    continue;
                }
            }
            if (flag == "--colored-file") layer.colored_file = value;
            else if (flag == "--no-color") layer.colored_console = !value;
            else layer.exit_on_critical = value;
            continue;
        }

        bool is_config = flag == "--log-config" || flag == "--log-conf" ||
                         flag == "--logging-config" || flag == "--logging-conf";
        bool is_level = flag == "--log-level" || flag == "--logging-level";
        bool is_dir = flag == "--log-dir" || flag == "--logging-dir";
        bool is_filename = flag == "--log-filename";
        if (!is_config && !is_level && !is_dir && !is_filename) continue;

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < argc && argv[i + 1] != nullptr) {
            value = argv[++i];
        } else {
            options.warnings.push_back(fmt::format("{} expects a value", flag));
            continue;
        }

        if (is_config) {
            options.config_path = value;
        } else if (is_dir) {
            layer.log_dir = value;
        } else if (is_filename) {
            layer.base_filename = value;
        } else {
            try {
                layer.default_level = parse_level_value(value);
            } catch (const ConfigurationError& e) {
                options.warnings.push_back(fmt::format("{}: {}", flag, e.what()));
            }
        }
    }
    return options;
}

ConfigResolver& ConfigResolver::WithConfigFile(std::string path) {
    config_file_ = std::move(path);
    return *this;
}

ConfigResolver& ConfigResolver::WithCommandLine(int argc, const char* const* argv) {
    command_line_ = ParseCommandLine(argc, argv);
    return *this;
}

ConfigResolver& ConfigResolver::WithCommandLine(CommandLineOptions options) {
    command_line_ = std::move(options);
    return *this;
}

ConfigResolver& ConfigResolver::WithEnvironment(bool enabled) {
    use_environment_ = enabled;
    return *this;
}

ConfigResolver& ConfigResolver::WithOverrides(ConfigOverrides overrides) {
    overrides_ = std::move(overrides);
    return *this;
}

ResolvedConfig ConfigResolver::Resolve() const {
    ResolvedConfig resolved;
    auto& warnings = resolved.warnings;

    std::optional<std::string> file = config_file_;
    if (!file && command_line_ && command_line_->config_path) {
        file = command_line_->config_path;
    }

    if (file) {
        try {
            std::vector<std::string> file_warnings;
            ConfigOverrides layer = LoadConfigFile(*file, &file_warnings);
            layer.ApplyTo(resolved.config);
            warnings.insert(warnings.end(), file_warnings.begin(), file_warnings.end());
        } catch (const ConfigurationError& e) {
            warnings.push_back(fmt::format("config file ignored: {}", e.what()));
        }
    }

    if (use_environment_) {
        ReadEnvironment(&warnings).ApplyTo(resolved.config);
    }

    if (command_line_) {
        command_line_->overrides.ApplyTo(resolved.config);
        for (const auto& w : command_line_->warnings) {
            warnings.push_back(fmt::format("ignoring command line value: {}", w));
        }
    }

    if (overrides_) {
        overrides_->ApplyTo(resolved.config);
    }
    return resolved;
}

} // namespace prismalog
