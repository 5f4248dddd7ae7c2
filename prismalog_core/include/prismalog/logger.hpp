#pragma once
#include "config.hpp"
#include "config_resolver.hpp"
#include "critical_handler.hpp"
#include "log_level.hpp"
#include "log_record.hpp"
#include "source_location.hpp"
#include "sinks/sink_interface.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

namespace prismalog {

class Listener;
class LogManager;
class RotatingFileSink;

// Named producer handle. Obtained from LogManager::GetLogger and valid until
// LogManager::Reset.
class Logger {
public:
    Logger(LogManager& owner, std::string name, LogLevel level, bool level_overridden);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    const std::string& Name() const { return name_; }

    LogLevel Level() const { return level_.load(std::memory_order_relaxed); }

    // Explicit level; survives re-initialization.
    void SetLevel(LogLevel level);

    bool IsEnabledFor(LogLevel level) const {
        return level != LogLevel::Off && level >= Level();
    }

    // Interpolates with {fmt} syntax. A bad format string or argument mismatch
    // is rendered into the message instead of thrown. Messages of any length
    // are delivered whole.
    template <typename... Args>
    void Log(LogLevel level, const SourceLocation& loc, const char* fmt, Args&&... args);

    template <typename... Args>
    void Debug(const char* fmt, Args&&... args) {
        Log(LogLevel::Debug, SourceLocation::none(), fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Info(const char* fmt, Args&&... args) {
        Log(LogLevel::Info, SourceLocation::none(), fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Warning(const char* fmt, Args&&... args) {
        Log(LogLevel::Warning, SourceLocation::none(), fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Error(const char* fmt, Args&&... args) {
        Log(LogLevel::Error, SourceLocation::none(), fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void Critical(const char* fmt, Args&&... args) {
        Log(LogLevel::Critical, SourceLocation::none(), fmt, std::forward<Args>(args)...);
    }

private:
    friend class LogManager;

    // Re-resolution from config; ignored once the level was set explicitly.
    void ApplyResolvedLevel(LogLevel level);
    void Submit(const LogRecord& record);

    LogManager& owner_;
    std::string name_;
    std::atomic<LogLevel> level_;
    std::atomic<bool> level_overridden_;
};

struct LogStats {
    uint64_t dropped = 0;
    uint64_t sink_faults = 0;
    uint64_t processed = 0;
    uint64_t rotations = 0;
    uint64_t lock_timeouts = 0;
};

// Process-wide registry and pipeline owner. Initialize publishes a pipeline
// (config snapshot + Listener + sinks); producers only ever see a fully built
// one. Initialize and Shutdown are serialized; producers never wait on them
// beyond the pointer swap.
class LogManager {
public:
    static LogManager& Instance();

    LogManager();
    ~LogManager();

    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    // A call with a config equal to the running one and no extra sinks is a
    // no-op. Otherwise the running pipeline is retired and replaced.
    void Initialize(const Config& config,
                    std::vector<std::unique_ptr<ILogSink>> extra_sinks = {});

    // Also emits the resolver warnings as WARNING records from
    // "prismalog.config", unless the call was a no-op.
    void Initialize(const ResolvedConfig& resolved,
                    std::vector<std::unique_ptr<ILogSink>> extra_sinks = {});

    Logger& GetLogger(std::string_view name, std::optional<LogLevel> level = std::nullopt);

    // Returns the number of records discarded because grace ran out.
    size_t Shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    // Shutdown plus clearing the registry. Invalidates every Logger reference.
    void Reset();

    bool IsInitialized() const;
    std::shared_ptr<const Config> CurrentConfig() const;
    LogStats Stats() const;

    // Replaces the termination action of the critical handler for this and
    // every later pipeline. Empty restores std::_Exit.
    void SetCriticalAction(CriticalHandler::Action action);

private:
    friend class Logger;

    struct Pipeline {
        std::shared_ptr<const Config> config;
        std::unique_ptr<Listener> listener;
        RotatingFileSink* file_sink = nullptr;
    };

    // Returns false when the running pipeline already matches.
    bool Publish(const Config& config, std::vector<std::unique_ptr<ILogSink>> extra_sinks);
    std::unique_ptr<Pipeline> BuildPipeline(const Config& config,
                                            std::vector<std::unique_ptr<ILogSink>> extra_sinks);
    std::unique_ptr<Pipeline> DetachPipeline();
    void RetirePipeline(Pipeline& pipeline);
    void ResolveLoggerLevels(const Config& config);
    void Submit(const LogRecord& record);

    mutable std::shared_mutex pipeline_mutex_;
    std::unique_ptr<Pipeline> pipeline_;

    std::mutex lifecycle_mutex_;
    CriticalHandler::Action critical_action_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers_;

    std::atomic<uint64_t> unrouted_drops_{0};
    std::atomic<uint64_t> retired_dropped_{0};
    std::atomic<uint64_t> retired_faults_{0};
    std::atomic<uint64_t> retired_processed_{0};
    std::atomic<uint64_t> retired_rotations_{0};
    std::atomic<uint64_t> retired_lock_timeouts_{0};
};

// ===== Logger::Log template implementation =====

template <typename... Args>
void Logger::Log(LogLevel level, const SourceLocation& loc, const char* fmt, Args&&... args) {
    if (!IsEnabledFor(level)) {
        return;
    }

    LogRecord record{};
    FillRecordHeader(record, level, name_, loc);

    try {
        auto result = fmt::format_to_n(record.msg, PRISMALOG_MAX_MSG_LEN - 1,
                                       fmt::runtime(fmt), args...);
        if (result.size < PRISMALOG_MAX_MSG_LEN) {
            record.msg_len = static_cast<uint32_t>(result.size);
            record.msg[result.size] = '\0';
        } else {
            // Rendered again in full; the record carries it out of line.
            SetRecordMessage(record, fmt::format(fmt::runtime(fmt), args...));
        }
    } catch (const fmt::format_error& e) {
        SetRecordMessage(record, fmt::format("[format error: {}] {}", e.what(), fmt));
    }

    Submit(record);
}

// Free-function facade over LogManager::Instance().
void Initialize(const Config& config);
void Initialize(const ResolvedConfig& resolved);

// Environment plus the logging flags found in argv.
void InitializeFromCommandLine(int argc, const char* const* argv);

Logger& GetLogger(std::string_view name, std::optional<LogLevel> level = std::nullopt);
size_t Shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

} // namespace prismalog

// ===== Logging macros =====

#define PRISMALOG_LOG(logger, lvl, fmt_str, ...) \
    do { \
        auto& _pl_logger = (logger); \
        if (_pl_logger.IsEnabledFor(lvl)) { \
            _pl_logger.Log(lvl, PRISMALOG_CURRENT_LOCATION(), fmt_str, ##__VA_ARGS__); \
        } \
    } while (0)

#define LOG_DEBUG(logger, fmt, ...)    PRISMALOG_LOG(logger, ::prismalog::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(logger, fmt, ...)     PRISMALOG_LOG(logger, ::prismalog::LogLevel::Info, fmt, ##__VA_ARGS__)
#define LOG_WARNING(logger, fmt, ...)  PRISMALOG_LOG(logger, ::prismalog::LogLevel::Warning, fmt, ##__VA_ARGS__)
#define LOG_ERROR(logger, fmt, ...)    PRISMALOG_LOG(logger, ::prismalog::LogLevel::Error, fmt, ##__VA_ARGS__)
#define LOG_CRITICAL(logger, fmt, ...) PRISMALOG_LOG(logger, ::prismalog::LogLevel::Critical, fmt, ##__VA_ARGS__)
