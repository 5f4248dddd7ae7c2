#include "prismalog/logger.hpp"

#include <fmt/format.h>

#include "prismalog/delivery_queue.hpp"
#include "prismalog/formatters/pattern_formatter.hpp"
#include "prismalog/listener.hpp"
#include "prismalog/sinks/console_sink.hpp"
#include "prismalog/sinks/rotating_file_sink.hpp"

namespace prismalog
{

namespace
{

constexpr std::string_view kConfigLoggerName = "prismalog.config";

// Upper bound for draining a retired pipeline during re-initialization.
constexpr std::chrono::milliseconds kReinitGrace{2000};

// How long a terminating CRITICAL record waits for queue space.
constexpr std::chrono::milliseconds kCriticalEnqueueWait{1000};

std::string_view file_pattern_for(const Config& config)
{
  if (!config.file_pattern.empty())
  {
    return config.file_pattern;
  }
  return config.numeric_timestamps ? kDefaultFilePatternNumeric : kDefaultFilePattern;
}

std::string_view console_pattern_for(const Config& config)
{
  if (!config.console_pattern.empty())
  {
    return config.console_pattern;
  }
  return config.numeric_timestamps ? kDefaultConsolePatternNumeric : kDefaultConsolePattern;
}

}  // namespace

// ===== Logger =====

Logger::Logger(LogManager& owner, std::string name, LogLevel level, bool level_overridden)
    : owner_(owner), name_(std::move(name)), level_(level), level_overridden_(level_overridden)
{
}

void Logger::SetLevel(LogLevel level)
{
  level_overridden_.store(true, std::memory_order_relaxed);
  level_.store(level, std::memory_order_relaxed);
}

void Logger::ApplyResolvedLevel(LogLevel level)
{
  if (!level_overridden_.load(std::memory_order_relaxed))
  {
    level_.store(level, std::memory_order_relaxed);
  }
}

void Logger::Submit(const LogRecord& record) { owner_.Submit(record); }

// ===== LogManager =====

LogManager& LogManager::Instance()
{
  static LogManager inst;
  return inst;
}

LogManager::LogManager() = default;

LogManager::~LogManager() { Shutdown(std::chrono::milliseconds(0)); }

std::unique_ptr<LogManager::Pipeline> LogManager::BuildPipeline(
    const Config& config, std::vector<std::unique_ptr<ILogSink>> extra_sinks)
{
  auto pipeline = std::make_unique<Pipeline>();
  pipeline->config = std::make_shared<const Config>(config);
  pipeline->listener = std::make_unique<Listener>(config.queue_capacity);

  if (config.file_output)
  {
    RotationOptions options;
    options.lock_timeout = config.lock_timeout;
    options.sync_every = config.sync_every;
    options.rotation_enabled = !config.disable_rotation;
    options.rotation_notice = config.rotation_notice;

    auto sink = std::make_unique<RotatingFileSink>(
        config.FilePath(), config.rotation_threshold_bytes, config.backup_count, options);
    sink->SetFormatter(
        std::make_unique<PatternFormatter>(file_pattern_for(config), config.colored_file));
    pipeline->file_sink = sink.get();
    pipeline->listener->AddSink(std::move(sink));
  }

  if (config.console_output)
  {
    auto sink = std::make_unique<ConsoleSink>(config.colored_console ? std::nullopt
                                                                     : std::optional<bool>(false));
    sink->SetFormatter(
        std::make_unique<PatternFormatter>(console_pattern_for(config), sink->UsesColor()));
    pipeline->listener->AddSink(std::move(sink));
  }

  for (auto& sink : extra_sinks)
  {
    pipeline->listener->AddSink(std::move(sink));
  }

  CriticalHandler& critical = pipeline->listener->Critical();
  critical.SetExitOnCritical(config.exit_on_critical);
  critical.SetAction(critical_action_);
  return pipeline;
}

std::unique_ptr<LogManager::Pipeline> LogManager::DetachPipeline()
{
  std::unique_lock<std::shared_mutex> lock(pipeline_mutex_);
  return std::move(pipeline_);
}

void LogManager::RetirePipeline(Pipeline& pipeline)
{
  Listener& listener = *pipeline.listener;
  retired_dropped_.fetch_add(listener.Queue().DroppedTotal(), std::memory_order_relaxed);
  retired_faults_.fetch_add(listener.FaultCount(), std::memory_order_relaxed);
  retired_processed_.fetch_add(listener.Processed(), std::memory_order_relaxed);
  if (pipeline.file_sink != nullptr)
  {
    retired_rotations_.fetch_add(pipeline.file_sink->RotationCount(), std::memory_order_relaxed);
    retired_lock_timeouts_.fetch_add(pipeline.file_sink->LockTimeoutCount(),
                                     std::memory_order_relaxed);
  }
}

void LogManager::Initialize(const Config& config, std::vector<std::unique_ptr<ILogSink>> extra_sinks)
{
  Publish(config, std::move(extra_sinks));
}

bool LogManager::Publish(const Config& config, std::vector<std::unique_ptr<ILogSink>> extra_sinks)
{
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

  {
    std::shared_lock<std::shared_mutex> lock(pipeline_mutex_);
    if (extra_sinks.empty() && pipeline_ && *pipeline_->config == config)
    {
      return false;
    }
  }

  auto next = BuildPipeline(config, std::move(extra_sinks));

  // Retire the old pipeline first so no producer's records are delivered out
  // of order across the two Listeners. Records emitted in between are counted
  // as unrouted and reported through the new pipeline.
  uint64_t carried = 0;
  if (auto old = DetachPipeline())
  {
    old->listener->Stop(kReinitGrace, false);
    carried = old->listener->Queue().TakePendingDrops();
    RetirePipeline(*old);
  }

  next->listener->Start();
  DeliveryQueue& queue = next->listener->Queue();
  {
    std::unique_lock<std::shared_mutex> lock(pipeline_mutex_);
    pipeline_ = std::move(next);
    carried += unrouted_drops_.exchange(0, std::memory_order_relaxed);
  }
  if (carried > 0)
  {
    queue.AddPendingDrops(carried);
  }

  ResolveLoggerLevels(config);
  return true;
}

void LogManager::Initialize(const ResolvedConfig& resolved,
                            std::vector<std::unique_ptr<ILogSink>> extra_sinks)
{
  // An unchanged config already reported its warnings.
  if (!Publish(resolved.config, std::move(extra_sinks)))
  {
    return;
  }
  for (const auto& warning : resolved.warnings)
  {
    Submit(MakeInternalRecord(LogLevel::Warning, kConfigLoggerName, warning));
  }
}

void LogManager::ResolveLoggerLevels(const Config& config)
{
  std::lock_guard<std::mutex> lock(registry_mutex_);
  for (auto& entry : loggers_)
  {
    entry.second->ApplyResolvedLevel(config.EffectiveLevel(entry.first));
  }
}

Logger& LogManager::GetLogger(std::string_view name, std::optional<LogLevel> level)
{
  // The snapshot is read under registry_mutex_: a concurrent Initialize
  // either published before this read, or re-resolves this logger after it.
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::shared_ptr<const Config> config = CurrentConfig();

  auto it = loggers_.find(std::string(name));
  if (it != loggers_.end())
  {
    if (level)
    {
      it->second->SetLevel(*level);
    }
    return *it->second;
  }

  LogLevel resolved = Config{}.default_level;
  if (level)
  {
    resolved = *level;
  }
  else if (config)
  {
    resolved = config->EffectiveLevel(name);
  }
  auto logger = std::make_unique<Logger>(*this, std::string(name), resolved, level.has_value());
  Logger& ref = *logger;
  loggers_.emplace(std::string(name), std::move(logger));
  return ref;
}

size_t LogManager::Shutdown(std::chrono::milliseconds grace)
{
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  auto old = DetachPipeline();
  if (!old)
  {
    return 0;
  }
  size_t discarded = old->listener->Stop(grace);
  RetirePipeline(*old);
  return discarded;
}

void LogManager::Reset()
{
  Shutdown(std::chrono::milliseconds(0));

  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    loggers_.clear();
  }
  unrouted_drops_.store(0, std::memory_order_relaxed);
  retired_dropped_.store(0, std::memory_order_relaxed);
  retired_faults_.store(0, std::memory_order_relaxed);
  retired_processed_.store(0, std::memory_order_relaxed);
  retired_rotations_.store(0, std::memory_order_relaxed);
  retired_lock_timeouts_.store(0, std::memory_order_relaxed);
}

bool LogManager::IsInitialized() const
{
  std::shared_lock<std::shared_mutex> lock(pipeline_mutex_);
  return pipeline_ != nullptr;
}

std::shared_ptr<const Config> LogManager::CurrentConfig() const
{
  std::shared_lock<std::shared_mutex> lock(pipeline_mutex_);
  return pipeline_ ? pipeline_->config : nullptr;
}

LogStats LogManager::Stats() const
{
  LogStats stats;
  stats.dropped = retired_dropped_.load(std::memory_order_relaxed) +
                  unrouted_drops_.load(std::memory_order_relaxed);
  stats.sink_faults = retired_faults_.load(std::memory_order_relaxed);
  stats.processed = retired_processed_.load(std::memory_order_relaxed);
  stats.rotations = retired_rotations_.load(std::memory_order_relaxed);
  stats.lock_timeouts = retired_lock_timeouts_.load(std::memory_order_relaxed);

  std::shared_lock<std::shared_mutex> lock(pipeline_mutex_);
  if (pipeline_)
  {
    Listener& listener = *pipeline_->listener;
    stats.dropped += listener.Queue().DroppedTotal();
    stats.sink_faults += listener.FaultCount();
    stats.processed += listener.Processed();
    if (pipeline_->file_sink != nullptr)
    {
      stats.rotations += pipeline_->file_sink->RotationCount();
      stats.lock_timeouts += pipeline_->file_sink->LockTimeoutCount();
    }
  }
  return stats;
}

void LogManager::SetCriticalAction(CriticalHandler::Action action)
{
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  critical_action_ = std::move(action);
}

void LogManager::Submit(const LogRecord& record)
{
  std::shared_lock<std::shared_mutex> lock(pipeline_mutex_);
  if (!pipeline_)
  {
    ReleaseRecordMessage(record);
    unrouted_drops_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  Listener& listener = *pipeline_->listener;
  CriticalHandler& critical = listener.Critical();
  if (record.level != LogLevel::Critical || !critical.ExitOnCritical())
  {
    listener.Queue().Enqueue(record);
    return;
  }

  // A terminating record waits for space instead of being dropped. If it
  // still cannot be queued, the exit happens here on the producer thread.
  std::string text(record.Message());
  if (listener.Queue().EnqueueWaiting(record, kCriticalEnqueueWait) == EnqueueResult::Accepted)
  {
    return;
  }

  LogRecord undelivered = record;
  undelivered.overflow_msg = nullptr;
  SetRecordMessage(undelivered, text);
  fmt::print(stderr, "prismalog: critical record from '{}' could not be queued: {}\n",
             undelivered.LoggerName(), text);
  critical.Observe(undelivered, nullptr);
  ReleaseRecordMessage(undelivered);
}

// ===== Free functions =====

void Initialize(const Config& config) { LogManager::Instance().Initialize(config); }

void Initialize(const ResolvedConfig& resolved) { LogManager::Instance().Initialize(resolved); }

void InitializeFromCommandLine(int argc, const char* const* argv)
{
  ResolvedConfig resolved = ConfigResolver().WithEnvironment().WithCommandLine(argc, argv).Resolve();
  LogManager::Instance().Initialize(resolved);
}

Logger& GetLogger(std::string_view name, std::optional<LogLevel> level)
{
  return LogManager::Instance().GetLogger(name, level);
}

size_t Shutdown(std::chrono::milliseconds grace) { return LogManager::Instance().Shutdown(grace); }

}  // namespace prismalog
