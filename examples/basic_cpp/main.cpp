#include <prismalog/config_resolver.hpp>
#include <prismalog/log_context.hpp>
#include <prismalog/logger.hpp>
#include <prismalog/sinks/callback_sink.hpp>
#include <cstdio>
#include <thread>

int main(int argc, char** argv)
{
  // --- Configuration ---

  // Defaults < config file < LOG_* environment < command line < explicit.
  prismalog::ConfigOverrides explicit_values;
  explicit_values.exit_on_critical = false;

  prismalog::ResolvedConfig resolved = prismalog::ConfigResolver()
                                           .WithEnvironment()
                                           .WithCommandLine(argc, argv)
                                           .WithOverrides(explicit_values)
                                           .Resolve();

  // Callback sink (custom processing), on top of the console and file sinks
  std::vector<std::unique_ptr<prismalog::ILogSink>> extras;
  auto alert = std::make_unique<prismalog::CallbackSink>(
      [](const prismalog::LogRecord& record, std::string_view)
      {
        std::string_view text = record.Message();
        std::fprintf(stderr, "[ALERT] %.*s\n", static_cast<int>(text.size()), text.data());
      });
  alert->SetLevel(prismalog::LogLevel::Error);
  extras.push_back(std::move(alert));

  auto& manager = prismalog::LogManager::Instance();
  manager.Initialize(resolved, std::move(extras));
  prismalog::LogContext::SetThreadName("main");

  auto& log = manager.GetLogger("example.main");
  auto& net = manager.GetLogger("example.net");

  // --- Basic logging ---

  LOG_DEBUG(log, "debug value: {}", 42);
  LOG_INFO(log, "hello {}, log file at {}", "world", manager.CurrentConfig()->FilePath());
  LOG_WARNING(log, "disk usage at {}%", 85);
  LOG_ERROR(net, "connection failed: {}", "timeout");

  // Method form, no call site captured
  net.Info("received {} bytes", 4096);

  // --- Per-logger levels ---

  net.SetLevel(prismalog::LogLevel::Warning);
  net.Info("hidden");
  net.Warning("still visible");

  // --- Multi-thread demo ---

  auto worker = [&manager](int id)
  {
    char name[16];
    std::snprintf(name, sizeof(name), "worker-%d", id);
    prismalog::LogContext::SetThreadName(name);

    auto& wlog = manager.GetLogger("example.worker");
    for (int i = 0; i < 5; ++i)
    {
      LOG_INFO(wlog, "task {} processing step {}", id, i);
    }
  };

  std::thread t1(worker, 1);
  std::thread t2(worker, 2);
  t1.join();
  t2.join();

  // --- Critical ---

  // exit_on_critical was turned off above; with it on this would be the last record.
  LOG_CRITICAL(log, "unrecoverable state: {}", "demo");

  // --- Shutdown ---

  LOG_INFO(log, "shutting down");
  size_t discarded = manager.Shutdown();

  prismalog::LogStats stats = manager.Stats();
  std::printf("Example finished: %llu records, %llu dropped, %zu discarded.\n",
              static_cast<unsigned long long>(stats.processed),
              static_cast<unsigned long long>(stats.dropped), discarded);
  return 0;
}
