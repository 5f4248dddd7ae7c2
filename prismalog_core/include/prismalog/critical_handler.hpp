#pragma once
#include <atomic>
#include <functional>

#include "log_record.hpp"

namespace prismalog
{

inline constexpr int kCriticalExitStatus = 1;

// Post-write observer on the Listener thread. When exit-on-critical is on, a
// CRITICAL record flushes every sink and then runs the termination action
// (std::_Exit(kCriticalExitStatus) unless replaced). A CRITICAL record that
// could not be queued is observed on the producer thread, without a flush.
class CriticalHandler
{
 public:
  using Action = std::function<void(const LogRecord&)>;

  explicit CriticalHandler(bool exit_on_critical = true);

  void SetExitOnCritical(bool enabled) { exit_on_critical_.store(enabled, std::memory_order_relaxed); }
  bool ExitOnCritical() const { return exit_on_critical_.load(std::memory_order_relaxed); }

  // Must not race with Observe; set it before the Listener starts.
  // An empty action restores the default.
  void SetAction(Action action);

  // Returns true when the termination action ran (and returned).
  bool Observe(const LogRecord& record, const std::function<void()>& flush_all);

 private:
  std::atomic<bool> exit_on_critical_;
  Action action_;
};

}  // namespace prismalog
