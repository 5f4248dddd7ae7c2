#pragma once
#include <cstdint>

#include "log_record.hpp"

namespace prismalog
{

// Per-thread and per-process identity stamped onto every record.
// NOLINTBEGIN(readability-identifier-naming)
class LogContext
{
 public:
  static void SetThreadName(const char* name);
  static const char* GetThreadName();

  // Kernel thread id, cached per thread. The cache of the forking thread is
  // reset in the child so records never carry the parent's id.
  static uint32_t GetThreadId();

  // Not cached: a cached value would be wrong in a forked child.
  static uint32_t GetProcessId();

  static void FillThreadInfo(LogRecord& record);

 private:
  static void ResetAfterFork();

  static thread_local char tls_thread_name_[32];
  static thread_local uint32_t tls_thread_id_;
  static thread_local bool tls_thread_id_cached_;
};
// NOLINTEND(readability-identifier-naming)

}  // namespace prismalog
