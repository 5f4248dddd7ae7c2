#pragma once
#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "../rotation_lock.hpp"
#include "sink_interface.hpp"

namespace prismalog
{

// Logger name of the line written after a rotation.
inline constexpr std::string_view kRotationLoggerName = "prismalog.rotation";

struct RotationOptions
{
  std::chrono::milliseconds lock_timeout{2000};
  // fdatasync every N writes; 0 syncs only on Flush().
  uint32_t sync_every = 0;
  bool rotation_enabled = true;
  // Writes a "Log file rotated" INFO line at the top of each new file.
  bool rotation_notice = false;
};

// Size-rotated append-only file shared by several processes.
//
// Backups are named base.1 .. base.N, higher index = older. With no backups
// the file is never rotated, since rotating would delete it. The size is
// resynchronized from the path before each write, and the rotate-and-reopen
// sequence runs under a RotationLock on "<base>.lock", so exactly one process
// performs a given rotation and the others reopen the new file.
class RotatingFileSink : public ILogSink
{
 public:
  RotatingFileSink(std::string base_path, uint64_t threshold_bytes, uint32_t backup_count,
                   RotationOptions options = {});
  ~RotatingFileSink() override;

  // Throws SinkWriteError when the file cannot be opened or written.
  void Write(const LogRecord& record) override;
  void Flush() override;

  const std::string& Path() const { return base_path_; }
  uint64_t CurrentSize() const { return current_size_; }
  bool RotationEnabled() const { return options_.rotation_enabled; }
  // Safe to read from other threads.
  uint64_t RotationCount() const { return rotations_.load(std::memory_order_relaxed); }
  uint64_t LockTimeoutCount() const { return lock_timeouts_.load(std::memory_order_relaxed); }

  static std::string BackupName(const std::string& base_path, uint32_t index);

 private:
  void OpenFile();
  void CloseFile();
  void RefreshFileState();
  void MaybeRotate(size_t incoming);
  void ShiftBackups();
  void AppendLine(const char* data, size_t len);
  void WriteRotationNotice();

  std::string base_path_;
  uint64_t threshold_bytes_;
  uint32_t backup_count_;
  RotationOptions options_;
  RotationLock lock_;

  int fd_;
  dev_t dev_;
  ino_t ino_;
  uint64_t current_size_;
  uint32_t writes_since_sync_;
  std::atomic<uint64_t> rotations_;
  std::atomic<uint64_t> lock_timeouts_;
};

}  // namespace prismalog
