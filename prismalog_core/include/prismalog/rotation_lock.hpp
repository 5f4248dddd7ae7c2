#pragma once
#include <chrono>
#include <string>

namespace prismalog
{

// Cross-process exclusive lock bound to a sentinel file, used only around the
// "check size / rotate / reopen" critical section of a file sink.
//
// POSIX implementation: flock(LOCK_EX) on a descriptor opened once per
// instance. flock locks belong to the open file description, so two instances
// exclude each other even inside one process, and a descriptor inherited
// across fork() shares its lock with the parent. Open the lock after fork().
class RotationLock
{
 public:
  explicit RotationLock(std::string lock_path);
  ~RotationLock();

  RotationLock(const RotationLock&) = delete;
  RotationLock& operator=(const RotationLock&) = delete;

  // Polls with a bounded backoff until the lock is held or the timeout
  // elapses. Returns false on timeout or when the lock file cannot be opened.
  bool TryLockFor(std::chrono::milliseconds timeout);

  void Unlock();

  bool IsHeld() const { return held_; }
  const std::string& Path() const { return path_; }

 private:
  bool EnsureOpen();

  std::string path_;
  int fd_;
  bool held_;
};

// Scoped handle: releases on every exit path.
class ScopedRotationLock
{
 public:
  ScopedRotationLock(RotationLock& lock, std::chrono::milliseconds timeout)
      : lock_(lock), owns_(lock.TryLockFor(timeout))
  {
  }

  ~ScopedRotationLock()
  {
    if (owns_)
    {
      lock_.Unlock();
    }
  }

  ScopedRotationLock(const ScopedRotationLock&) = delete;
  ScopedRotationLock& operator=(const ScopedRotationLock&) = delete;

  bool OwnsLock() const { return owns_; }

 private:
  RotationLock& lock_;
  bool owns_;
};

}  // namespace prismalog
