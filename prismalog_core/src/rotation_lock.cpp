#include "prismalog/rotation_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include <fmt/format.h>

namespace prismalog
{

namespace
{

constexpr std::chrono::microseconds kInitialBackoff{100};
constexpr std::chrono::microseconds kMaxBackoff{5000};

}  // namespace

RotationLock::RotationLock(std::string lock_path)
    : path_(std::move(lock_path)), fd_(-1), held_(false)
{
  EnsureOpen();
}

RotationLock::~RotationLock()
{
  if (held_)
  {
    Unlock();
  }
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
}

bool RotationLock::EnsureOpen()
{
  if (fd_ >= 0)
  {
    return true;
  }
  fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0)
  {
    fmt::print(stderr, "prismalog: failed to open rotation lock '{}': {}\n", path_,
               std::strerror(errno));
    return false;
  }
  return true;
}

bool RotationLock::TryLockFor(std::chrono::milliseconds timeout)
{
  if (held_)
  {
    return true;
  }
  if (!EnsureOpen())
  {
    return false;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto backoff = kInitialBackoff;
  for (;;)
  {
    if (::flock(fd_, LOCK_EX | LOCK_NB) == 0)
    {
      held_ = true;
      return true;
    }
    if (errno == EINTR)
    {
      continue;
    }
    if (errno != EWOULDBLOCK)
    {
      fmt::print(stderr, "prismalog: flock on '{}' failed: {}\n", path_, std::strerror(errno));
      return false;
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
    {
      return false;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);
    std::this_thread::sleep_for(remaining < backoff ? remaining : backoff);
    if (backoff < kMaxBackoff)
    {
      backoff *= 2;
    }
  }
}

void RotationLock::Unlock()
{
  if (!held_)
  {
    return;
  }
  while (::flock(fd_, LOCK_UN) != 0 && errno == EINTR)
  {
  }
  held_ = false;
}

}  // namespace prismalog
