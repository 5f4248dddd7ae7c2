#include "prismalog/delivery_queue.hpp"

#include <fmt/format.h>

#include <thread>

#include "prismalog/timestamp.hpp"

namespace prismalog
{

LogRecord MakeDropNotice(uint64_t dropped_count)
{
  return MakeInternalRecord(LogLevel::Warning, kInternalLoggerName,
                            fmt::format("{} records dropped", dropped_count));
}

DeliveryQueue::DeliveryQueue(size_t capacity) : ring_(capacity) {}

DeliveryQueue::~DeliveryQueue()
{
  LogRecord record{};
  while (ring_.TryPop(record))
  {
    ReleaseRecordMessage(record);
  }
}

EnqueueResult DeliveryQueue::Enqueue(const LogRecord& record) { return EnqueueUntil(record, 0); }

EnqueueResult DeliveryQueue::EnqueueWaiting(const LogRecord& record,
                                            std::chrono::milliseconds max_wait)
{
  uint64_t wait_ns = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(max_wait).count());
  return EnqueueUntil(record, monotonic_now_ns() + wait_ns);
}

EnqueueResult DeliveryQueue::EnqueueUntil(const LogRecord& record, uint64_t deadline_ns)
{
  // seq_cst pairs with Close(): either Close sees this producer or the
  // producer sees the closed flag.
  active_producers_.fetch_add(1);
  if (closed_.load())
  {
    active_producers_.fetch_sub(1, std::memory_order_release);
    ReleaseRecordMessage(record);
    CountDrop();
    return EnqueueResult::Dropped;
  }

  uint64_t pending = pending_drops_.exchange(0, std::memory_order_acq_rel);
  if (pending > 0)
  {
    if (!ring_.TryPush(MakeDropNotice(pending)))
    {
      pending_drops_.fetch_add(pending, std::memory_order_acq_rel);
    }
  }

  bool pushed = ring_.TryPush(record);
  // A waiting producer gives up early once Close() starts.
  while (!pushed && deadline_ns != 0 && !closed_.load() && monotonic_now_ns() < deadline_ns)
  {
    std::this_thread::sleep_for(std::chrono::microseconds(50));
    pushed = ring_.TryPush(record);
  }

  EnqueueResult result = EnqueueResult::Accepted;
  if (!pushed)
  {
    ReleaseRecordMessage(record);
    CountDrop();
    result = EnqueueResult::Dropped;
  }

  active_producers_.fetch_sub(1, std::memory_order_release);
  return result;
}

bool DeliveryQueue::TryDequeue(LogRecord& record) { return ring_.TryPop(record); }

void DeliveryQueue::Close()
{
  closed_.store(true);
  while (active_producers_.load() != 0)
  {
    std::this_thread::yield();
  }
}

void DeliveryQueue::Reopen() { closed_.store(false, std::memory_order_release); }

size_t DeliveryQueue::DiscardRemaining()
{
  size_t count = 0;
  LogRecord record{};
  while (ring_.TryPop(record))
  {
    ReleaseRecordMessage(record);
    ++count;
  }
  if (count > 0)
  {
    pending_drops_.fetch_add(count, std::memory_order_acq_rel);
    dropped_total_.fetch_add(count, std::memory_order_relaxed);
  }
  return count;
}

uint64_t DeliveryQueue::TakePendingDrops()
{
  return pending_drops_.exchange(0, std::memory_order_acq_rel);
}

void DeliveryQueue::AddPendingDrops(uint64_t count)
{
  pending_drops_.fetch_add(count, std::memory_order_acq_rel);
}

void DeliveryQueue::CountDrop()
{
  pending_drops_.fetch_add(1, std::memory_order_acq_rel);
  dropped_total_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace prismalog
