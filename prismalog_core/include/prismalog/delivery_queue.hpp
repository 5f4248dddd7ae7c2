#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "log_record.hpp"
#include "platform.hpp"
#include "ring_buffer.hpp"

namespace prismalog
{

enum class EnqueueResult : uint8_t
{
  Accepted,
  Dropped
};

// Logger name carried by records the library synthesizes.
inline constexpr std::string_view kInternalLoggerName = "prismalog";

// Builds the "<count> records dropped" warning record.
LogRecord MakeDropNotice(uint64_t dropped_count);

// Bounded record queue between producers and the Listener.
//
// Full-queue policy is drop-with-count: a producer never waits. Dropped
// records are accumulated into a pending count, and the next producer that
// enqueues successfully first injects one drop-notice record carrying that
// count. The pending count is taken with an atomic exchange, so each drop is
// reported exactly once.
class DeliveryQueue
{
 public:
  explicit DeliveryQueue(size_t capacity = PRISMALOG_DEFAULT_QUEUE_CAPACITY);
  ~DeliveryQueue();

  DeliveryQueue(const DeliveryQueue&) = delete;
  DeliveryQueue& operator=(const DeliveryQueue&) = delete;

  // Producer side. Never blocks, never throws. The queue takes over the
  // record's overflow text and releases it if the record is dropped.
  EnqueueResult Enqueue(const LogRecord& record);

  // The one exception to drop-on-full, used for CRITICAL records that will
  // terminate the process: waits up to max_wait for a free slot, then drops.
  EnqueueResult EnqueueWaiting(const LogRecord& record, std::chrono::milliseconds max_wait);

  // Consumer side (single consumer).
  bool TryDequeue(LogRecord& record);
  bool Empty() const { return ring_.Empty(); }

  // Rejects further enqueues and waits for producers already inside Enqueue
  // to leave, so nothing lands in the ring after Close returns.
  void Close();
  void Reopen();
  bool IsClosed() const { return closed_.load(std::memory_order_acquire); }

  // Pops, releases and counts everything still queued. Consumer side.
  size_t DiscardRemaining();

  // Takes the not-yet-reported drop count (used for the final notice).
  uint64_t TakePendingDrops();

  // Carries drops observed elsewhere into the next notice.
  void AddPendingDrops(uint64_t count);

  uint64_t DroppedTotal() const { return dropped_total_.load(std::memory_order_relaxed); }
  uint64_t PendingDrops() const { return pending_drops_.load(std::memory_order_relaxed); }
  size_t Capacity() const { return ring_.GetCapacity(); }

 private:
  // deadline_ns 0 means a single attempt.
  EnqueueResult EnqueueUntil(const LogRecord& record, uint64_t deadline_ns);
  void CountDrop();

  MPSCRingBuffer<LogRecord> ring_;
  std::atomic<bool> closed_{false};
  std::atomic<uint32_t> active_producers_{0};
  std::atomic<uint64_t> pending_drops_{0};
  std::atomic<uint64_t> dropped_total_{0};
};

}  // namespace prismalog
