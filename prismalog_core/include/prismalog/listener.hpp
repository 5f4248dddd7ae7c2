#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "critical_handler.hpp"
#include "delivery_queue.hpp"
#include "log_record.hpp"
#include "platform.hpp"
#include "sinks/sink_interface.hpp"

namespace prismalog
{

enum class ListenerState : uint8_t
{
  Stopped,
  Running,
  Draining
};

// Single consumer of a DeliveryQueue. Each dequeued record goes to every sink
// in order; a failing sink is isolated from the others. After the sinks, the
// CriticalHandler sees the record.
class Listener
{
 public:
  explicit Listener(size_t queue_capacity = PRISMALOG_DEFAULT_QUEUE_CAPACITY);
  ~Listener();

  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;

  // Sinks can only be added while stopped.
  void AddSink(std::unique_ptr<ILogSink> sink);

  // Producers enqueue here.
  DeliveryQueue& Queue() { return queue_; }
  CriticalHandler& Critical() { return critical_; }

  // Stopped -> Running: reopens the queue and starts the worker thread.
  void Start();

  // Running -> Draining -> Stopped. Rejects new records, delivers what is
  // queued until empty or until grace elapses, discards the rest and writes
  // one final drop notice covering every record not delivered. Returns the
  // number of records discarded at shutdown.
  //
  // With write_drop_notice false the undelivered count stays pending in
  // Queue(), for the caller to carry into another queue.
  size_t Stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000),
              bool write_drop_notice = true);

  // Manual mode (no worker thread): deliver up to max_records.
  size_t Drain(size_t max_records = 64);

  ListenerState State() const { return state_.load(std::memory_order_acquire); }
  uint64_t FaultCount() const { return faults_.load(std::memory_order_relaxed); }
  uint64_t Processed() const { return processed_.load(std::memory_order_relaxed); }

 private:
  DeliveryQueue queue_;
  std::vector<std::unique_ptr<ILogSink>> sinks_;
  CriticalHandler critical_;

  std::atomic<ListenerState> state_{ListenerState::Stopped};
  std::atomic<uint64_t> drain_deadline_ns_{0};
  std::atomic<uint64_t> faults_{0};
  std::atomic<uint64_t> processed_{0};

  std::thread worker_;
  void WorkerLoop();
  void DrainUntilDeadline();
  bool GraceExpired() const;

  void Dispatch(const LogRecord& record);
  void FlushSinks();
};

}  // namespace prismalog
