#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>

#include "platform.hpp"

namespace prismalog
{

// Bounded multi-producer / single-consumer queue. Producers never block:
// TryPush fails when the ring is full. Items from one producer are popped in
// the order that producer pushed them.
template <typename T>
class MPSCRingBuffer
{
  static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");

 public:
  // Capacity is rounded up to the next power of 2 (minimum 2).
  explicit MPSCRingBuffer(size_t capacity)
      : capacity_(RoundUpPow2(capacity)),
        mask_(static_cast<uint32_t>(capacity_ - 1)),
        buffer_(new Slot[capacity_]),
        write_pos_(0),
        read_pos_(0)
  {
    for (uint32_t i = 0; i < capacity_; ++i)
    {
      buffer_[i].sequence.store(i, std::memory_order_relaxed);
    }
  }

  MPSCRingBuffer(const MPSCRingBuffer&) = delete;
  MPSCRingBuffer& operator=(const MPSCRingBuffer&) = delete;

  bool TryPush(const T& item)
  {
    uint32_t pos = write_pos_.load(std::memory_order_relaxed);
    for (;;)
    {
      Slot& slot = buffer_[pos & mask_];
      uint32_t seq = slot.sequence.load(std::memory_order_acquire);
      int32_t diff = static_cast<int32_t>(seq - pos);
      if (diff == 0)
      {
        if (write_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed,
                                             std::memory_order_relaxed))
        {
          slot.data = item;
          slot.sequence.store(pos + 1, std::memory_order_release);
          return true;
        }
        continue;
      }
      if (diff < 0)
      {
        return false;
      }
      pos = write_pos_.load(std::memory_order_relaxed);
    }
  }

  // Consumer side only.
  bool TryPop(T& item)
  {
    Slot& slot = buffer_[read_pos_ & mask_];
    uint32_t seq = slot.sequence.load(std::memory_order_acquire);
    if (seq == read_pos_ + 1)
    {
      item = slot.data;
      slot.sequence.store(read_pos_ + static_cast<uint32_t>(capacity_),
                          std::memory_order_release);
      ++read_pos_;
      return true;
    }
    return false;
  }

  bool Empty() const
  {
    const Slot& slot = buffer_[read_pos_ & mask_];
    return slot.sequence.load(std::memory_order_acquire) != read_pos_ + 1;
  }

  size_t GetCapacity() const { return capacity_; }

 private:
  struct alignas(PRISMALOG_CACHELINE_SIZE) Slot
  {
    std::atomic<uint32_t> sequence;
    T data;
  };

  static size_t RoundUpPow2(size_t n)
  {
    size_t cap = 2;
    while (cap < n)
    {
      cap <<= 1;
    }
    return cap;
  }

  const size_t capacity_;
  const uint32_t mask_;
  std::unique_ptr<Slot[]> buffer_;
  alignas(PRISMALOG_CACHELINE_SIZE) std::atomic<uint32_t> write_pos_;
  alignas(PRISMALOG_CACHELINE_SIZE) uint32_t read_pos_;
};

}  // namespace prismalog
