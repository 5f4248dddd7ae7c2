#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

#include "prismalog/log_record.hpp"
#include "prismalog/ring_buffer.hpp"

using prismalog::MPSCRingBuffer;

namespace
{

struct Tagged
{
  uint32_t producer;
  uint32_t seq;
};

struct MpscResult
{
  size_t received = 0;
  size_t order_violations = 0;
  std::vector<uint32_t> next_seq;
};

// Producers retry until accepted; the calling thread consumes.
MpscResult run_mpsc(size_t capacity, uint32_t producers, uint32_t per_producer)
{
  MPSCRingBuffer<Tagged> ring(capacity);
  std::vector<std::thread> threads;
  for (uint32_t p = 0; p < producers; ++p)
  {
    threads.emplace_back(
        [&ring, p, per_producer]()
        {
          for (uint32_t i = 0; i < per_producer; ++i)
          {
            while (!ring.TryPush({p, i}))
            {
              std::this_thread::yield();
            }
          }
        });
  }

  MpscResult result;
  result.next_seq.assign(producers, 0);
  const size_t total = static_cast<size_t>(producers) * per_producer;
  while (result.received < total)
  {
    Tagged item{};
    if (!ring.TryPop(item))
    {
      std::this_thread::yield();
      continue;
    }
    if (item.seq != result.next_seq[item.producer])
    {
      ++result.order_violations;
    }
    result.next_seq[item.producer] = item.seq + 1;
    ++result.received;
  }

  for (auto& t : threads)
  {
    t.join();
  }
  return result;
}

}  // namespace

TEST(MPSCRingBuffer, FifoForSingleProducer)
{
  MPSCRingBuffer<Tagged> ring(16);
  for (uint32_t i = 0; i < 10; ++i)
  {
    ASSERT_TRUE(ring.TryPush({7, i}));
  }
  for (uint32_t i = 0; i < 10; ++i)
  {
    Tagged out{};
    ASSERT_TRUE(ring.TryPop(out));
    EXPECT_EQ(out.producer, 7u);
    EXPECT_EQ(out.seq, i);
  }
  Tagged out{};
  EXPECT_FALSE(ring.TryPop(out));
}

TEST(MPSCRingBuffer, RejectsWhenFull)
{
  MPSCRingBuffer<Tagged> ring(4);
  for (uint32_t i = 0; i < 4; ++i)
  {
    EXPECT_TRUE(ring.TryPush({0, i}));
  }
  EXPECT_FALSE(ring.TryPush({0, 4}));

  // One pop frees exactly one slot.
  Tagged out{};
  ASSERT_TRUE(ring.TryPop(out));
  EXPECT_EQ(out.seq, 0u);
  EXPECT_TRUE(ring.TryPush({0, 4}));
  EXPECT_FALSE(ring.TryPush({0, 5}));
}

TEST(MPSCRingBuffer, CapacityRoundsUpToPowerOfTwo)
{
  EXPECT_EQ(MPSCRingBuffer<Tagged>(0).GetCapacity(), 2u);
  EXPECT_EQ(MPSCRingBuffer<Tagged>(1).GetCapacity(), 2u);
  EXPECT_EQ(MPSCRingBuffer<Tagged>(64).GetCapacity(), 64u);
  EXPECT_EQ(MPSCRingBuffer<Tagged>(1000).GetCapacity(), 1024u);
}

TEST(MPSCRingBuffer, EmptyTracksContents)
{
  MPSCRingBuffer<Tagged> ring(8);
  EXPECT_TRUE(ring.Empty());
  ASSERT_TRUE(ring.TryPush({0, 0}));
  EXPECT_FALSE(ring.Empty());
  Tagged out{};
  ASSERT_TRUE(ring.TryPop(out));
  EXPECT_TRUE(ring.Empty());
}

TEST(MPSCRingBuffer, SurvivesManyWraps)
{
  MPSCRingBuffer<Tagged> ring(8);
  uint32_t next = 0;
  for (uint32_t pushed = 0; pushed < 1000; pushed += 3)
  {
    for (uint32_t k = 0; k < 3; ++k)
    {
      ASSERT_TRUE(ring.TryPush({0, pushed + k}));
    }
    for (uint32_t k = 0; k < 3; ++k)
    {
      Tagged out{};
      ASSERT_TRUE(ring.TryPop(out));
      ASSERT_EQ(out.seq, next++);
    }
  }
  EXPECT_TRUE(ring.Empty());
}

TEST(MPSCRingBuffer, CarriesLogRecords)
{
  MPSCRingBuffer<prismalog::LogRecord> ring(4);
  ASSERT_TRUE(ring.TryPush(
      prismalog::MakeInternalRecord(prismalog::LogLevel::Error, "ring.test", "payload")));

  prismalog::LogRecord out{};
  ASSERT_TRUE(ring.TryPop(out));
  EXPECT_EQ(out.LoggerName(), "ring.test");
  EXPECT_EQ(out.Message(), "payload");
  EXPECT_EQ(out.level, prismalog::LogLevel::Error);
}

TEST(MPSCRingBuffer, PerProducerOrderUnderContention)
{
  MpscResult result = run_mpsc(1024, 4, 1000);
  EXPECT_EQ(result.received, 4000u);
  EXPECT_EQ(result.order_violations, 0u);
  for (uint32_t next : result.next_seq)
  {
    EXPECT_EQ(next, 1000u);
  }
}

TEST(MPSCRingBuffer, PerProducerOrderWithTinyRing)
{
  MpscResult result = run_mpsc(8, 8, 5000);
  EXPECT_EQ(result.received, 40000u);
  EXPECT_EQ(result.order_violations, 0u);
}

TEST(MPSCRingBuffer, NonBlockingProducersCountRejections)
{
  MPSCRingBuffer<Tagged> ring(64);
  std::atomic<uint32_t> accepted{0};
  std::atomic<uint32_t> rejected{0};

  std::vector<std::thread> threads;
  for (uint32_t p = 0; p < 4; ++p)
  {
    threads.emplace_back(
        [&, p]()
        {
          for (uint32_t i = 0; i < 100; ++i)
          {
            if (ring.TryPush({p, i}))
            {
              ++accepted;
            }
            else
            {
              ++rejected;
            }
          }
        });
  }
  for (auto& t : threads)
  {
    t.join();
  }

  EXPECT_EQ(accepted.load(), 64u);
  EXPECT_EQ(rejected.load(), 400u - 64u);

  size_t popped = 0;
  Tagged out{};
  while (ring.TryPop(out))
  {
    ++popped;
  }
  EXPECT_EQ(popped, 64u);
}
