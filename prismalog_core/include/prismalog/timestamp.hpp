#pragma once
#include <cstddef>
#include <cstdint>
#include <ctime>

namespace prismalog
{

uint64_t monotonic_now_ns();
uint64_t wall_clock_now_ns();

// Local calendar time plus the sub-second part of a wall-clock reading.
struct WallClockParts
{
  std::tm local{};
  uint32_t micros = 0;
};

WallClockParts split_wall_clock(uint64_t wall_ns);

// All formatters write at most buf_size - 1 bytes, NUL-terminate, and return
// the number of bytes written.
size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size);  // 2025-02-16 07:50:00.123456
size_t format_date(uint64_t wall_ns, char* buf, size_t buf_size);       // 2025-02-16
size_t format_time(uint64_t wall_ns, char* buf, size_t buf_size);       // 07:50:00.123456

// Seconds since the epoch with microsecond fraction, e.g. "1739692200.123456".
size_t format_epoch(uint64_t wall_ns, char* buf, size_t buf_size);

}  // namespace prismalog
