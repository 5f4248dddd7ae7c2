#include "prismalog/timestamp.hpp"
#include "prismalog/platform.hpp"
#include <fmt/format.h>
#include <utility>
#include <time.h>

namespace prismalog {

namespace {

constexpr uint64_t kNanosPerSecond = 1'000'000'000ULL;

uint64_t read_clock_ns(clockid_t clock) {
    struct timespec ts{};
    ::clock_gettime(clock, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * kNanosPerSecond + static_cast<uint64_t>(ts.tv_nsec);
}

template <typename... Args>
size_t write_bounded(char* buf, size_t buf_size, fmt::format_string<Args...> format,
                     Args&&... args) {
    if (buf_size == 0) return 0;
    auto result = fmt::format_to_n(buf, buf_size - 1, format, std::forward<Args>(args)...);
    size_t n = result.size < buf_size - 1 ? result.size : buf_size - 1;
    buf[n] = '\0';
    return n;
}

} // namespace

#if defined(PRISMALOG_PLATFORM_LINUX)
uint64_t monotonic_now_ns() { return read_clock_ns(CLOCK_MONOTONIC_RAW); }
#elif defined(PRISMALOG_PLATFORM_MACOS)
uint64_t monotonic_now_ns() { return clock_gettime_nsec_np(CLOCK_UPTIME_RAW); }
#endif

uint64_t wall_clock_now_ns() { return read_clock_ns(CLOCK_REALTIME); }

WallClockParts split_wall_clock(uint64_t wall_ns) {
    WallClockParts parts;
    time_t sec = static_cast<time_t>(wall_ns / kNanosPerSecond);
    parts.micros = static_cast<uint32_t>((wall_ns % kNanosPerSecond) / 1'000ULL);
    ::localtime_r(&sec, &parts.local);
    return parts;
}

size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size) {
    WallClockParts p = split_wall_clock(wall_ns);
    return write_bounded(buf, buf_size, "{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:06}",
                         p.local.tm_year + 1900, p.local.tm_mon + 1, p.local.tm_mday,
                         p.local.tm_hour, p.local.tm_min, p.local.tm_sec, p.micros);
}

size_t format_date(uint64_t wall_ns, char* buf, size_t buf_size) {
    WallClockParts p = split_wall_clock(wall_ns);
    return write_bounded(buf, buf_size, "{:04}-{:02}-{:02}",
                         p.local.tm_year + 1900, p.local.tm_mon + 1, p.local.tm_mday);
}

size_t format_time(uint64_t wall_ns, char* buf, size_t buf_size) {
    WallClockParts p = split_wall_clock(wall_ns);
    return write_bounded(buf, buf_size, "{:02}:{:02}:{:02}.{:06}",
                         p.local.tm_hour, p.local.tm_min, p.local.tm_sec, p.micros);
}

size_t format_epoch(uint64_t wall_ns, char* buf, size_t buf_size) {
    return write_bounded(buf, buf_size, "{}.{:06}", wall_ns / kNanosPerSecond,
                         static_cast<uint32_t>((wall_ns % kNanosPerSecond) / 1'000ULL));
}

} // namespace prismalog
