#include <gtest/gtest.h>

#include <cstdlib>
#include <ctime>
#include <regex>
#include <string>

#include "prismalog/timestamp.hpp"

using namespace prismalog;

namespace
{

// 2025-02-16 07:50:00.123456789 UTC
constexpr uint64_t kKnownNs = 1739692200ULL * 1'000'000'000ULL + 123456789ULL;

class UtcTimestampTest : public ::testing::Test
{
 protected:
  std::string saved_tz_;
  bool had_tz_ = false;

  void SetUp() override
  {
    if (const char* tz = std::getenv("TZ"))
    {
      saved_tz_ = tz;
      had_tz_ = true;
    }
    ::setenv("TZ", "UTC", 1);
    ::tzset();
  }

  void TearDown() override
  {
    if (had_tz_)
    {
      ::setenv("TZ", saved_tz_.c_str(), 1);
    }
    else
    {
      ::unsetenv("TZ");
    }
    ::tzset();
  }
};

}  // namespace

TEST(Timestamp, ClocksAdvance)
{
  uint64_t m1 = monotonic_now_ns();
  uint64_t m2 = monotonic_now_ns();
  EXPECT_GE(m2, m1);

  uint64_t now = wall_clock_now_ns();
  EXPECT_GT(now, 1577836800ULL * 1'000'000'000ULL);  // 2020
  EXPECT_LT(now, 4102444800ULL * 1'000'000'000ULL);  // 2100
}

TEST(Timestamp, CurrentTimeShapes)
{
  uint64_t now = wall_clock_now_ns();
  char buf[64]{};

  format_timestamp(now, buf, sizeof(buf));
  EXPECT_TRUE(std::regex_match(buf, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{6})")))
      << buf;

  EXPECT_EQ(format_date(now, buf, sizeof(buf)), 10u);
  EXPECT_TRUE(std::regex_match(buf, std::regex(R"(\d{4}-\d{2}-\d{2})"))) << buf;

  EXPECT_EQ(format_time(now, buf, sizeof(buf)), 15u);
  EXPECT_TRUE(std::regex_match(buf, std::regex(R"(\d{2}:\d{2}:\d{2}\.\d{6})"))) << buf;
}

TEST_F(UtcTimestampTest, KnownInstant)
{
  char buf[64]{};
  format_timestamp(kKnownNs, buf, sizeof(buf));
  EXPECT_STREQ(buf, "2025-02-16 07:50:00.123456");

  format_date(kKnownNs, buf, sizeof(buf));
  EXPECT_STREQ(buf, "2025-02-16");

  format_time(kKnownNs, buf, sizeof(buf));
  EXPECT_STREQ(buf, "07:50:00.123456");
}

TEST_F(UtcTimestampTest, SplitWallClock)
{
  WallClockParts parts = split_wall_clock(kKnownNs);
  EXPECT_EQ(parts.local.tm_year + 1900, 2025);
  EXPECT_EQ(parts.local.tm_mon + 1, 2);
  EXPECT_EQ(parts.local.tm_mday, 16);
  EXPECT_EQ(parts.local.tm_hour, 7);
  EXPECT_EQ(parts.micros, 123456u);
}

TEST(Timestamp, EpochIgnoresTimeZone)
{
  char buf[64]{};
  size_t len = format_epoch(kKnownNs, buf, sizeof(buf));
  EXPECT_STREQ(buf, "1739692200.123456");
  EXPECT_EQ(len, 17u);

  format_epoch(5'000'001'000ULL, buf, sizeof(buf));
  EXPECT_STREQ(buf, "5.000001");
}

TEST(Timestamp, TruncatesToBuffer)
{
  char buf[8];
  size_t len = format_timestamp(kKnownNs, buf, sizeof(buf));
  EXPECT_EQ(len, 7u);
  EXPECT_EQ(buf[7], '\0');

  EXPECT_EQ(format_epoch(kKnownNs, nullptr, 0), 0u);
}
