#include <gtest/gtest.h>

#include <string>

#include "gelf_logger/timestamp.hpp"

using gelf_logger::Timestamp;

TEST(Timestamp, UnixMillisAtEpoch)
{
  Timestamp ts{1970, 1, 1, 0, 0, 0, 0};
  EXPECT_EQ(gelf_logger::to_unix_millis(ts), 0);
}

TEST(Timestamp, UnixMillisKnownDate)
{
  // 2025-02-16T07:50:00.123Z
  Timestamp ts{2025, 2, 16, 7, 50, 0, 123};
  EXPECT_EQ(gelf_logger::to_unix_millis(ts), 1739692200123LL);
}

TEST(Timestamp, LeapDay)
{
  Timestamp ts{2024, 2, 29, 0, 0, 0, 0};
  EXPECT_EQ(gelf_logger::to_unix_millis(ts), 1709164800000LL);
}

TEST(Timestamp, GelfSecondsHaveMillisecondPrecision)
{
  Timestamp ts{2025, 2, 16, 7, 50, 0, 123};
  EXPECT_DOUBLE_EQ(gelf_logger::to_gelf_seconds(ts), 1739692200.123);
}

TEST(Timestamp, RoundTripFromWallClock)
{
  uint64_t ns = 1739692200123456000ULL;
  Timestamp ts = gelf_logger::utc_from_wall_ns(ns);
  EXPECT_EQ(ts.year, 2025);
  EXPECT_EQ(ts.month, 2);
  EXPECT_EQ(ts.day, 16);
  EXPECT_EQ(ts.hour, 7);
  EXPECT_EQ(ts.minute, 50);
  EXPECT_EQ(ts.second, 0);
  EXPECT_EQ(ts.millisecond, 123);
  EXPECT_EQ(gelf_logger::to_unix_millis(ts), 1739692200123LL);
}

TEST(Timestamp, FormatDateAndTime)
{
  Timestamp ts{2025, 2, 6, 7, 5, 9, 42};
  char buf[32];

  size_t n = gelf_logger::format_date(ts, buf, sizeof(buf));
  EXPECT_EQ(std::string(buf, n), "2025-02-06");

  n = gelf_logger::format_time(ts, buf, sizeof(buf));
  EXPECT_EQ(std::string(buf, n), "07:05:09.042");
}

TEST(Timestamp, FormatTruncatesToBuffer)
{
  Timestamp ts{2025, 2, 6, 7, 5, 9, 42};
  char buf[5];
  size_t n = gelf_logger::format_date(ts, buf, sizeof(buf));
  EXPECT_EQ(n, 4u);
  EXPECT_EQ(std::string(buf, n), "2025");
}

TEST(Timestamp, UtcNowIsRecent)
{
  Timestamp ts = gelf_logger::utc_now();
  EXPECT_GE(ts.year, 2024);
  EXPECT_GE(ts.month, 1);
  EXPECT_LE(ts.month, 12);
}
