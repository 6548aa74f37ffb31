#pragma once
#include <cstddef>
#include <cstdint>

namespace gelf_logger
{

// Civil time as handed in by the caller. Always interpreted as UTC.
struct Timestamp
{
  int year;
  int month;        // 1-12
  int day;          // 1-31
  int hour;
  int minute;
  int second;
  int millisecond;  // 0-999
};

uint64_t wall_clock_now_ns();
Timestamp utc_from_wall_ns(uint64_t wall_ns);
Timestamp utc_now();

int64_t to_unix_millis(const Timestamp& ts);

// Seconds since the epoch, rounded to 3 decimals.
double to_gelf_seconds(const Timestamp& ts);

size_t format_date(const Timestamp& ts, char* buf, size_t buf_size);
size_t format_time(const Timestamp& ts, char* buf, size_t buf_size);

}  // namespace gelf_logger
