#include "gelf_logger/timestamp.hpp"
#include <cmath>
#include <cstdio>
#include <ctime>
#include <time.h>

namespace gelf_logger {

uint64_t wall_clock_now_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL
         + static_cast<uint64_t>(ts.tv_nsec);
}

Timestamp utc_from_wall_ns(uint64_t wall_ns) {
    time_t sec = static_cast<time_t>(wall_ns / 1'000'000'000ULL);
    struct tm tm_val{};
    gmtime_r(&sec, &tm_val);
    Timestamp ts{};
    ts.year = tm_val.tm_year + 1900;
    ts.month = tm_val.tm_mon + 1;
    ts.day = tm_val.tm_mday;
    ts.hour = tm_val.tm_hour;
    ts.minute = tm_val.tm_min;
    ts.second = tm_val.tm_sec;
    ts.millisecond = static_cast<int>((wall_ns % 1'000'000'000ULL) / 1'000'000ULL);
    return ts;
}

Timestamp utc_now() {
    return utc_from_wall_ns(wall_clock_now_ns());
}

// Days since 1970-01-01 for a proleptic Gregorian date.
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int64_t to_unix_millis(const Timestamp& ts) {
    int64_t days = days_from_civil(ts.year, static_cast<unsigned>(ts.month),
                                   static_cast<unsigned>(ts.day));
    int64_t secs = days * 86400 + ts.hour * 3600 + ts.minute * 60 + ts.second;
    return secs * 1000 + ts.millisecond;
}

double to_gelf_seconds(const Timestamp& ts) {
    double seconds = static_cast<double>(to_unix_millis(ts)) / 1000.0;
    return std::round(seconds * 1000.0) / 1000.0;
}

size_t format_date(const Timestamp& ts, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    int n = snprintf(buf, buf_size, "%04d-%02d-%02d", ts.year, ts.month, ts.day);
    return (n > 0 && static_cast<size_t>(n) < buf_size)
         ? static_cast<size_t>(n) : (buf_size - 1);
}

size_t format_time(const Timestamp& ts, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    int n = snprintf(buf, buf_size, "%02d:%02d:%02d.%03d",
                     ts.hour, ts.minute, ts.second, ts.millisecond);
    return (n > 0 && static_cast<size_t>(n) < buf_size)
         ? static_cast<size_t>(n) : (buf_size - 1);
}

} // namespace gelf_logger
