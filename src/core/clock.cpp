#include "core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace trade_pilot {

namespace {

std::tm ToUtcTm(std::int64_t ts_ms) {
  std::int64_t seconds = ts_ms / 1000;
  if (ts_ms < 0 && ts_ms % 1000 != 0) {
    --seconds;
  }
  const std::time_t t = static_cast<std::time_t>(seconds);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  return tm;
}

}  // namespace

std::int64_t SystemClock::NowMs() const {
  const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  return now.time_since_epoch().count();
}

void ThreadSleeper::SleepMs(std::int64_t duration_ms) const {
  if (duration_ms <= 0) {
    return;
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
}

const Clock& DefaultClock() {
  static const SystemClock kClock;
  return kClock;
}

const Sleeper& DefaultSleeper() {
  static const ThreadSleeper kSleeper;
  return kSleeper;
}

std::string FormatUtcIso8601(std::int64_t ts_ms) {
  const std::tm tm = ToUtcTm(ts_ms);
  std::int64_t millis = ts_ms % 1000;
  if (millis < 0) {
    millis += 1000;
  }
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis << 'Z';
  return oss.str();
}

std::string FormatUtcMinuteBucket(std::int64_t ts_ms) {
  const std::tm tm = ToUtcTm(ts_ms);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d%H%M");
  return oss.str();
}

}  // namespace trade_pilot
