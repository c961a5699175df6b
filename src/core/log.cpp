#include "core/log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace trade_pilot {

namespace {

std::mutex g_log_mutex;
std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};

const char* LevelTag(LogLevel level) {
  switch (level) {
    case LogLevel::kInfo:
      return "[INFO]";
    case LogLevel::kWarn:
      return "[WARN]";
    case LogLevel::kError:
      return "[ERROR]";
  }
  return "[INFO]";
}

void Write(LogLevel level, std::string_view message) {
  if (static_cast<int>(level) < g_min_level.load()) {
    return;
  }
  // 所有级别共享同一把锁，保证多线程下行不交叉、时序可读。
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostream& out = (level == LogLevel::kError) ? std::cerr : std::cout;
  out << std::put_time(&tm, "%F %T") << ' ' << LevelTag(level) << ' '
      << message << '\n';
}

}  // namespace

void SetMinLogLevel(LogLevel level) {
  g_min_level.store(static_cast<int>(level));
}

bool ParseLogLevel(const std::string& text, LogLevel* out_level) {
  if (out_level == nullptr) {
    return false;
  }
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "info") {
    *out_level = LogLevel::kInfo;
    return true;
  }
  if (lowered == "warn" || lowered == "warning") {
    *out_level = LogLevel::kWarn;
    return true;
  }
  if (lowered == "error") {
    *out_level = LogLevel::kError;
    return true;
  }
  return false;
}

void LogInfo(std::string_view message) {
  Write(LogLevel::kInfo, message);
}

void LogWarn(std::string_view message) {
  Write(LogLevel::kWarn, message);
}

void LogError(std::string_view message) {
  Write(LogLevel::kError, message);
}

}  // namespace trade_pilot
