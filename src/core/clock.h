#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace trade_pilot {

/**
 * @brief 时间源抽象
 *
 * 风控冷却、幂等键分钟桶、锁过期、记录时间戳都通过它取“当前时间”，
 * 测试注入手动时钟即可得到确定性结果。实现必须支持多线程并发读取。
 */
class Clock {
 public:
  virtual ~Clock() = default;
  /// 当前 Unix 毫秒时间戳（UTC）。
  virtual std::int64_t NowMs() const = 0;
};

/// 系统时钟实现（`std::chrono::system_clock`）。
class SystemClock final : public Clock {
 public:
  std::int64_t NowMs() const override;
};

/// 休眠抽象：重试退避与阻塞加锁轮询使用。
class Sleeper {
 public:
  virtual ~Sleeper() = default;
  virtual void SleepMs(std::int64_t duration_ms) const = 0;
};

/// 真实线程休眠实现。
class ThreadSleeper final : public Sleeper {
 public:
  void SleepMs(std::int64_t duration_ms) const override;
};

/// 进程级默认实例（生命周期覆盖整个进程）。
const Clock& DefaultClock();
const Sleeper& DefaultSleeper();

/// 毫秒时间戳格式化为 UTC ISO-8601（`2024-01-02T03:04:05.678Z`）。
std::string FormatUtcIso8601(std::int64_t ts_ms);

/// 毫秒时间戳按 UTC 分钟截断并格式化为 `%Y%m%d%H%M`。
std::string FormatUtcMinuteBucket(std::int64_t ts_ms);

}  // namespace trade_pilot
