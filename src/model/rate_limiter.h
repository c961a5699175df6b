#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>

#include "core/clock.h"

namespace trade_pilot {

/**
 * @brief 滑动窗口限流器
 *
 * 每个 key（trader_id）在 `window_ms` 内最多 `max_requests` 次请求。
 * 只在进程内生效；判断与记录在同一把锁内完成，并发调用不会超发。
 */
class SlidingWindowRateLimiter {
 public:
  SlidingWindowRateLimiter(int max_requests,
                           std::int64_t window_ms,
                           const Clock* clock);

  /// 窗口内请求数低于上限时记录本次请求并返回 true（会顺带清理过期记录）。
  bool TryAcquire(const std::string& key);

  /// 窗口内已记录次数（测试与日志使用）。
  int Count(const std::string& key);

 private:
  void EvictExpired(std::deque<std::int64_t>* stamps, std::int64_t now_ms) const;

  int max_requests_{10};
  std::int64_t window_ms_{60000};
  const Clock* clock_{nullptr};
  std::mutex mutex_;
  std::map<std::string, std::deque<std::int64_t>> requests_;
};

}  // namespace trade_pilot
