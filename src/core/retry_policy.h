#pragma once

#include <cstdint>
#include <functional>

#include "core/clock.h"

namespace trade_pilot {

/**
 * @brief 有界重试策略
 *
 * 所有外呼网络请求统一通过它重试，而不是在各适配器里各写一套循环：
 * - `max_attempts`：总尝试次数（含首次），最小按 1 处理；
 * - `backoff_ms(attempt)`：第 attempt 次失败后（从 0 计）到下一次尝试的等待；
 * - 是否可重试由调用方谓词决定（例如模型 AUTH/QUOTA 不重试）。
 */
class RetryPolicy {
 public:
  using BackoffFn = std::function<std::int64_t(int attempt)>;

  RetryPolicy(int max_attempts, BackoffFn backoff_ms, const Sleeper* sleeper);

  /// 模型调用默认退避：`2^attempt + 0.1*attempt` 秒。
  static std::int64_t ModelBackoffMs(int attempt);
  /// 交易所只读请求默认退避：`200ms * 2^attempt`。
  static std::int64_t ExchangeReadBackoffMs(int attempt);

  /// 单次尝试（不重试）的策略。
  static RetryPolicy NoRetry();

  int max_attempts() const { return max_attempts_; }
  std::int64_t BackoffMs(int attempt) const;

  /**
   * @brief 执行带重试的调用
   *
   * @param call 第 attempt 次调用（从 0 计）
   * @param should_retry 返回 true 表示该结果需要继续重试
   * @return 最后一次调用结果（成功或重试耗尽/不可重试时的失败结果）
   */
  template <typename Result>
  Result Run(const std::function<Result(int attempt)>& call,
             const std::function<bool(const Result&)>& should_retry) const {
    Result result = call(0);
    for (int attempt = 1; attempt < max_attempts_; ++attempt) {
      if (!should_retry(result)) {
        return result;
      }
      if (sleeper_ != nullptr) {
        sleeper_->SleepMs(BackoffMs(attempt - 1));
      }
      result = call(attempt);
    }
    return result;
  }

 private:
  int max_attempts_{1};  ///< 总尝试次数。
  BackoffFn backoff_ms_;  ///< 退避函数。
  const Sleeper* sleeper_{nullptr};  ///< 外部注入休眠器（不拥有所有权）。
};

}  // namespace trade_pilot
