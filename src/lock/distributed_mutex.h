#pragma once

#include <cstdint>
#include <string>

#include "core/clock.h"
#include "lock/lock_store.h"

namespace trade_pilot {

/// trader 周期锁名（实际键为 `lock:trader:{id}:cycle`）。
std::string TraderLockName(const std::string& trader_id);
/// 账户对账锁名（实际键为 `lock:reconcile:{account_id}`）。
std::string ReconcileLockName(const std::string& account_id);

/**
 * @brief 带 TTL 的命名互斥
 *
 * 每个实例生成一个随机 token：加锁是原子“不存在才写入并设过期”，
 * 释放/续期是原子“token 相同才删除/重设过期”，持有者崩溃后锁随 TTL 自愈。
 * 抢锁失败是正常的并发控制结果，本类不记错误日志。
 */
class DistributedMutex {
 public:
  DistributedMutex(LockStore* store,
                   const std::string& name,
                   std::int64_t ttl_ms,
                   const Sleeper* sleeper = nullptr);

  DistributedMutex(const DistributedMutex&) = delete;
  DistributedMutex& operator=(const DistributedMutex&) = delete;

  /// 非阻塞：单次尝试。
  bool TryAcquire();

  /**
   * @brief 阻塞加锁
   *
   * 每 `poll_interval_ms` 尝试一次，共 `timeout_ms / poll_interval_ms` 次（至少 1 次）。
   */
  bool AcquireBlocking(std::int64_t timeout_ms, std::int64_t poll_interval_ms);

  /// 仅在本实例持有时删除；返回是否确实删除。
  bool Release();

  /// 仅在本实例持有时续期；ttl_ms <= 0 时沿用构造时的 TTL。
  bool Extend(std::int64_t ttl_ms = 0);

  bool held() const { return held_; }
  const std::string& key() const { return key_; }
  const std::string& last_error() const { return last_error_; }

 private:
  LockStore* store_{nullptr};
  std::string key_;
  std::string token_;
  std::int64_t ttl_ms_{60000};
  const Sleeper* sleeper_{nullptr};
  bool held_{false};
  std::string last_error_;  ///< 存储层最近一次错误（区分“被占用”与“存储不可用”）。
};

/// 加锁模式。
enum class LockMode {
  kNonBlocking,
  kBlocking,
};

/**
 * @brief RAII 锁守卫
 *
 * 构造时按模式尝试加锁，析构时若持有则释放。
 */
class ScopedMutexLock {
 public:
  ScopedMutexLock(DistributedMutex* mutex,
                  LockMode mode,
                  std::int64_t timeout_ms = 0,
                  std::int64_t poll_interval_ms = 100);
  ~ScopedMutexLock();

  ScopedMutexLock(const ScopedMutexLock&) = delete;
  ScopedMutexLock& operator=(const ScopedMutexLock&) = delete;

  bool owns_lock() const { return owns_; }

 private:
  DistributedMutex* mutex_{nullptr};
  bool owns_{false};
};

}  // namespace trade_pilot
