#include "lock/distributed_mutex.h"

#include <algorithm>

#include "core/crypto.h"
#include "core/log.h"

namespace trade_pilot {

std::string TraderLockName(const std::string& trader_id) {
  return "trader:" + trader_id + ":cycle";
}

std::string ReconcileLockName(const std::string& account_id) {
  return "reconcile:" + account_id;
}

DistributedMutex::DistributedMutex(LockStore* store,
                                   const std::string& name,
                                   std::int64_t ttl_ms,
                                   const Sleeper* sleeper)
    : store_(store),
      key_("lock:" + name),
      token_(RandomHexToken()),
      ttl_ms_(ttl_ms),
      sleeper_(sleeper != nullptr ? sleeper : &DefaultSleeper()) {}

bool DistributedMutex::TryAcquire() {
  if (held_) {
    return true;
  }
  if (store_ == nullptr || token_.empty()) {
    last_error_ = store_ == nullptr ? "锁存储未配置" : "锁 token 生成失败";
    return false;
  }
  bool acquired = false;
  std::string error;
  if (!store_->SetIfAbsent(key_, token_, ttl_ms_, &acquired, &error)) {
    last_error_ = error;
    LogWarn("锁存储不可用: key=" + key_ + ", error=" + error);
    return false;
  }
  last_error_.clear();
  held_ = acquired;
  return held_;
}

bool DistributedMutex::AcquireBlocking(std::int64_t timeout_ms,
                                       std::int64_t poll_interval_ms) {
  const std::int64_t poll = std::max<std::int64_t>(1, poll_interval_ms);
  const std::int64_t attempts = std::max<std::int64_t>(1, timeout_ms / poll);
  for (std::int64_t i = 0; i < attempts; ++i) {
    if (TryAcquire()) {
      return true;
    }
    if (i + 1 < attempts) {
      sleeper_->SleepMs(poll);
    }
  }
  return false;
}

bool DistributedMutex::Release() {
  if (!held_) {
    return false;
  }
  bool deleted = false;
  std::string error;
  if (!store_->CompareAndDelete(key_, token_, &deleted, &error)) {
    last_error_ = error;
    LogWarn("释放锁失败，等待 TTL 过期: key=" + key_ + ", error=" + error);
    held_ = false;
    return false;
  }
  held_ = false;
  return deleted;
}

bool DistributedMutex::Extend(std::int64_t ttl_ms) {
  if (!held_) {
    return false;
  }
  bool extended = false;
  std::string error;
  if (!store_->CompareAndExpire(key_, token_, ttl_ms > 0 ? ttl_ms : ttl_ms_,
                                &extended, &error)) {
    last_error_ = error;
    return false;
  }
  if (!extended) {
    // 锁已过期并被他人取得。
    held_ = false;
  }
  return extended;
}

ScopedMutexLock::ScopedMutexLock(DistributedMutex* mutex,
                                 LockMode mode,
                                 std::int64_t timeout_ms,
                                 std::int64_t poll_interval_ms)
    : mutex_(mutex) {
  if (mutex_ == nullptr) {
    return;
  }
  owns_ = mode == LockMode::kBlocking
              ? mutex_->AcquireBlocking(timeout_ms, poll_interval_ms)
              : mutex_->TryAcquire();
}

ScopedMutexLock::~ScopedMutexLock() {
  if (owns_ && mutex_ != nullptr) {
    mutex_->Release();
  }
}

}  // namespace trade_pilot
