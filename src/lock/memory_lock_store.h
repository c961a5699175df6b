#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "core/clock.h"
#include "lock/lock_store.h"

namespace trade_pilot {

/// 进程内锁存储：单进程部署与测试使用，过期由注入时钟驱动。
class InMemoryLockStore final : public LockStore {
 public:
  explicit InMemoryLockStore(const Clock* clock = nullptr);

  bool SetIfAbsent(const std::string& key,
                   const std::string& token,
                   std::int64_t ttl_ms,
                   bool* out_set,
                   std::string* out_error) override;
  bool CompareAndDelete(const std::string& key,
                        const std::string& token,
                        bool* out_deleted,
                        std::string* out_error) override;
  bool CompareAndExpire(const std::string& key,
                        const std::string& token,
                        std::int64_t ttl_ms,
                        bool* out_extended,
                        std::string* out_error) override;

 private:
  struct Entry {
    std::string token;
    std::int64_t expires_at_ms{0};
  };

  /// 返回仍有效的条目；已过期的顺带删除。调用方需持有 mutex_。
  Entry* FindLive(const std::string& key, std::int64_t now_ms);

  const Clock* clock_{nullptr};
  std::mutex mutex_;
  std::map<std::string, Entry> entries_;
};

}  // namespace trade_pilot
