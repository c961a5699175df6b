#include "lock/memory_lock_store.h"

namespace trade_pilot {

InMemoryLockStore::InMemoryLockStore(const Clock* clock)
    : clock_(clock != nullptr ? clock : &DefaultClock()) {}

InMemoryLockStore::Entry* InMemoryLockStore::FindLive(const std::string& key,
                                                      std::int64_t now_ms) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return nullptr;
  }
  if (it->second.expires_at_ms <= now_ms) {
    entries_.erase(it);
    return nullptr;
  }
  return &it->second;
}

bool InMemoryLockStore::SetIfAbsent(const std::string& key,
                                    const std::string& token,
                                    std::int64_t ttl_ms,
                                    bool* out_set,
                                    std::string* out_error) {
  if (out_set == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_set 不能为空";
    }
    return false;
  }
  const std::int64_t now_ms = clock_->NowMs();
  std::lock_guard<std::mutex> lock(mutex_);
  if (FindLive(key, now_ms) != nullptr) {
    *out_set = false;
    return true;
  }
  entries_[key] = Entry{.token = token, .expires_at_ms = now_ms + ttl_ms};
  *out_set = true;
  return true;
}

bool InMemoryLockStore::CompareAndDelete(const std::string& key,
                                         const std::string& token,
                                         bool* out_deleted,
                                         std::string* out_error) {
  if (out_deleted == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_deleted 不能为空";
    }
    return false;
  }
  const std::int64_t now_ms = clock_->NowMs();
  std::lock_guard<std::mutex> lock(mutex_);
  const Entry* entry = FindLive(key, now_ms);
  *out_deleted = entry != nullptr && entry->token == token;
  if (*out_deleted) {
    entries_.erase(key);
  }
  return true;
}

bool InMemoryLockStore::CompareAndExpire(const std::string& key,
                                         const std::string& token,
                                         std::int64_t ttl_ms,
                                         bool* out_extended,
                                         std::string* out_error) {
  if (out_extended == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_extended 不能为空";
    }
    return false;
  }
  const std::int64_t now_ms = clock_->NowMs();
  std::lock_guard<std::mutex> lock(mutex_);
  Entry* entry = FindLive(key, now_ms);
  *out_extended = entry != nullptr && entry->token == token;
  if (*out_extended) {
    entry->expires_at_ms = now_ms + ttl_ms;
  }
  return true;
}

}  // namespace trade_pilot
