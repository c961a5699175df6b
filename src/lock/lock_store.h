#pragma once

#include <cstdint>
#include <string>

namespace trade_pilot {

/**
 * @brief 分布式锁底层存储
 *
 * 只要求三个原子条件操作；返回 false 表示存储本身不可用（网络/协议错误），
 * 条件不满足通过 out 参数表达，不算错误。
 */
class LockStore {
 public:
  virtual ~LockStore() = default;

  /// 键不存在时写入 token 并设置过期（毫秒）。
  virtual bool SetIfAbsent(const std::string& key,
                           const std::string& token,
                           std::int64_t ttl_ms,
                           bool* out_set,
                           std::string* out_error) = 0;

  /// 当前值等于 token 时删除。
  virtual bool CompareAndDelete(const std::string& key,
                                const std::string& token,
                                bool* out_deleted,
                                std::string* out_error) = 0;

  /// 当前值等于 token 时重设过期时间。
  virtual bool CompareAndExpire(const std::string& key,
                                const std::string& token,
                                std::int64_t ttl_ms,
                                bool* out_extended,
                                std::string* out_error) = 0;
};

}  // namespace trade_pilot
