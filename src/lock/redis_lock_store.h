#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "lock/lock_store.h"

namespace trade_pilot {

/// RESP2 回复。
struct RedisReply {
  enum class Kind {
    kStatus,
    kError,
    kInteger,
    kBulk,
    kNil,
    kArray,
  };
  Kind kind{Kind::kNil};
  std::string text;  ///< status / error / bulk 内容。
  std::int64_t integer{0};
  std::vector<RedisReply> elements;
};

/// 把命令编码为 RESP2 多条 bulk string 数组。
std::string EncodeRedisCommand(const std::vector<std::string>& args);

/**
 * @brief 从缓冲区解析一个完整回复
 *
 * @param out_consumed 成功时消耗的字节数
 * @return false 数据不完整或格式非法（`out_error` 非空表示非法）
 */
bool ParseRedisReply(const std::string& buffer,
                     RedisReply* out_reply,
                     std::size_t* out_consumed,
                     std::string* out_error);

/**
 * @brief Redis 锁存储（Boost.Asio 同步 TCP + RESP2）
 *
 * - 加锁：`SET key token NX PX ttl`；
 * - 释放/续期：Lua `EVAL` 比较 token 后 `DEL` / `PEXPIRE`。
 * 单连接、串行请求；连接出错后丢弃，下次调用重连。
 */
class RedisLockStore final : public LockStore {
 public:
  RedisLockStore(std::string host, int port);
  ~RedisLockStore() override;

  RedisLockStore(const RedisLockStore&) = delete;
  RedisLockStore& operator=(const RedisLockStore&) = delete;

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
  struct Connection;

  bool Execute(const std::vector<std::string>& args,
               RedisReply* out_reply,
               std::string* out_error);
  bool EnsureConnected(std::string* out_error);
  void Disconnect();

  std::string host_;
  int port_{6379};
  std::mutex mutex_;
  std::unique_ptr<Connection> connection_;
};

}  // namespace trade_pilot
