#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "storage/memory_trade_store.h"

namespace trade_pilot {

/**
 * @brief 带追加日志的存储
 *
 * 语义：
 * 1. 每次写入先追加一行 JSON（`{"kind":...,"writer":...,"record":{...}}`），再推进内存状态；
 * 2. 记录是完整快照，按文件顺序回放，同一 id 以最后一行为准；
 * 3. 外部 CRUD 层、信号生产方与其它 worker 进程写同一份日志：
 *    追加在 flock 排他锁下以单次 write 完成，Refresh 从上次读到的偏移继续回放，
 *    跳过本实例自己写入的行，末尾未写完的半行留到下一次。
 */
class WalTradeStore final : public MemoryTradeStore {
 public:
  WalTradeStore(std::string file_path, const Clock* clock = nullptr);

  /// 确保父目录与文件存在，并回放已有日志。
  bool Open(std::string* out_error);

  /// 回放其它写入方在上次同步后追加的行。
  bool Refresh(std::string* out_error) override;

  const std::string& file_path() const { return file_path_; }
  const std::string& writer_id() const { return writer_id_; }

 protected:
  bool Journal(const std::string& kind,
               const JsonValue& record,
               std::string* out_error) override;
  bool journaling() const override { return opened_; }

 private:
  /// 从 replay_offset_ 开始回放完整行；调用方持有 replay_mutex_。
  bool Replay(bool skip_own, std::string* out_error);

  std::string file_path_;
  std::string writer_id_;
  bool opened_{false};
  std::mutex replay_mutex_;
  std::uint64_t replay_offset_{0};
};

}  // namespace trade_pilot
