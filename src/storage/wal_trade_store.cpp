#include "storage/wal_trade_store.h"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <utility>

#include "core/crypto.h"
#include "core/log.h"

namespace trade_pilot {

namespace {

bool SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

/// 以 O_APPEND 打开并持有 flock 排他锁，析构时解锁关闭。
class AppendHandle {
 public:
  explicit AppendHandle(const std::string& path)
      : fd_(::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644)) {
    if (fd_ >= 0 && ::flock(fd_, LOCK_EX) != 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }
  ~AppendHandle() {
    if (fd_ >= 0) {
      ::flock(fd_, LOCK_UN);
      ::close(fd_);
    }
  }

  AppendHandle(const AppendHandle&) = delete;
  AppendHandle& operator=(const AppendHandle&) = delete;

  bool ok() const { return fd_ >= 0; }

  bool WriteAll(const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
      const ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
      written += static_cast<std::size_t>(n);
    }
    return true;
  }

 private:
  int fd_{-1};
};

}  // namespace

WalTradeStore::WalTradeStore(std::string file_path, const Clock* clock)
    : MemoryTradeStore(clock),
      file_path_(std::move(file_path)),
      writer_id_(GenerateUuid()) {}

bool WalTradeStore::Open(std::string* out_error) {
  const std::filesystem::path path(file_path_);
  const auto parent = path.parent_path();
  std::error_code ec;
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return SetError(out_error, "创建 WAL 目录失败: " + ec.message());
    }
  }

  {
    std::ofstream out(file_path_, std::ios::app);
    if (!out.is_open()) {
      return SetError(out_error, "创建/打开 WAL 文件失败: " + file_path_);
    }
  }

  std::lock_guard<std::mutex> lock(replay_mutex_);
  replay_offset_ = 0;
  if (!Replay(false, out_error)) {
    return false;
  }
  opened_ = true;
  return true;
}

bool WalTradeStore::Refresh(std::string* out_error) {
  if (!opened_) {
    return true;
  }
  std::lock_guard<std::mutex> lock(replay_mutex_);
  return Replay(true, out_error);
}

bool WalTradeStore::Replay(bool skip_own, std::string* out_error) {
  std::ifstream in(file_path_, std::ios::binary);
  if (!in.is_open()) {
    return true;
  }
  in.seekg(static_cast<std::streamoff>(replay_offset_));
  if (!in) {
    return SetError(out_error, "WAL 偏移无效（文件被截断？）: offset=" +
                                   std::to_string(replay_offset_));
  }

  std::string line;
  int restored = 0;
  while (std::getline(in, line)) {
    if (in.eof()) {
      // 没有换行结尾：写入方尚未写完。
      break;
    }
    const std::uint64_t next_offset = replay_offset_ + line.size() + 1;
    if (line.empty()) {
      replay_offset_ = next_offset;
      continue;
    }
    JsonValue entry;
    std::string parse_error;
    if (!ParseJson(line, &entry, &parse_error)) {
      return SetError(out_error, "WAL 行解析失败（offset=" +
                                     std::to_string(replay_offset_) + "）: " +
                                     parse_error);
    }
    const std::string writer =
        JsonAsString(JsonObjectField(&entry, "writer")).value_or("");
    if (!skip_own || writer != writer_id_) {
      const std::string kind =
          JsonAsString(JsonObjectField(&entry, "kind")).value_or("");
      const JsonValue* record = JsonObjectField(&entry, "record");
      if (record == nullptr || !Restore(kind, *record, &parse_error)) {
        return SetError(out_error,
                        "WAL 行回放失败（offset=" + std::to_string(replay_offset_) +
                            "）: " + (record == nullptr ? "缺少 record" : parse_error));
      }
      ++restored;
    }
    replay_offset_ = next_offset;
  }
  if (!skip_own) {
    LogInfo("WAL 回放完成: path=" + file_path_ +
            ", records=" + std::to_string(restored));
  }
  return true;
}

bool WalTradeStore::Journal(const std::string& kind,
                            const JsonValue& record,
                            std::string* out_error) {
  JsonValue entry = MakeJsonObject();
  JsonSet(&entry, "kind", MakeJsonString(kind));
  JsonSet(&entry, "writer", MakeJsonString(writer_id_));
  JsonSet(&entry, "record", record);

  AppendHandle out(file_path_);
  if (!out.ok()) {
    return SetError(out_error, "WAL 打开失败: " + file_path_ + ", error=" +
                                   std::strerror(errno));
  }
  if (!out.WriteAll(SerializeJson(entry) + "\n")) {
    return SetError(out_error, std::string("WAL 写入失败: ") + std::strerror(errno));
  }
  return true;
}

}  // namespace trade_pilot
