#include "lock/redis_lock_store.h"

#include <exception>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace trade_pilot {

namespace {

constexpr char kCompareAndDeleteScript[] =
    "if redis.call('get', KEYS[1]) == ARGV[1] then "
    "return redis.call('del', KEYS[1]) else return 0 end";

constexpr char kCompareAndExpireScript[] =
    "if redis.call('get', KEYS[1]) == ARGV[1] then "
    "return redis.call('pexpire', KEYS[1], ARGV[2]) else return 0 end";

bool ParseInteger(const std::string& text, std::int64_t* out_value) {
  try {
    std::size_t consumed = 0;
    *out_value = std::stoll(text, &consumed);
    return consumed == text.size();
  } catch (const std::exception&) {
    return false;
  }
}

bool ParseAt(const std::string& buffer,
             std::size_t offset,
             RedisReply* out_reply,
             std::size_t* out_next,
             std::string* out_error) {
  if (offset >= buffer.size()) {
    return false;
  }
  const std::size_t line_end = buffer.find("\r\n", offset);
  if (line_end == std::string::npos) {
    return false;
  }
  const char type = buffer[offset];
  const std::string line = buffer.substr(offset + 1, line_end - offset - 1);
  const std::size_t body_start = line_end + 2;

  switch (type) {
    case '+':
      out_reply->kind = RedisReply::Kind::kStatus;
      out_reply->text = line;
      *out_next = body_start;
      return true;
    case '-':
      out_reply->kind = RedisReply::Kind::kError;
      out_reply->text = line;
      *out_next = body_start;
      return true;
    case ':':
      out_reply->kind = RedisReply::Kind::kInteger;
      if (!ParseInteger(line, &out_reply->integer)) {
        if (out_error != nullptr) {
          *out_error = "RESP 整数非法: " + line;
        }
        return false;
      }
      *out_next = body_start;
      return true;
    case '$': {
      std::int64_t length = 0;
      if (!ParseInteger(line, &length)) {
        if (out_error != nullptr) {
          *out_error = "RESP bulk 长度非法: " + line;
        }
        return false;
      }
      if (length < 0) {
        out_reply->kind = RedisReply::Kind::kNil;
        *out_next = body_start;
        return true;
      }
      const std::size_t end = body_start + static_cast<std::size_t>(length);
      if (buffer.size() < end + 2) {
        return false;
      }
      out_reply->kind = RedisReply::Kind::kBulk;
      out_reply->text = buffer.substr(body_start, static_cast<std::size_t>(length));
      *out_next = end + 2;
      return true;
    }
    case '*': {
      std::int64_t count = 0;
      if (!ParseInteger(line, &count)) {
        if (out_error != nullptr) {
          *out_error = "RESP 数组长度非法: " + line;
        }
        return false;
      }
      if (count < 0) {
        out_reply->kind = RedisReply::Kind::kNil;
        *out_next = body_start;
        return true;
      }
      out_reply->kind = RedisReply::Kind::kArray;
      out_reply->elements.clear();
      std::size_t cursor = body_start;
      for (std::int64_t i = 0; i < count; ++i) {
        RedisReply element;
        if (!ParseAt(buffer, cursor, &element, &cursor, out_error)) {
          return false;
        }
        out_reply->elements.push_back(std::move(element));
      }
      *out_next = cursor;
      return true;
    }
    default:
      if (out_error != nullptr) {
        *out_error = std::string("未知 RESP 类型: ") + type;
      }
      return false;
  }
}

bool ExpectInteger(const RedisReply& reply,
                   std::int64_t* out_value,
                   std::string* out_error) {
  if (reply.kind == RedisReply::Kind::kError) {
    if (out_error != nullptr) {
      *out_error = "Redis 错误: " + reply.text;
    }
    return false;
  }
  if (reply.kind != RedisReply::Kind::kInteger) {
    if (out_error != nullptr) {
      *out_error = "Redis 回复类型不符，期望整数";
    }
    return false;
  }
  *out_value = reply.integer;
  return true;
}

}  // namespace

std::string EncodeRedisCommand(const std::vector<std::string>& args) {
  std::string out = "*" + std::to_string(args.size()) + "\r\n";
  for (const auto& arg : args) {
    out += "$" + std::to_string(arg.size()) + "\r\n";
    out += arg;
    out += "\r\n";
  }
  return out;
}

bool ParseRedisReply(const std::string& buffer,
                     RedisReply* out_reply,
                     std::size_t* out_consumed,
                     std::string* out_error) {
  if (out_reply == nullptr || out_consumed == nullptr) {
    if (out_error != nullptr) {
      *out_error = "输出参数不能为空";
    }
    return false;
  }
  return ParseAt(buffer, 0, out_reply, out_consumed, out_error);
}

struct RedisLockStore::Connection {
  Connection() : socket(ioc) {}

  boost::asio::io_context ioc;
  boost::asio::ip::tcp::socket socket;
  std::string read_buffer;
};

RedisLockStore::RedisLockStore(std::string host, int port)
    : host_(std::move(host)), port_(port) {}

RedisLockStore::~RedisLockStore() { Disconnect(); }

void RedisLockStore::Disconnect() {
  if (connection_ != nullptr) {
    boost::system::error_code ec;
    connection_->socket.close(ec);
    connection_.reset();
  }
}

bool RedisLockStore::EnsureConnected(std::string* out_error) {
  if (connection_ != nullptr && connection_->socket.is_open()) {
    return true;
  }
  connection_ = std::make_unique<Connection>();
  boost::asio::ip::tcp::resolver resolver(connection_->ioc);
  boost::system::error_code ec;
  const auto results = resolver.resolve(host_, std::to_string(port_), ec);
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "Redis DNS 解析失败: " + ec.message();
    }
    Disconnect();
    return false;
  }
  boost::asio::connect(connection_->socket, results, ec);
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "Redis TCP 连接失败: " + ec.message();
    }
    Disconnect();
    return false;
  }
  return true;
}

bool RedisLockStore::Execute(const std::vector<std::string>& args,
                             RedisReply* out_reply,
                             std::string* out_error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!EnsureConnected(out_error)) {
    return false;
  }

  boost::system::error_code ec;
  const std::string request = EncodeRedisCommand(args);
  boost::asio::write(connection_->socket, boost::asio::buffer(request), ec);
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "Redis 写入失败: " + ec.message();
    }
    Disconnect();
    return false;
  }

  std::string& buffer = connection_->read_buffer;
  char chunk[512];
  while (true) {
    std::size_t consumed = 0;
    std::string parse_error;
    if (ParseRedisReply(buffer, out_reply, &consumed, &parse_error)) {
      buffer.erase(0, consumed);
      return true;
    }
    if (!parse_error.empty()) {
      if (out_error != nullptr) {
        *out_error = parse_error;
      }
      Disconnect();
      return false;
    }
    const std::size_t n = connection_->socket.read_some(
        boost::asio::buffer(chunk, sizeof(chunk)), ec);
    if (ec) {
      if (out_error != nullptr) {
        *out_error = "Redis 读取失败: " + ec.message();
      }
      Disconnect();
      return false;
    }
    buffer.append(chunk, n);
  }
}

bool RedisLockStore::SetIfAbsent(const std::string& key,
                                 const std::string& token,
                                 std::int64_t ttl_ms,
                                 bool* out_set,
                                 std::string* out_error) {
  RedisReply reply;
  if (!Execute({"SET", key, token, "NX", "PX", std::to_string(ttl_ms)}, &reply,
               out_error)) {
    return false;
  }
  if (reply.kind == RedisReply::Kind::kError) {
    if (out_error != nullptr) {
      *out_error = "Redis 错误: " + reply.text;
    }
    return false;
  }
  // NX 未写入时返回 nil。
  *out_set = reply.kind == RedisReply::Kind::kStatus && reply.text == "OK";
  return true;
}

bool RedisLockStore::CompareAndDelete(const std::string& key,
                                      const std::string& token,
                                      bool* out_deleted,
                                      std::string* out_error) {
  RedisReply reply;
  if (!Execute({"EVAL", kCompareAndDeleteScript, "1", key, token}, &reply,
               out_error)) {
    return false;
  }
  std::int64_t removed = 0;
  if (!ExpectInteger(reply, &removed, out_error)) {
    return false;
  }
  *out_deleted = removed > 0;
  return true;
}

bool RedisLockStore::CompareAndExpire(const std::string& key,
                                      const std::string& token,
                                      std::int64_t ttl_ms,
                                      bool* out_extended,
                                      std::string* out_error) {
  RedisReply reply;
  if (!Execute({"EVAL", kCompareAndExpireScript, "1", key, token,
                std::to_string(ttl_ms)},
               &reply, out_error)) {
    return false;
  }
  std::int64_t updated = 0;
  if (!ExpectInteger(reply, &updated, out_error)) {
    return false;
  }
  *out_extended = updated > 0;
  return true;
}

}  // namespace trade_pilot
