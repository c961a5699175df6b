#pragma once

#include <string>
#include <string_view>

namespace trade_pilot {

/// 日志级别，数值越大越严重。
enum class LogLevel {
  kInfo = 0,
  kWarn = 1,
  kError = 2,
};

/**
 * @brief 设置最低输出级别
 *
 * 低于该级别的日志直接丢弃；默认 `kInfo`。
 */
void SetMinLogLevel(LogLevel level);

/// 解析 `info|warn|error`（大小写不敏感）；失败返回 false。
bool ParseLogLevel(const std::string& text, LogLevel* out_level);

/**
 * @brief 输出 INFO 级日志
 *
 * 行为：
 * 1. 线程安全串行写入；
 * 2. 输出到 `stdout`；
 * 3. 自动附加本地时间戳和 `[INFO]` 前缀。
 */
void LogInfo(std::string_view message);

/// 输出 WARN 级日志（`stdout`，`[WARN]` 前缀）。
void LogWarn(std::string_view message);

/**
 * @brief 输出 ERROR 级日志
 *
 * 行为同 LogInfo，但写入 `stderr`，前缀 `[ERROR]`。
 */
void LogError(std::string_view message);

}  // namespace trade_pilot
