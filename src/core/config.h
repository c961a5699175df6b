#pragma once

#include <string>

#include "core/log.h"

namespace trade_pilot {

/// 分布式锁后端。
enum class LockBackend {
  kMemory,  ///< 进程内（单进程部署/测试）。
  kRedis,   ///< Redis（多进程/多机部署）。
};

inline const char* ToString(LockBackend backend) {
  switch (backend) {
    case LockBackend::kMemory:
      return "memory";
    case LockBackend::kRedis:
      return "redis";
  }
  return "unknown";
}

/// 进程级运行参数。
struct AppSection {
  bool paper_trading{true};  ///< 全局纸面开关；为 true 时所有 trader 按纸面执行。
  int cycle_interval_seconds{60};
  int worker_threads{4};
  int signal_batch_size{5};  ///< 单轮每个 trader 最多处理的信号数。
  std::string data_path{"./data"};  ///< WAL 日志目录。
  std::string paper_balance{"10000"};  ///< 纸面模式无法取余额时的兜底可用余额。
};

/// 分布式锁参数。
struct LockSection {
  LockBackend backend{LockBackend::kMemory};
  std::string redis_host{"127.0.0.1"};
  int redis_port{6379};
  int trader_ttl_seconds{60};
  int reconcile_ttl_seconds{300};
  int blocking_timeout_ms{5000};  ///< trader 周期锁阻塞等待上限。
  int poll_interval_ms{100};
};

/// 对账参数：回看窗口与批量上限。
struct ReconcileSection {
  int lookback_hours{24};
  int batch_size{100};
  int interval_seconds{300};
};

/// 模型调用参数。
struct ModelSection {
  int max_attempts{3};
  int rate_limit_per_minute{10};  ///< 每个 trader 每 60s 最多请求数。
  int timeout_ms{60000};
};

struct AppConfig {
  AppSection app;
  LockSection locks;
  ReconcileSection reconcile;
  ModelSection model;
  LogLevel log_level{LogLevel::kInfo};
  /// 凭证主密钥，只从环境变量 `TRADE_PILOT_MASTER_KEY` 读取，不落配置文件。
  std::string master_key;
};

/**
 * @brief 从 YAML 文件加载配置
 *
 * 只识别本项目用到的字段；未出现的字段保留 `out_config` 里的原值。
 * 文件解析完成后依次应用环境变量覆盖并做合法性校验。
 *
 * @return false 文件无法打开、字段解析失败或校验不通过（原因写入 out_error）
 */
bool LoadAppConfigFromYaml(const std::string& file_path,
                           AppConfig* out_config,
                           std::string* out_error);

/**
 * @brief 应用环境变量覆盖
 *
 * 识别：TRADE_PILOT_MASTER_KEY、TRADE_PILOT_REDIS_HOST、
 * TRADE_PILOT_REDIS_PORT、TRADE_PILOT_PAPER_TRADING。
 */
bool ApplyEnvironmentOverrides(AppConfig* config, std::string* out_error);

/// 配置合法性校验（TTL 非负、批量为正、纸面余额可解析等）。
bool ValidateAppConfig(const AppConfig& config, std::string* out_error);

}  // namespace trade_pilot
