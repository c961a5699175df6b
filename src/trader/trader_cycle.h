#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/clock.h"
#include "core/decimal.h"
#include "exchange/exchange_adapter.h"
#include "exchange/exchange_factory.h"
#include "lock/distributed_mutex.h"
#include "lock/lock_store.h"
#include "model/model_router.h"
#include "risk/risk_manager.h"
#include "security/secrets_cipher.h"
#include "storage/trade_store.h"

namespace trade_pilot {

struct TraderCycleOptions {
  bool paper_trading{false};  ///< 全局模拟盘开关（与 trader.mode 取或）。
  std::size_t signal_batch_size{5};
  std::int64_t lock_ttl_ms{60000};
  std::int64_t lock_timeout_ms{5000};
  std::int64_t lock_poll_interval_ms{100};
  Decimal paper_balance{"10000"};  ///< 模拟盘取不到余额时使用。
  std::string balance_asset{"USDT"};
};

/// 单次周期的结果统计。
struct CycleSummary {
  std::string trader_id;
  bool trader_found{false};
  bool skipped_lock_contention{false};
  bool lock_lost{false};  ///< 处理中途续期失败，剩余信号未处理。
  std::size_t signals_fetched{0};
  std::size_t duplicates_skipped{0};
  std::size_t decisions_created{0};
  std::size_t executed{0};
  std::size_t allowed{0};
  std::size_t blocked{0};
  std::size_t failed{0};
  std::size_t errors{0};  ///< 单个信号处理中的内部错误（已隔离）。
  std::vector<std::string> decision_ids;
};

/// 由策略 risk_json 与 trader 配置构建风控参数；symbol 精度作为 risk_json 缺省值。
RiskProfile BuildRiskProfile(const TraderRecord& trader,
                             const StrategyRecord& strategy,
                             const std::optional<SymbolInfo>& symbol_info);

/**
 * @brief trader 决策周期
 *
 * 持 trader 锁后逐个处理最新未消费信号：
 * 去重 -> 行情/风控/账户 -> 模型 -> 校验（失败时严格提示重试一次）-> 风控 -> 执行。
 * 每个信号前先续期锁并同步存储，续期失败即停止本轮。
 * 每个信号的状态按步骤立即提交；单个信号失败不影响其它信号。
 */
class TraderCycle {
 public:
  TraderCycle(TradeStore* store,
              LockStore* lock_store,
              ModelRouter* model_router,
              const RiskManager* risk_manager,
              const SecretsCipher* cipher,
              ExchangeAdapterFactory adapter_factory,
              TraderCycleOptions options,
              const Clock* clock = nullptr,
              const Sleeper* sleeper = nullptr);

  /// 运行一次周期；trader 不存在或未启用时静默返回。
  CycleSummary Run(const std::string& trader_id);

 private:
  struct CycleContext;

  void RunLocked(const TraderRecord& trader,
                 DistributedMutex* mutex,
                 CycleSummary* summary);
  void ProcessSignal(CycleContext& context,
                     const SignalRecord& signal,
                     CycleSummary* summary);
  AccountState LoadAccountState(CycleContext& context);
  void FinishDecision(const DecisionLogRecord& decision,
                      CycleSummary* summary);

  TradeStore* store_{nullptr};
  LockStore* lock_store_{nullptr};
  ModelRouter* model_router_{nullptr};
  const RiskManager* risk_manager_{nullptr};
  const SecretsCipher* cipher_{nullptr};
  ExchangeAdapterFactory adapter_factory_;
  TraderCycleOptions options_;
  const Clock* clock_{nullptr};
  const Sleeper* sleeper_{nullptr};
};

}  // namespace trade_pilot
