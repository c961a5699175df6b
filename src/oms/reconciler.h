#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/clock.h"
#include "core/types.h"
#include "exchange/exchange_factory.h"
#include "lock/lock_store.h"
#include "security/secrets_cipher.h"
#include "storage/trade_store.h"

namespace trade_pilot {

struct ReconcileOptions {
  int lookback_hours{24};
  std::size_t batch_size{100};
  std::int64_t lock_ttl_ms{300000};
};

/// 一次对账的统计结果。
struct ReconcileSummary {
  std::string exchange_account_id;
  bool account_found{false};
  bool skipped_lock_contention{false};
  std::size_t checked{0};  ///< 检查的交易计划数。
  std::size_t updated{0};  ///< 有执行记录被更新的计划数。
  std::size_t errors{0};  ///< 单笔订单查询失败数（已跳过）。
};

/**
 * @brief 把交易所订单状态文本映射为执行状态
 *
 * filled/closed -> filled；cancelled/canceled/expired -> cancelled；
 * partially_filled/partial -> partially_filled；其余返回空（不更新）。
 */
std::optional<ExecutionStatus> MapExchangeOrderStatus(const std::string& status);

/**
 * @brief 对账引擎
 *
 * 持账户对账锁（非阻塞）后扫描回看窗口内的非终态实盘计划，
 * 查询未终态且有交易所订单号的执行记录并前推状态，
 * 再由执行记录推导计划状态。状态只前进，重复对账结果不变。
 */
class ReconciliationEngine {
 public:
  ReconciliationEngine(TradeStore* store,
                       LockStore* lock_store,
                       const SecretsCipher* cipher,
                       ExchangeAdapterFactory adapter_factory,
                       ReconcileOptions options,
                       const Clock* clock = nullptr);

  ReconcileSummary Run(const std::string& exchange_account_id);

  /// 对单个计划对账（调用方已持锁）；返回是否有执行记录被更新。
  bool ReconcilePlan(const TradePlanRecord& plan,
                     ExchangeAdapter* adapter,
                     ReconcileSummary* summary);

 private:
  /// 按交易所回报更新单条执行记录；返回是否有变化。
  bool ApplyOrderState(const OrderResult& order, ExecutionRecord* execution) const;

  TradeStore* store_{nullptr};
  LockStore* lock_store_{nullptr};
  const SecretsCipher* cipher_{nullptr};
  ExchangeAdapterFactory adapter_factory_;
  ReconcileOptions options_;
  const Clock* clock_{nullptr};
};

}  // namespace trade_pilot
