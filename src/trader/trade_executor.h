#pragma once

#include <optional>
#include <string>

#include "core/clock.h"
#include "core/decimal.h"
#include "core/types.h"
#include "exchange/exchange_adapter.h"
#include "storage/trade_store.h"

namespace trade_pilot {

/// 一次执行的上下文。
struct ExecutionRequest {
  NormalizedPlan plan;
  std::string exchange_account_id;
  std::string client_order_id;
  bool is_paper{true};
  std::optional<Decimal> current_price;  ///< 行情价（模拟成交回退用）。
  std::optional<Decimal> snapshot_close;  ///< 快照最后收盘价（模拟成交最后回退）。
};

/// 把交易所订单状态映射为本地执行状态。
ExecutionStatus ExecutionStatusFromOrder(const OrderResult& result);

/**
 * @brief 交易执行器
 *
 * 先以 pending 写入交易计划，再按入场 -> 止盈 -> 止损的顺序下单，
 * 每笔订单落一条 Execution，每一步立即提交。
 *
 * 状态规则：
 * - 入场成功且交易所回报 FILLED -> entry_filled（记录成交价）；其余成功 -> entry_placed；
 * - 入场失败 -> failed；
 * - TP/SL 全部成功 -> tp_sl_placed；任一失败保持当前状态并写 error_message，
 *   已存在的真实仓位不会因此被标记为 failed。
 * 模拟盘不调用交易所，按 入场价 -> 行情价 -> 快照收盘价 的顺序取模拟成交价。
 * 执行记录写入失败不会中断后续下单，计划仍按实际下单结果更新状态。
 */
class TradeExecutor {
 public:
  TradeExecutor(TradeStore* store, const Clock* clock = nullptr);

  /**
   * @param adapter 实盘使用；模拟盘可为空
   * @param out_plan 最终交易计划；计划已写入时即使返回 false 也会填充
   * @return false 仅表示持久化失败（out_error 给出原因）；下单失败体现在计划状态里
   */
  bool Execute(const ExecutionRequest& request,
               ExchangeAdapter* adapter,
               TradePlanRecord* out_plan,
               std::string* out_error);

 private:
  void ExecutePaper(const ExecutionRequest& request,
                    TradePlanRecord* plan,
                    std::string* persist_error);
  void ExecuteLive(const ExecutionRequest& request,
                   ExchangeAdapter* adapter,
                   TradePlanRecord* plan,
                   std::string* persist_error);
  /// 写入一条执行记录；失败时追加到 persist_error。
  void RecordExecution(const TradePlanRecord& plan,
                       ExecutionOrderType order_type,
                       const std::string& client_order_id,
                       OrderSide side,
                       const OrderResult& result,
                       bool is_paper,
                       std::string* persist_error);

  TradeStore* store_{nullptr};
  const Clock* clock_{nullptr};
};

}  // namespace trade_pilot
