#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/clock.h"
#include "core/json_utils.h"
#include "storage/trade_store.h"

namespace trade_pilot {

/// 对外错误信息最多保留的字符数。
constexpr std::size_t kReplayErrorMessageMax = 100;
/// 对外 OHLCV 每个序列最多保留的点数。
constexpr std::size_t kReplayOhlcvPoints = 5;

/// 只保留 open/high/low/close/volume 五个序列的最后 limit 个点。
JsonValue SanitizeOhlcv(const JsonValue& ohlcv, std::size_t limit = kReplayOhlcvPoints);

/// evidence 只保留 signals/indicators/key_levels 三个结构化字段。
JsonValue SanitizeEvidence(const JsonValue& evidence);

/**
 * @brief 组装回放链
 *
 * 顺序：signal(1) -> market_snapshot(2) -> ai_decision(3) -> risk_report(4)
 * -> trade_plan(5) -> execution(6+i)。缺失的环节直接省略，step 编号不变。
 * 任一指针可为空。
 */
JsonValue BuildReplayChain(const DecisionLogRecord* decision,
                           const SignalRecord* signal,
                           const MarketSnapshotRecord* snapshot,
                           const TradePlanRecord* trade_plan,
                           const std::vector<ExecutionRecord>& executions,
                           std::int64_t generated_at_ms);

/**
 * @brief 面向展示层的只读查询面
 *
 * 所有输出都经过脱敏边界：错误信息截断、OHLCV 只保留尾部、
 * evidence 只保留结构化字段。is_paper 在每条输出记录上保留。
 */
class ReplayView {
 public:
  explicit ReplayView(const TradeStore* store, const Clock* clock = nullptr);

  /// 决策回放；决策不存在返回 false。
  bool ReplayForDecision(const std::string& decision_id,
                         JsonValue* out_chain,
                         std::string* out_error) const;
  /// 交易计划回放：经由决策日志回溯到信号。
  bool ReplayForTradePlan(const std::string& trade_plan_id,
                          JsonValue* out_chain,
                          std::string* out_error) const;
  /// 信号回放：列出该信号触发的全部决策及其计划状态。
  bool ReplayForSignal(const std::string& signal_id,
                       JsonValue* out_view,
                       std::string* out_error) const;

  JsonValue ListDecisions(const DecisionFilter& filter) const;
  JsonValue ListTradePlans(const TradePlanFilter& filter) const;
  JsonValue ListExecutions(const std::string& trade_plan_id) const;

 private:
  JsonValue ChainForDecision(const DecisionLogRecord* decision,
                             const TradePlanRecord* known_plan) const;

  const TradeStore* store_{nullptr};
  const Clock* clock_{nullptr};
};

}  // namespace trade_pilot
