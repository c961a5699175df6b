#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "storage/records.h"

namespace trade_pilot {

/**
 * @brief 交易记录存储接口
 *
 * 约束：
 * 1. 插入时分配 id 与创建时间（写回入参）；
 * 2. `client_order_id` 在 TradePlan 与 DecisionLog 内唯一，
 *    `exchange_order_id`（非空时）在 Execution 内唯一；
 * 3. Execution 必须引用已存在的 TradePlan；
 * 4. TradePlan 状态更新拒绝回退。
 * 每次写入立即提交，读接口返回副本。
 */
class TradeStore {
 public:
  virtual ~TradeStore() = default;

  /**
   * @brief 与共享持久层同步
   *
   * 读入其它进程在上次同步之后追加的记录。持锁区段内、读取“未消费/已存在”
   * 之前调用，保证去重判断看到的是最新状态。纯进程内实现无需同步。
   */
  virtual bool Refresh(std::string* out_error) {
    (void)out_error;
    return true;
  }

  // 配置类实体（由外部 CRUD 层写入）。
  virtual bool UpsertExchangeAccount(ExchangeAccountRecord* record,
                                     std::string* out_error) = 0;
  virtual bool FindExchangeAccount(const std::string& id,
                                   ExchangeAccountRecord* out_record) const = 0;
  virtual std::vector<ExchangeAccountRecord> ActiveExchangeAccounts() const = 0;

  virtual bool UpsertModelConfig(ModelConfigRecord* record,
                                 std::string* out_error) = 0;
  virtual bool FindModelConfig(const std::string& id,
                               ModelConfigRecord* out_record) const = 0;

  virtual bool UpsertStrategy(StrategyRecord* record, std::string* out_error) = 0;
  virtual bool FindStrategy(const std::string& id,
                            StrategyRecord* out_record) const = 0;

  virtual bool UpsertTrader(TraderRecord* record, std::string* out_error) = 0;
  virtual bool FindTrader(const std::string& id, TraderRecord* out_record) const = 0;
  virtual std::vector<TraderRecord> EnabledTraders() const = 0;

  // 信号与行情（由信号生产方写入）。
  virtual bool InsertMarketSnapshot(MarketSnapshotRecord* record,
                                    std::string* out_error) = 0;
  virtual bool FindMarketSnapshot(const std::string& id,
                                  MarketSnapshotRecord* out_record) const = 0;

  virtual bool InsertSignal(SignalRecord* record, std::string* out_error) = 0;
  virtual bool FindSignal(const std::string& id, SignalRecord* out_record) const = 0;

  /**
   * @brief 该 trader 尚未消费的信号
   *
   * 按策略过滤，排除已被该 trader 的决策日志引用的信号，按创建时间倒序取前 limit 条。
   */
  virtual std::vector<SignalRecord> UnconsumedSignals(const std::string& trader_id,
                                                      const std::string& strategy_id,
                                                      std::size_t limit) const = 0;

  // 决策日志。
  virtual bool InsertDecision(DecisionLogRecord* record, std::string* out_error) = 0;
  virtual bool UpdateDecision(const DecisionLogRecord& record,
                              std::string* out_error) = 0;
  virtual bool FindDecision(const std::string& id,
                            DecisionLogRecord* out_record) const = 0;
  virtual bool FindDecisionByClientOrderId(const std::string& client_order_id,
                                           DecisionLogRecord* out_record) const = 0;
  virtual bool FindDecisionByTradePlan(const std::string& trade_plan_id,
                                       DecisionLogRecord* out_record) const = 0;
  virtual std::vector<DecisionLogRecord> DecisionsForSignal(
      const std::string& signal_id) const = 0;
  /// 该 trader 在 since_ms 之后状态为 executed 的决策（冷却检查）。
  virtual std::vector<DecisionLogRecord> RecentExecutedDecisions(
      const std::string& trader_id,
      std::int64_t since_ms) const = 0;
  virtual std::vector<DecisionLogRecord> QueryDecisions(
      const DecisionFilter& filter) const = 0;

  // 交易计划与执行。
  virtual bool InsertTradePlan(TradePlanRecord* record, std::string* out_error) = 0;
  /// 状态回退（或终态后再变更）返回 false。
  virtual bool UpdateTradePlan(const TradePlanRecord& record,
                               std::string* out_error) = 0;
  virtual bool FindTradePlan(const std::string& id,
                             TradePlanRecord* out_record) const = 0;
  /// 账户下 since_ms 之后创建的、非终态的实盘计划（最多 limit 条，按创建时间正序）。
  virtual std::vector<TradePlanRecord> NonTerminalLivePlans(
      const std::string& exchange_account_id,
      std::int64_t since_ms,
      std::size_t limit) const = 0;
  virtual std::vector<TradePlanRecord> QueryTradePlans(
      const TradePlanFilter& filter) const = 0;

  virtual bool InsertExecution(ExecutionRecord* record, std::string* out_error) = 0;
  virtual bool UpdateExecution(const ExecutionRecord& record,
                               std::string* out_error) = 0;
  /// 按创建顺序返回。
  virtual std::vector<ExecutionRecord> ExecutionsForPlan(
      const std::string& trade_plan_id) const = 0;
};

}  // namespace trade_pilot
