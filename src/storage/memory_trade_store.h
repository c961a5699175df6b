#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/clock.h"
#include "core/json_utils.h"
#include "storage/trade_store.h"

namespace trade_pilot {

/**
 * @brief 进程内存储实现
 *
 * 单把互斥锁保护全部表；唯一性与状态前进约束在写入时校验。
 * 子类可通过 Journal 钩子在“校验通过、写入内存之前”持久化变更。
 */
class MemoryTradeStore : public TradeStore {
 public:
  explicit MemoryTradeStore(const Clock* clock = nullptr);
  ~MemoryTradeStore() override = default;

  bool UpsertExchangeAccount(ExchangeAccountRecord* record,
                             std::string* out_error) override;
  bool FindExchangeAccount(const std::string& id,
                           ExchangeAccountRecord* out_record) const override;
  std::vector<ExchangeAccountRecord> ActiveExchangeAccounts() const override;

  bool UpsertModelConfig(ModelConfigRecord* record,
                         std::string* out_error) override;
  bool FindModelConfig(const std::string& id,
                       ModelConfigRecord* out_record) const override;

  bool UpsertStrategy(StrategyRecord* record, std::string* out_error) override;
  bool FindStrategy(const std::string& id,
                    StrategyRecord* out_record) const override;

  bool UpsertTrader(TraderRecord* record, std::string* out_error) override;
  bool FindTrader(const std::string& id, TraderRecord* out_record) const override;
  std::vector<TraderRecord> EnabledTraders() const override;

  bool InsertMarketSnapshot(MarketSnapshotRecord* record,
                            std::string* out_error) override;
  bool FindMarketSnapshot(const std::string& id,
                          MarketSnapshotRecord* out_record) const override;

  bool InsertSignal(SignalRecord* record, std::string* out_error) override;
  bool FindSignal(const std::string& id, SignalRecord* out_record) const override;
  std::vector<SignalRecord> UnconsumedSignals(const std::string& trader_id,
                                              const std::string& strategy_id,
                                              std::size_t limit) const override;

  bool InsertDecision(DecisionLogRecord* record, std::string* out_error) override;
  bool UpdateDecision(const DecisionLogRecord& record,
                      std::string* out_error) override;
  bool FindDecision(const std::string& id,
                    DecisionLogRecord* out_record) const override;
  bool FindDecisionByClientOrderId(const std::string& client_order_id,
                                   DecisionLogRecord* out_record) const override;
  bool FindDecisionByTradePlan(const std::string& trade_plan_id,
                               DecisionLogRecord* out_record) const override;
  std::vector<DecisionLogRecord> DecisionsForSignal(
      const std::string& signal_id) const override;
  std::vector<DecisionLogRecord> RecentExecutedDecisions(
      const std::string& trader_id,
      std::int64_t since_ms) const override;
  std::vector<DecisionLogRecord> QueryDecisions(
      const DecisionFilter& filter) const override;

  bool InsertTradePlan(TradePlanRecord* record, std::string* out_error) override;
  bool UpdateTradePlan(const TradePlanRecord& record,
                       std::string* out_error) override;
  bool FindTradePlan(const std::string& id,
                     TradePlanRecord* out_record) const override;
  std::vector<TradePlanRecord> NonTerminalLivePlans(
      const std::string& exchange_account_id,
      std::int64_t since_ms,
      std::size_t limit) const override;
  std::vector<TradePlanRecord> QueryTradePlans(
      const TradePlanFilter& filter) const override;

  bool InsertExecution(ExecutionRecord* record, std::string* out_error) override;
  bool UpdateExecution(const ExecutionRecord& record,
                       std::string* out_error) override;
  std::vector<ExecutionRecord> ExecutionsForPlan(
      const std::string& trade_plan_id) const override;

 protected:
  /**
   * @brief 变更持久化钩子
   *
   * 在持有内部锁、校验通过之后调用；返回 false 时放弃本次写入。
   * 默认实现不做任何事。
   */
  virtual bool Journal(const std::string& kind,
                       const JsonValue& record,
                       std::string* out_error);
  /// 子类是否需要 Journal（为 false 时跳过记录编码）。
  virtual bool journaling() const { return false; }

  /// 回放一条日志记录（不触发 Journal，不做状态前进校验）。
  bool Restore(const std::string& kind,
               const JsonValue& record,
               std::string* out_error);

 private:
  /// 按插入顺序保存的表；upsert 保持原位置。
  template <typename Record>
  struct Table {
    std::vector<Record> rows;
    std::map<std::string, std::size_t> index;

    const Record* Find(const std::string& id) const {
      const auto it = index.find(id);
      return it == index.end() ? nullptr : &rows[it->second];
    }
    void Put(const Record& record) {
      const auto it = index.find(record.id);
      if (it != index.end()) {
        rows[it->second] = record;
        return;
      }
      index[record.id] = rows.size();
      rows.push_back(record);
    }
  };

  template <typename Record>
  bool Commit(const std::string& kind,
              const Record& record,
              Table<Record>* table,
              std::string* out_error);

  /// 为新记录分配 id 与创建时间。
  template <typename Record>
  void Stamp(Record* record) const;

  const Clock* clock_{nullptr};
  mutable std::mutex mutex_;
  Table<ExchangeAccountRecord> accounts_;
  Table<ModelConfigRecord> model_configs_;
  Table<StrategyRecord> strategies_;
  Table<TraderRecord> traders_;
  Table<MarketSnapshotRecord> snapshots_;
  Table<SignalRecord> signals_;
  Table<DecisionLogRecord> decisions_;
  Table<TradePlanRecord> trade_plans_;
  Table<ExecutionRecord> executions_;
};

}  // namespace trade_pilot
