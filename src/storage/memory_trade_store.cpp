#include "storage/memory_trade_store.h"

#include <algorithm>
#include <set>

#include "core/crypto.h"
#include "storage/record_codec.h"

namespace trade_pilot {

namespace {

bool SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

template <typename Record>
bool CopyOut(const Record* found, Record* out_record) {
  if (found == nullptr) {
    return false;
  }
  if (out_record != nullptr) {
    *out_record = *found;
  }
  return true;
}

/// 按创建时间倒序；同一时间戳时后插入的在前。
template <typename Record>
std::vector<Record> NewestFirst(std::vector<Record> rows) {
  std::reverse(rows.begin(), rows.end());
  std::stable_sort(rows.begin(), rows.end(),
                   [](const Record& lhs, const Record& rhs) {
                     return lhs.created_at_ms > rhs.created_at_ms;
                   });
  return rows;
}

}  // namespace

MemoryTradeStore::MemoryTradeStore(const Clock* clock)
    : clock_(clock != nullptr ? clock : &DefaultClock()) {}

bool MemoryTradeStore::Journal(const std::string& /*kind*/,
                               const JsonValue& /*record*/,
                               std::string* /*out_error*/) {
  return true;
}

template <typename Record>
bool MemoryTradeStore::Commit(const std::string& kind,
                              const Record& record,
                              Table<Record>* table,
                              std::string* out_error) {
  if (journaling() && !Journal(kind, RecordToJson(record), out_error)) {
    return false;
  }
  table->Put(record);
  return true;
}

template <typename Record>
void MemoryTradeStore::Stamp(Record* record) const {
  if (record->id.empty()) {
    record->id = GenerateUuid();
  }
  if (record->created_at_ms == 0) {
    record->created_at_ms = clock_->NowMs();
  }
}

bool MemoryTradeStore::UpsertExchangeAccount(ExchangeAccountRecord* record,
                                             std::string* out_error) {
  if (record == nullptr) {
    return SetError(out_error, "record 不能为空");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  Stamp(record);
  return Commit("exchange_account", *record, &accounts_, out_error);
}

bool MemoryTradeStore::FindExchangeAccount(
    const std::string& id,
    ExchangeAccountRecord* out_record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CopyOut(accounts_.Find(id), out_record);
}

std::vector<ExchangeAccountRecord> MemoryTradeStore::ActiveExchangeAccounts()
    const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ExchangeAccountRecord> out;
  for (const auto& account : accounts_.rows) {
    if (account.status == "active") {
      out.push_back(account);
    }
  }
  return out;
}

bool MemoryTradeStore::UpsertModelConfig(ModelConfigRecord* record,
                                         std::string* out_error) {
  if (record == nullptr) {
    return SetError(out_error, "record 不能为空");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  Stamp(record);
  return Commit("model_config", *record, &model_configs_, out_error);
}

bool MemoryTradeStore::FindModelConfig(const std::string& id,
                                       ModelConfigRecord* out_record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CopyOut(model_configs_.Find(id), out_record);
}

bool MemoryTradeStore::UpsertStrategy(StrategyRecord* record,
                                      std::string* out_error) {
  if (record == nullptr) {
    return SetError(out_error, "record 不能为空");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  Stamp(record);
  return Commit("strategy", *record, &strategies_, out_error);
}

bool MemoryTradeStore::FindStrategy(const std::string& id,
                                    StrategyRecord* out_record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CopyOut(strategies_.Find(id), out_record);
}

bool MemoryTradeStore::UpsertTrader(TraderRecord* record,
                                    std::string* out_error) {
  if (record == nullptr) {
    return SetError(out_error, "record 不能为空");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  Stamp(record);
  return Commit("trader", *record, &traders_, out_error);
}

bool MemoryTradeStore::FindTrader(const std::string& id,
                                  TraderRecord* out_record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CopyOut(traders_.Find(id), out_record);
}

std::vector<TraderRecord> MemoryTradeStore::EnabledTraders() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TraderRecord> out;
  for (const auto& trader : traders_.rows) {
    if (trader.enabled) {
      out.push_back(trader);
    }
  }
  return out;
}

bool MemoryTradeStore::InsertMarketSnapshot(MarketSnapshotRecord* record,
                                            std::string* out_error) {
  if (record == nullptr) {
    return SetError(out_error, "record 不能为空");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  Stamp(record);
  if (snapshots_.Find(record->id) != nullptr) {
    return SetError(out_error, "行情快照已存在: " + record->id);
  }
  return Commit("market_snapshot", *record, &snapshots_, out_error);
}

bool MemoryTradeStore::FindMarketSnapshot(
    const std::string& id,
    MarketSnapshotRecord* out_record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CopyOut(snapshots_.Find(id), out_record);
}

bool MemoryTradeStore::InsertSignal(SignalRecord* record,
                                    std::string* out_error) {
  if (record == nullptr) {
    return SetError(out_error, "record 不能为空");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  Stamp(record);
  if (signals_.Find(record->id) != nullptr) {
    return SetError(out_error, "信号已存在且不可修改: " + record->id);
  }
  return Commit("signal", *record, &signals_, out_error);
}

bool MemoryTradeStore::FindSignal(const std::string& id,
                                  SignalRecord* out_record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CopyOut(signals_.Find(id), out_record);
}

std::vector<SignalRecord> MemoryTradeStore::UnconsumedSignals(
    const std::string& trader_id,
    const std::string& strategy_id,
    std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> consumed;
  for (const auto& decision : decisions_.rows) {
    if (decision.trader_id == trader_id && !decision.signal_id.empty()) {
      consumed.insert(decision.signal_id);
    }
  }
  std::vector<SignalRecord> candidates;
  for (const auto& signal : signals_.rows) {
    if (signal.strategy_id == strategy_id && consumed.count(signal.id) == 0) {
      candidates.push_back(signal);
    }
  }
  candidates = NewestFirst(std::move(candidates));
  if (candidates.size() > limit) {
    candidates.resize(limit);
  }
  return candidates;
}

bool MemoryTradeStore::InsertDecision(DecisionLogRecord* record,
                                      std::string* out_error) {
  if (record == nullptr) {
    return SetError(out_error, "record 不能为空");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& existing : decisions_.rows) {
    if (existing.client_order_id == record->client_order_id) {
      return SetError(out_error,
                      "决策日志 client_order_id 重复: " + record->client_order_id);
    }
  }
  Stamp(record);
  return Commit("decision_log", *record, &decisions_, out_error);
}

bool MemoryTradeStore::UpdateDecision(const DecisionLogRecord& record,
                                      std::string* out_error) {
  std::lock_guard<std::mutex> lock(mutex_);
  const DecisionLogRecord* existing = decisions_.Find(record.id);
  if (existing == nullptr) {
    return SetError(out_error, "决策日志不存在: " + record.id);
  }
  if (existing->client_order_id != record.client_order_id) {
    return SetError(out_error, "决策日志 client_order_id 不可修改");
  }
  if (record.risk_allowed.has_value() && !*record.risk_allowed &&
      !record.trade_plan_id.empty()) {
    return SetError(out_error, "风控拒绝的决策不能关联交易计划");
  }
  return Commit("decision_log", record, &decisions_, out_error);
}

bool MemoryTradeStore::FindDecision(const std::string& id,
                                    DecisionLogRecord* out_record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CopyOut(decisions_.Find(id), out_record);
}

bool MemoryTradeStore::FindDecisionByClientOrderId(
    const std::string& client_order_id,
    DecisionLogRecord* out_record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& decision : decisions_.rows) {
    if (decision.client_order_id == client_order_id) {
      return CopyOut(&decision, out_record);
    }
  }
  return false;
}

bool MemoryTradeStore::FindDecisionByTradePlan(
    const std::string& trade_plan_id,
    DecisionLogRecord* out_record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& decision : decisions_.rows) {
    if (!trade_plan_id.empty() && decision.trade_plan_id == trade_plan_id) {
      return CopyOut(&decision, out_record);
    }
  }
  return false;
}

std::vector<DecisionLogRecord> MemoryTradeStore::DecisionsForSignal(
    const std::string& signal_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DecisionLogRecord> out;
  for (const auto& decision : decisions_.rows) {
    if (decision.signal_id == signal_id) {
      out.push_back(decision);
    }
  }
  return out;
}

std::vector<DecisionLogRecord> MemoryTradeStore::RecentExecutedDecisions(
    const std::string& trader_id,
    std::int64_t since_ms) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DecisionLogRecord> out;
  for (const auto& decision : decisions_.rows) {
    if (decision.trader_id == trader_id &&
        decision.status == DecisionStatus::kExecuted &&
        decision.created_at_ms > since_ms) {
      out.push_back(decision);
    }
  }
  return out;
}

std::vector<DecisionLogRecord> MemoryTradeStore::QueryDecisions(
    const DecisionFilter& filter) const {
  std::vector<DecisionLogRecord> matched;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& decision : decisions_.rows) {
      if (!filter.trader_id.empty() && decision.trader_id != filter.trader_id) {
        continue;
      }
      if (filter.status.has_value() && decision.status != *filter.status) {
        continue;
      }
      if (filter.is_paper.has_value() && decision.is_paper != *filter.is_paper) {
        continue;
      }
      matched.push_back(decision);
    }
  }
  matched = NewestFirst(std::move(matched));
  if (matched.size() > filter.limit) {
    matched.resize(filter.limit);
  }
  return matched;
}

bool MemoryTradeStore::InsertTradePlan(TradePlanRecord* record,
                                       std::string* out_error) {
  if (record == nullptr) {
    return SetError(out_error, "record 不能为空");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& existing : trade_plans_.rows) {
    if (existing.client_order_id == record->client_order_id) {
      return SetError(out_error,
                      "交易计划 client_order_id 重复: " + record->client_order_id);
    }
  }
  Stamp(record);
  record->updated_at_ms = record->created_at_ms;
  return Commit("trade_plan", *record, &trade_plans_, out_error);
}

bool MemoryTradeStore::UpdateTradePlan(const TradePlanRecord& record,
                                       std::string* out_error) {
  std::lock_guard<std::mutex> lock(mutex_);
  const TradePlanRecord* existing = trade_plans_.Find(record.id);
  if (existing == nullptr) {
    return SetError(out_error, "交易计划不存在: " + record.id);
  }
  if (!IsAllowedTransition(existing->status, record.status)) {
    return SetError(out_error, std::string("交易计划状态不允许回退: ") +
                                   ToString(existing->status) + " -> " +
                                   ToString(record.status));
  }
  TradePlanRecord updated = record;
  updated.client_order_id = existing->client_order_id;
  updated.is_paper = existing->is_paper;
  updated.created_at_ms = existing->created_at_ms;
  updated.updated_at_ms = clock_->NowMs();
  return Commit("trade_plan", updated, &trade_plans_, out_error);
}

bool MemoryTradeStore::FindTradePlan(const std::string& id,
                                     TradePlanRecord* out_record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CopyOut(trade_plans_.Find(id), out_record);
}

std::vector<TradePlanRecord> MemoryTradeStore::NonTerminalLivePlans(
    const std::string& exchange_account_id,
    std::int64_t since_ms,
    std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TradePlanRecord> out;
  for (const auto& plan : trade_plans_.rows) {
    if (out.size() >= limit) {
      break;
    }
    if (plan.exchange_account_id == exchange_account_id && !plan.is_paper &&
        plan.created_at_ms > since_ms && !IsTerminal(plan.status)) {
      out.push_back(plan);
    }
  }
  return out;
}

std::vector<TradePlanRecord> MemoryTradeStore::QueryTradePlans(
    const TradePlanFilter& filter) const {
  std::vector<TradePlanRecord> matched;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& plan : trade_plans_.rows) {
      if (!filter.exchange_account_id.empty() &&
          plan.exchange_account_id != filter.exchange_account_id) {
        continue;
      }
      if (filter.status.has_value() && plan.status != *filter.status) {
        continue;
      }
      if (filter.is_paper.has_value() && plan.is_paper != *filter.is_paper) {
        continue;
      }
      matched.push_back(plan);
    }
  }
  matched = NewestFirst(std::move(matched));
  if (matched.size() > filter.limit) {
    matched.resize(filter.limit);
  }
  return matched;
}

bool MemoryTradeStore::InsertExecution(ExecutionRecord* record,
                                       std::string* out_error) {
  if (record == nullptr) {
    return SetError(out_error, "record 不能为空");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (trade_plans_.Find(record->trade_plan_id) == nullptr) {
    return SetError(out_error,
                    "执行记录引用的交易计划不存在: " + record->trade_plan_id);
  }
  if (!record->exchange_order_id.empty()) {
    for (const auto& existing : executions_.rows) {
      if (existing.exchange_order_id == record->exchange_order_id) {
        return SetError(out_error, "exchange_order_id 重复: " +
                                       record->exchange_order_id);
      }
    }
  }
  Stamp(record);
  record->updated_at_ms = record->created_at_ms;
  return Commit("execution", *record, &executions_, out_error);
}

bool MemoryTradeStore::UpdateExecution(const ExecutionRecord& record,
                                       std::string* out_error) {
  std::lock_guard<std::mutex> lock(mutex_);
  const ExecutionRecord* existing = executions_.Find(record.id);
  if (existing == nullptr) {
    return SetError(out_error, "执行记录不存在: " + record.id);
  }
  ExecutionRecord updated = record;
  updated.trade_plan_id = existing->trade_plan_id;
  updated.is_paper = existing->is_paper;
  updated.created_at_ms = existing->created_at_ms;
  updated.updated_at_ms = clock_->NowMs();
  return Commit("execution", updated, &executions_, out_error);
}

std::vector<ExecutionRecord> MemoryTradeStore::ExecutionsForPlan(
    const std::string& trade_plan_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ExecutionRecord> out;
  for (const auto& execution : executions_.rows) {
    if (execution.trade_plan_id == trade_plan_id) {
      out.push_back(execution);
    }
  }
  return out;
}

bool MemoryTradeStore::Restore(const std::string& kind,
                               const JsonValue& json,
                               std::string* out_error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (kind == "exchange_account") {
    ExchangeAccountRecord record;
    if (!RecordFromJson(json, &record, out_error)) {
      return false;
    }
    accounts_.Put(record);
    return true;
  }
  if (kind == "model_config") {
    ModelConfigRecord record;
    if (!RecordFromJson(json, &record, out_error)) {
      return false;
    }
    model_configs_.Put(record);
    return true;
  }
  if (kind == "strategy") {
    StrategyRecord record;
    if (!RecordFromJson(json, &record, out_error)) {
      return false;
    }
    strategies_.Put(record);
    return true;
  }
  if (kind == "trader") {
    TraderRecord record;
    if (!RecordFromJson(json, &record, out_error)) {
      return false;
    }
    traders_.Put(record);
    return true;
  }
  if (kind == "market_snapshot") {
    MarketSnapshotRecord record;
    if (!RecordFromJson(json, &record, out_error)) {
      return false;
    }
    snapshots_.Put(record);
    return true;
  }
  if (kind == "signal") {
    SignalRecord record;
    if (!RecordFromJson(json, &record, out_error)) {
      return false;
    }
    signals_.Put(record);
    return true;
  }
  if (kind == "decision_log") {
    DecisionLogRecord record;
    if (!RecordFromJson(json, &record, out_error)) {
      return false;
    }
    decisions_.Put(record);
    return true;
  }
  if (kind == "trade_plan") {
    TradePlanRecord record;
    if (!RecordFromJson(json, &record, out_error)) {
      return false;
    }
    trade_plans_.Put(record);
    return true;
  }
  if (kind == "execution") {
    ExecutionRecord record;
    if (!RecordFromJson(json, &record, out_error)) {
      return false;
    }
    executions_.Put(record);
    return true;
  }
  return SetError(out_error, "未知记录类型: " + kind);
}

}  // namespace trade_pilot
