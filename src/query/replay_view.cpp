#include "query/replay_view.h"

#include <initializer_list>
#include <utility>

#include "core/decimal.h"
#include "core/text.h"
#include "storage/record_codec.h"

namespace trade_pilot {

namespace {

JsonValue OptionalText(const std::string& value) {
  return value.empty() ? MakeJsonNull() : MakeJsonString(value);
}

JsonValue CappedError(const std::string& message) {
  if (message.empty()) {
    return MakeJsonNull();
  }
  return MakeJsonString(TruncateCodePoints(message, kReplayErrorMessageMax));
}

JsonValue TimestampOrNull(std::int64_t ts_ms) {
  return ts_ms > 0 ? MakeJsonString(FormatUtcIso8601(ts_ms)) : MakeJsonNull();
}

JsonValue Step(int step, const std::string& type, JsonValue data) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "step", MakeJsonInt(step));
  JsonSet(&out, "type", MakeJsonString(type));
  JsonSet(&out, "data", std::move(data));
  return out;
}

JsonValue SignalToView(const SignalRecord& signal) {
  JsonValue data = MakeJsonObject();
  JsonSet(&data, "id", MakeJsonString(signal.id));
  JsonSet(&data, "strategy_id", MakeJsonString(signal.strategy_id));
  JsonSet(&data, "symbol", MakeJsonString(signal.symbol));
  JsonSet(&data, "timeframe", MakeJsonString(signal.timeframe));
  JsonSet(&data, "side", MakeJsonString(ToString(signal.side)));
  JsonSet(&data, "score", MakeJsonString(DecimalToString(signal.score)));
  JsonSet(&data, "reason_summary", MakeJsonString(signal.reason_summary));
  JsonSet(&data, "created_at", TimestampOrNull(signal.created_at_ms));
  return data;
}

JsonValue ConfidenceText(const DecisionLogRecord& decision) {
  if (!decision.confidence.has_value()) {
    return MakeJsonNull();
  }
  Decimal confidence = 0;
  if (!ParseDecimal(std::to_string(*decision.confidence), &confidence)) {
    return MakeJsonNull();
  }
  return MakeJsonString(DecimalToString(confidence));
}

JsonValue RiskAllowedOrNull(const DecisionLogRecord& decision) {
  return decision.risk_allowed.has_value() ? MakeJsonBool(*decision.risk_allowed)
                                           : MakeJsonNull();
}

JsonValue DecisionToView(const DecisionLogRecord& decision) {
  JsonValue data = MakeJsonObject();
  JsonSet(&data, "id", MakeJsonString(decision.id));
  JsonSet(&data, "trader_id", MakeJsonString(decision.trader_id));
  JsonSet(&data, "client_order_id", MakeJsonString(decision.client_order_id));
  JsonSet(&data, "status", MakeJsonString(ToString(decision.status)));
  JsonSet(&data, "model_provider", MakeJsonString(decision.model_provider));
  JsonSet(&data, "model_name", MakeJsonString(decision.model_name));
  JsonSet(&data, "confidence", ConfidenceText(decision));
  JsonSet(&data, "reason_summary", MakeJsonString(decision.reason_summary));
  JsonSet(&data, "evidence", SanitizeEvidence(decision.evidence));
  JsonSet(&data, "trade_plan", decision.trade_plan);
  JsonSet(&data, "tokens_used",
          decision.tokens_used.has_value() ? MakeJsonInt(*decision.tokens_used)
                                           : MakeJsonNull());
  JsonSet(&data, "execution_error", CappedError(decision.execution_error));
  JsonSet(&data, "is_paper", MakeJsonBool(decision.is_paper));
  JsonSet(&data, "created_at", TimestampOrNull(decision.created_at_ms));
  return data;
}

JsonValue RiskReportToView(const DecisionLogRecord& decision) {
  JsonValue reasons = MakeJsonArray();
  for (const std::string& reason : decision.risk_reasons) {
    JsonPush(&reasons, MakeJsonString(reason));
  }
  JsonValue data = MakeJsonObject();
  JsonSet(&data, "allowed", RiskAllowedOrNull(decision));
  JsonSet(&data, "reasons", std::move(reasons));
  JsonSet(&data, "normalized_plan", decision.normalized_plan);
  return data;
}

JsonValue TradePlanToView(const TradePlanRecord& plan) {
  JsonValue data = MakeJsonObject();
  JsonSet(&data, "id", MakeJsonString(plan.id));
  JsonSet(&data, "exchange_account_id", MakeJsonString(plan.exchange_account_id));
  JsonSet(&data, "client_order_id", MakeJsonString(plan.client_order_id));
  JsonSet(&data, "symbol", MakeJsonString(plan.symbol));
  JsonSet(&data, "side", MakeJsonString(ToString(plan.side)));
  JsonSet(&data, "quantity", MakeJsonString(DecimalToString(plan.quantity)));
  JsonSet(&data, "entry_price", OptionalText(OptionalDecimalToString(plan.entry_price)));
  JsonSet(&data, "tp_price", OptionalText(OptionalDecimalToString(plan.tp_price)));
  JsonSet(&data, "sl_price", OptionalText(OptionalDecimalToString(plan.sl_price)));
  JsonSet(&data, "leverage", MakeJsonString(std::to_string(plan.leverage)));
  JsonSet(&data, "status", MakeJsonString(ToString(plan.status)));
  JsonSet(&data, "is_paper", MakeJsonBool(plan.is_paper));
  JsonSet(&data, "error_message", CappedError(plan.error_message));
  JsonSet(&data, "created_at", TimestampOrNull(plan.created_at_ms));
  return data;
}

JsonValue ExecutionToView(const ExecutionRecord& execution) {
  JsonValue data = MakeJsonObject();
  JsonSet(&data, "id", MakeJsonString(execution.id));
  JsonSet(&data, "order_type", MakeJsonString(ToString(execution.order_type)));
  JsonSet(&data, "exchange_order_id", OptionalText(execution.exchange_order_id));
  JsonSet(&data, "client_order_id", MakeJsonString(execution.client_order_id));
  JsonSet(&data, "symbol", MakeJsonString(execution.symbol));
  JsonSet(&data, "side", MakeJsonString(ToString(execution.side)));
  JsonSet(&data, "quantity", MakeJsonString(DecimalToString(execution.quantity)));
  JsonSet(&data, "price", OptionalText(OptionalDecimalToString(execution.price)));
  JsonSet(&data, "status", MakeJsonString(ToString(execution.status)));
  JsonSet(&data, "is_paper", MakeJsonBool(execution.is_paper));
  JsonSet(&data, "error_message", CappedError(execution.error_message));
  JsonSet(&data, "created_at", TimestampOrNull(execution.created_at_ms));
  return data;
}

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

}  // namespace

JsonValue SanitizeOhlcv(const JsonValue& ohlcv, std::size_t limit) {
  JsonValue out = MakeJsonObject();
  if (ohlcv.type != JsonType::kObject || ohlcv.object_value.empty()) {
    return out;
  }
  const JsonValue tail = OhlcvTail(ohlcv, limit);
  for (const char* key : {"open", "high", "low", "close", "volume"}) {
    const JsonValue* series = JsonObjectField(&tail, key);
    if (series != nullptr && series->type == JsonType::kArray) {
      JsonSet(&out, key, *series);
    } else {
      JsonSet(&out, key, MakeJsonArray());
    }
  }
  return out;
}

JsonValue SanitizeEvidence(const JsonValue& evidence) {
  if (evidence.type != JsonType::kObject) {
    return MakeJsonNull();
  }
  JsonValue out = MakeJsonObject();
  const JsonValue* signals = JsonObjectField(&evidence, "signals");
  JsonSet(&out, "signals",
          signals != nullptr && signals->type == JsonType::kArray ? *signals
                                                                  : MakeJsonArray());
  for (const char* key : {"indicators", "key_levels"}) {
    const JsonValue* field = JsonObjectField(&evidence, key);
    JsonSet(&out, key,
            field != nullptr && field->type == JsonType::kObject ? *field
                                                                 : MakeJsonObject());
  }
  return out;
}

JsonValue BuildReplayChain(const DecisionLogRecord* decision,
                           const SignalRecord* signal,
                           const MarketSnapshotRecord* snapshot,
                           const TradePlanRecord* trade_plan,
                           const std::vector<ExecutionRecord>& executions,
                           std::int64_t generated_at_ms) {
  JsonValue chain = MakeJsonArray();
  if (signal != nullptr) {
    JsonPush(&chain, Step(1, "signal", SignalToView(*signal)));
  }
  if (snapshot != nullptr) {
    JsonValue data = MakeJsonObject();
    JsonSet(&data, "id", MakeJsonString(snapshot->id));
    JsonSet(&data, "exchange", MakeJsonString(snapshot->exchange));
    JsonSet(&data, "symbol", MakeJsonString(snapshot->symbol));
    JsonSet(&data, "timeframe", MakeJsonString(snapshot->timeframe));
    JsonSet(&data, "timestamp", TimestampOrNull(snapshot->timestamp_ms));
    JsonSet(&data, "ohlcv_summary", SanitizeOhlcv(snapshot->ohlcv));
    JsonSet(&data, "indicators", snapshot->indicators);
    JsonPush(&chain, Step(2, "market_snapshot", std::move(data)));
  }
  if (decision != nullptr) {
    JsonPush(&chain, Step(3, "ai_decision", DecisionToView(*decision)));
    JsonPush(&chain, Step(4, "risk_report", RiskReportToView(*decision)));
  }
  if (trade_plan != nullptr) {
    JsonPush(&chain, Step(5, "trade_plan", TradePlanToView(*trade_plan)));
  }
  for (std::size_t i = 0; i < executions.size(); ++i) {
    JsonPush(&chain, Step(6 + static_cast<int>(i), "execution",
                          ExecutionToView(executions[i])));
  }

  JsonValue out = MakeJsonObject();
  JsonSet(&out, "generated_at", MakeJsonString(FormatUtcIso8601(generated_at_ms)));
  JsonSet(&out, "chain", std::move(chain));
  return out;
}

ReplayView::ReplayView(const TradeStore* store, const Clock* clock)
    : store_(store), clock_(clock != nullptr ? clock : &DefaultClock()) {}

JsonValue ReplayView::ChainForDecision(const DecisionLogRecord* decision,
                                       const TradePlanRecord* known_plan) const {
  SignalRecord signal;
  MarketSnapshotRecord snapshot;
  bool has_signal = false;
  bool has_snapshot = false;
  if (decision != nullptr && !decision->signal_id.empty()) {
    has_signal = store_->FindSignal(decision->signal_id, &signal);
    if (has_signal && !signal.snapshot_id.empty()) {
      has_snapshot = store_->FindMarketSnapshot(signal.snapshot_id, &snapshot);
    }
  }

  TradePlanRecord plan;
  bool has_plan = false;
  if (known_plan != nullptr) {
    plan = *known_plan;
    has_plan = true;
  } else if (decision != nullptr && !decision->trade_plan_id.empty()) {
    has_plan = store_->FindTradePlan(decision->trade_plan_id, &plan);
  }
  std::vector<ExecutionRecord> executions;
  if (has_plan) {
    executions = store_->ExecutionsForPlan(plan.id);
  }

  return BuildReplayChain(decision, has_signal ? &signal : nullptr,
                          has_snapshot ? &snapshot : nullptr,
                          has_plan ? &plan : nullptr, executions,
                          clock_->NowMs());
}

bool ReplayView::ReplayForDecision(const std::string& decision_id,
                                   JsonValue* out_chain,
                                   std::string* out_error) const {
  DecisionLogRecord decision;
  if (!store_->FindDecision(decision_id, &decision)) {
    SetError(out_error, "Decision not found");
    return false;
  }
  *out_chain = ChainForDecision(&decision, nullptr);
  return true;
}

bool ReplayView::ReplayForTradePlan(const std::string& trade_plan_id,
                                    JsonValue* out_chain,
                                    std::string* out_error) const {
  TradePlanRecord plan;
  if (!store_->FindTradePlan(trade_plan_id, &plan)) {
    SetError(out_error, "Trade plan not found");
    return false;
  }
  DecisionLogRecord decision;
  const bool has_decision = store_->FindDecisionByTradePlan(trade_plan_id, &decision);
  *out_chain = ChainForDecision(has_decision ? &decision : nullptr, &plan);
  return true;
}

bool ReplayView::ReplayForSignal(const std::string& signal_id,
                                 JsonValue* out_view,
                                 std::string* out_error) const {
  SignalRecord signal;
  if (!store_->FindSignal(signal_id, &signal)) {
    SetError(out_error, "Signal not found");
    return false;
  }

  JsonValue view = MakeJsonObject();
  JsonSet(&view, "signal", SignalToView(signal));

  MarketSnapshotRecord snapshot;
  if (!signal.snapshot_id.empty() &&
      store_->FindMarketSnapshot(signal.snapshot_id, &snapshot)) {
    JsonValue market = MakeJsonObject();
    JsonSet(&market, "ohlcv_summary", SanitizeOhlcv(snapshot.ohlcv));
    JsonSet(&market, "indicators", snapshot.indicators);
    JsonSet(&view, "market_snapshot", std::move(market));
  } else {
    JsonSet(&view, "market_snapshot", MakeJsonNull());
  }

  JsonValue decisions = MakeJsonArray();
  for (const DecisionLogRecord& decision : store_->DecisionsForSignal(signal_id)) {
    TradePlanRecord plan;
    const bool has_plan = !decision.trade_plan_id.empty() &&
                          store_->FindTradePlan(decision.trade_plan_id, &plan);
    JsonValue item = MakeJsonObject();
    JsonSet(&item, "id", MakeJsonString(decision.id));
    JsonSet(&item, "trader_id", MakeJsonString(decision.trader_id));
    JsonSet(&item, "status", MakeJsonString(ToString(decision.status)));
    JsonSet(&item, "confidence", ConfidenceText(decision));
    JsonSet(&item, "reason_summary", MakeJsonString(decision.reason_summary));
    JsonSet(&item, "risk_allowed", RiskAllowedOrNull(decision));
    JsonSet(&item, "trade_plan_id", OptionalText(decision.trade_plan_id));
    JsonSet(&item, "trade_status",
            has_plan ? MakeJsonString(ToString(plan.status)) : MakeJsonNull());
    JsonSet(&item, "is_paper", MakeJsonBool(decision.is_paper));
    JsonPush(&decisions, std::move(item));
  }
  JsonSet(&view, "decisions", std::move(decisions));
  *out_view = std::move(view);
  return true;
}

JsonValue ReplayView::ListDecisions(const DecisionFilter& filter) const {
  JsonValue out = MakeJsonArray();
  for (const DecisionLogRecord& decision : store_->QueryDecisions(filter)) {
    JsonValue item = DecisionToView(decision);
    JsonSet(&item, "signal_id", MakeJsonString(decision.signal_id));
    JsonSet(&item, "risk_allowed", RiskAllowedOrNull(decision));
    JsonSet(&item, "trade_plan_id", OptionalText(decision.trade_plan_id));
    JsonPush(&out, std::move(item));
  }
  return out;
}

JsonValue ReplayView::ListTradePlans(const TradePlanFilter& filter) const {
  JsonValue out = MakeJsonArray();
  for (const TradePlanRecord& plan : store_->QueryTradePlans(filter)) {
    JsonPush(&out, TradePlanToView(plan));
  }
  return out;
}

JsonValue ReplayView::ListExecutions(const std::string& trade_plan_id) const {
  JsonValue out = MakeJsonArray();
  for (const ExecutionRecord& execution : store_->ExecutionsForPlan(trade_plan_id)) {
    JsonPush(&out, ExecutionToView(execution));
  }
  return out;
}

}  // namespace trade_pilot
