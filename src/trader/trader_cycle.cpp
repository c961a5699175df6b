#include "trader/trader_cycle.h"

#include <exception>
#include <utility>

#include "ai/prompt_builder.h"
#include "ai/trade_plan_contract.h"
#include "core/json_utils.h"
#include "core/log.h"
#include "core/text.h"
#include "lock/distributed_mutex.h"
#include "storage/record_codec.h"
#include "trader/trade_executor.h"

namespace trade_pilot {

namespace {

constexpr std::int64_t kRecentTradeWindowMs = 24LL * 60 * 60 * 1000;
constexpr std::size_t kPromptOhlcvPoints = 10;
constexpr std::size_t kExecutionErrorMax = 500;

std::optional<Decimal> PositiveDecimalField(const JsonValue& object,
                                            const std::string& key) {
  const std::optional<Decimal> value =
      JsonAsDecimal(JsonObjectField(&object, key));
  if (!value.has_value() || *value <= 0) {
    return std::nullopt;
  }
  return value;
}

std::string JoinReasons(const std::vector<std::string>& items) {
  std::string joined;
  for (const std::string& item : items) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += item;
  }
  return joined;
}

std::vector<RecentTrade> RecentTradesFromDecisions(
    const std::vector<DecisionLogRecord>& decisions) {
  std::vector<RecentTrade> trades;
  for (const DecisionLogRecord& decision : decisions) {
    if (decision.normalized_plan.type != JsonType::kObject) {
      continue;
    }
    const std::optional<std::string> symbol =
        JsonAsString(JsonObjectField(&decision.normalized_plan, "symbol"));
    const std::optional<std::string> side_text =
        JsonAsString(JsonObjectField(&decision.normalized_plan, "side"));
    PositionSide side = PositionSide::kLong;
    if (!symbol.has_value() || !side_text.has_value() ||
        !ParsePositionSide(*side_text, &side)) {
      continue;
    }
    trades.push_back(RecentTrade{
        .symbol = *symbol,
        .side = side,
        .created_at_ms = decision.created_at_ms,
    });
  }
  return trades;
}

void AddTokenUsage(const ModelResponse& response, DecisionLogRecord* decision) {
  if (!response.usage.has_value()) {
    return;
  }
  decision->tokens_used = decision->tokens_used.value_or(0) +
                          response.usage->input_tokens +
                          response.usage->output_tokens;
}

}  // namespace

RiskProfile BuildRiskProfile(const TraderRecord& trader,
                             const StrategyRecord& strategy,
                             const std::optional<SymbolInfo>& symbol_info) {
  const JsonValue& risk = strategy.risk_json;
  RiskProfile profile;
  profile.max_leverage = static_cast<int>(
      JsonAsInt64(JsonObjectField(&risk, "max_leverage")).value_or(10));
  profile.max_position_notional =
      PositiveDecimalField(risk, "max_position_notional");
  profile.max_position_qty = PositiveDecimalField(risk, "max_position_qty");
  profile.max_concurrent_positions =
      trader.max_concurrent_positions > 0 ? trader.max_concurrent_positions : 3;
  profile.cooldown_seconds =
      strategy.cooldown_seconds > 0 ? strategy.cooldown_seconds : 3600;
  profile.daily_loss_cap = trader.daily_loss_cap;

  profile.price_precision = symbol_info.has_value() ? symbol_info->price_precision : 2;
  profile.quantity_precision = symbol_info.has_value() ? symbol_info->qty_precision : 3;
  if (symbol_info.has_value()) {
    profile.min_quantity = symbol_info->min_qty;
    profile.min_notional = symbol_info->min_notional;
  }
  const std::optional<std::int64_t> price_precision =
      JsonAsInt64(JsonObjectField(&risk, "price_precision"));
  if (price_precision.has_value()) {
    profile.price_precision = static_cast<int>(*price_precision);
  }
  const std::optional<std::int64_t> quantity_precision =
      JsonAsInt64(JsonObjectField(&risk, "quantity_precision"));
  if (quantity_precision.has_value()) {
    profile.quantity_precision = static_cast<int>(*quantity_precision);
  }
  const std::optional<Decimal> min_quantity =
      JsonAsDecimal(JsonObjectField(&risk, "min_quantity"));
  if (min_quantity.has_value()) {
    profile.min_quantity = *min_quantity;
  }
  const std::optional<Decimal> min_notional =
      JsonAsDecimal(JsonObjectField(&risk, "min_notional"));
  if (min_notional.has_value()) {
    profile.min_notional = *min_notional;
  }
  return profile;
}

/// 一次周期内共享的只读上下文（适配器随周期结束析构）。
struct TraderCycle::CycleContext {
  TraderRecord trader;
  StrategyRecord strategy;
  ExchangeAccountRecord account;
  ModelEndpoint model_endpoint;
  std::unique_ptr<ExchangeAdapter> adapter;
  bool is_paper{true};
};

TraderCycle::TraderCycle(TradeStore* store,
                         LockStore* lock_store,
                         ModelRouter* model_router,
                         const RiskManager* risk_manager,
                         const SecretsCipher* cipher,
                         ExchangeAdapterFactory adapter_factory,
                         TraderCycleOptions options,
                         const Clock* clock,
                         const Sleeper* sleeper)
    : store_(store),
      lock_store_(lock_store),
      model_router_(model_router),
      risk_manager_(risk_manager),
      cipher_(cipher),
      adapter_factory_(std::move(adapter_factory)),
      options_(std::move(options)),
      clock_(clock != nullptr ? clock : &DefaultClock()),
      sleeper_(sleeper != nullptr ? sleeper : &DefaultSleeper()) {}

CycleSummary TraderCycle::Run(const std::string& trader_id) {
  CycleSummary summary;
  summary.trader_id = trader_id;

  TraderRecord trader;
  if (!store_->FindTrader(trader_id, &trader) || !trader.enabled) {
    return summary;
  }
  summary.trader_found = true;

  DistributedMutex mutex(lock_store_, TraderLockName(trader_id),
                         options_.lock_ttl_ms, sleeper_);
  ScopedMutexLock guard(&mutex, LockMode::kBlocking, options_.lock_timeout_ms,
                        options_.lock_poll_interval_ms);
  if (!guard.owns_lock()) {
    summary.skipped_lock_contention = true;
    LogInfo("跳过 trader 周期，锁被占用: event=lock_contention, trader_id=" +
            trader_id + ", key=" + mutex.key() +
            (mutex.last_error().empty() ? "" : ", store_error=" + mutex.last_error()));
    return summary;
  }

  RunLocked(trader, &mutex, &summary);
  LogInfo("trader 周期完成: trader_id=" + trader_id +
          ", signals=" + std::to_string(summary.signals_fetched) +
          ", decisions=" + std::to_string(summary.decisions_created) +
          ", executed=" + std::to_string(summary.executed) +
          ", blocked=" + std::to_string(summary.blocked) +
          ", failed=" + std::to_string(summary.failed));
  return summary;
}

void TraderCycle::RunLocked(const TraderRecord& trader,
                            DistributedMutex* mutex,
                            CycleSummary* summary) {
  std::string error;
  if (!store_->Refresh(&error)) {
    ++summary->errors;
    LogError("存储同步失败，周期中止: trader_id=" + trader.id + ", error=" + error);
    return;
  }
  const std::vector<SignalRecord> signals = store_->UnconsumedSignals(
      trader.id, trader.strategy_id, options_.signal_batch_size);
  summary->signals_fetched = signals.size();
  if (signals.empty()) {
    return;
  }

  CycleContext context;
  context.trader = trader;
  context.is_paper = trader.mode == TraderMode::kPaper || options_.paper_trading;
  if (!store_->FindStrategy(trader.strategy_id, &context.strategy)) {
    LogError("trader 周期中止，策略不存在: trader_id=" + trader.id +
             ", strategy_id=" + trader.strategy_id);
    return;
  }

  ModelConfigRecord model_config;
  if (!store_->FindModelConfig(trader.model_config_id, &model_config)) {
    LogError("trader 周期中止，模型配置不存在: trader_id=" + trader.id +
             ", model_config_id=" + trader.model_config_id);
    return;
  }
  context.model_endpoint.provider = model_config.provider;
  context.model_endpoint.model = model_config.model_name;
  context.model_endpoint.base_url = model_config.base_url;
  if (!cipher_->Decrypt(model_config.api_key_encrypted,
                        &context.model_endpoint.api_key, &error)) {
    LogError("trader 周期中止，模型密钥解密失败: trader_id=" + trader.id +
             ", error=" + error);
    return;
  }

  if (store_->FindExchangeAccount(trader.exchange_account_id, &context.account)) {
    ExchangeCredentials credentials;
    if (cipher_->Decrypt(context.account.api_key_encrypted, &credentials.api_key,
                         &error) &&
        cipher_->Decrypt(context.account.api_secret_encrypted,
                         &credentials.api_secret, &error)) {
      context.adapter = adapter_factory_(context.account, credentials, &error);
    }
    if (context.adapter == nullptr) {
      LogWarn("交易所适配器不可用: trader_id=" + trader.id +
              ", account_id=" + context.account.id + ", error=" + error);
    }
  } else {
    LogWarn("交易所账户不存在: trader_id=" + trader.id +
            ", account_id=" + trader.exchange_account_id);
  }
  if (context.adapter == nullptr && !context.is_paper) {
    LogError("trader 周期中止，实盘缺少交易所适配器: trader_id=" + trader.id);
    return;
  }

  for (const SignalRecord& signal : signals) {
    // 模型调用可能超过锁 TTL：续期失败说明锁已过期或被他人持有，剩余信号交给持锁者。
    if (!mutex->Extend()) {
      summary->lock_lost = true;
      LogWarn("trader 锁已失效，停止处理剩余信号: trader_id=" + trader.id +
              ", key=" + mutex->key() + ", next_signal_id=" + signal.id);
      break;
    }
    if (!store_->Refresh(&error)) {
      ++summary->errors;
      LogError("存储同步失败，停止处理剩余信号: trader_id=" + trader.id +
               ", error=" + error);
      break;
    }
    try {
      ProcessSignal(context, signal, summary);
    } catch (const std::exception& e) {
      ++summary->errors;
      LogError("信号处理异常，继续下一个: trader_id=" + trader.id +
               ", signal_id=" + signal.id + ", error=" + e.what());
    }
  }
}

AccountState TraderCycle::LoadAccountState(CycleContext& context) {
  AccountState state;
  bool balance_ok = false;
  if (context.adapter != nullptr) {
    std::string error;
    std::vector<PositionInfo> positions;
    Decimal balance = 0;
    if (context.adapter->GetBalance(options_.balance_asset, &balance, &error) &&
        context.adapter->GetPositions(&positions, &error)) {
      state.available_balance = balance;
      state.open_positions = static_cast<int>(positions.size());
      balance_ok = true;
    } else {
      LogWarn("账户状态获取失败，按空账户处理: trader_id=" + context.trader.id +
              ", error=" + error);
    }
  }
  if (!balance_ok && context.is_paper) {
    state.available_balance = options_.paper_balance;
  }

  const std::int64_t since_ms = clock_->NowMs() - kRecentTradeWindowMs;
  state.recent_trades = RecentTradesFromDecisions(
      store_->RecentExecutedDecisions(context.trader.id, since_ms));
  state.current_daily_pnl = 0;
  return state;
}

void TraderCycle::FinishDecision(const DecisionLogRecord& decision,
                                 CycleSummary* summary) {
  std::string error;
  if (!store_->UpdateDecision(decision, &error)) {
    ++summary->errors;
    LogError("决策日志更新失败: decision_id=" + decision.id +
             ", client_order_id=" + decision.client_order_id +
             ", error=" + error);
    return;
  }
  switch (decision.status) {
    case DecisionStatus::kExecuted:
      ++summary->executed;
      break;
    case DecisionStatus::kAllowed:
      ++summary->allowed;
      break;
    case DecisionStatus::kBlocked:
      ++summary->blocked;
      break;
    case DecisionStatus::kFailed:
      ++summary->failed;
      break;
    case DecisionStatus::kPending:
      break;
  }
}

void TraderCycle::ProcessSignal(CycleContext& context,
                                const SignalRecord& signal,
                                CycleSummary* summary) {
  const TraderRecord& trader = context.trader;
  std::string error;

  // 幂等键按分钟分桶，跨分钟不再相同；信号是否已被该 trader 消费以决策日志为准。
  for (const DecisionLogRecord& prior : store_->DecisionsForSignal(signal.id)) {
    if (prior.trader_id == trader.id) {
      ++summary->duplicates_skipped;
      LogInfo("信号已被该 trader 消费，跳过: trader_id=" + trader.id +
              ", signal_id=" + signal.id + ", decision_id=" + prior.id);
      return;
    }
  }

  std::string client_order_id;
  if (!GenerateClientOrderId(trader.id, signal.id, clock_->NowMs(),
                             &client_order_id, &error)) {
    ++summary->errors;
    LogError("client_order_id 生成失败: trader_id=" + trader.id +
             ", signal_id=" + signal.id + ", error=" + error);
    return;
  }
  DecisionLogRecord existing;
  if (store_->FindDecisionByClientOrderId(client_order_id, &existing)) {
    ++summary->duplicates_skipped;
    LogInfo("重复信号已跳过: trader_id=" + trader.id +
            ", client_order_id=" + client_order_id);
    return;
  }

  JsonValue market_data = MakeJsonObject();
  std::optional<Decimal> snapshot_close;
  MarketSnapshotRecord snapshot;
  if (!signal.snapshot_id.empty() &&
      store_->FindMarketSnapshot(signal.snapshot_id, &snapshot)) {
    JsonSet(&market_data, "symbol", MakeJsonString(snapshot.symbol));
    JsonSet(&market_data, "timeframe", MakeJsonString(snapshot.timeframe));
    JsonSet(&market_data, "ohlcv", OhlcvTail(snapshot.ohlcv, kPromptOhlcvPoints));
    JsonSet(&market_data, "indicators", snapshot.indicators);
    snapshot_close = OhlcvLastClose(snapshot.ohlcv);
  }

  std::optional<Decimal> current_price;
  std::optional<SymbolInfo> symbol_info;
  if (context.adapter != nullptr) {
    Decimal ticker = 0;
    if (context.adapter->GetTicker(signal.symbol, &ticker, &error) && ticker > 0) {
      current_price = ticker;
    } else {
      LogWarn("行情价获取失败: symbol=" + signal.symbol + ", error=" + error);
    }
    SymbolInfo info;
    if (context.adapter->GetSymbolInfo(signal.symbol, &info, &error)) {
      symbol_info = info;
    }
  }

  const RiskProfile profile =
      BuildRiskProfile(trader, context.strategy, symbol_info);
  const AccountState account = LoadAccountState(context);

  JsonValue signal_data = MakeJsonObject();
  JsonSet(&signal_data, "symbol", MakeJsonString(signal.symbol));
  JsonSet(&signal_data, "side", MakeJsonString(ToString(signal.side)));
  JsonSet(&signal_data, "score", MakeJsonDecimal(signal.score));
  JsonSet(&signal_data, "timeframe", MakeJsonString(signal.timeframe));
  JsonSet(&signal_data, "reason", MakeJsonString(signal.reason_summary));

  JsonValue risk_data = MakeJsonObject();
  JsonSet(&risk_data, "max_leverage", MakeJsonInt(profile.max_leverage));
  JsonSet(&risk_data, "max_position_notional",
          profile.max_position_notional.has_value()
              ? MakeJsonString(DecimalToString(*profile.max_position_notional))
              : MakeJsonNull());
  JsonSet(&risk_data, "max_concurrent_positions",
          MakeJsonInt(profile.max_concurrent_positions));
  JsonSet(&risk_data, "cooldown_seconds", MakeJsonInt(profile.cooldown_seconds));

  JsonValue account_data = MakeJsonObject();
  JsonSet(&account_data, "available_balance",
          MakeJsonString(DecimalToString(account.available_balance)));
  JsonSet(&account_data, "open_positions", MakeJsonInt(account.open_positions));

  const AiPrompt prompt =
      BuildAiPrompt(signal_data, market_data, risk_data, account_data);

  DecisionLogRecord decision;
  decision.trader_id = trader.id;
  decision.signal_id = signal.id;
  decision.client_order_id = client_order_id;
  decision.status = DecisionStatus::kPending;
  JsonSet(&decision.input_snapshot, "signal", signal_data);
  JsonSet(&decision.input_snapshot, "market", market_data);
  JsonSet(&decision.input_snapshot, "risk", risk_data);
  JsonSet(&decision.input_snapshot, "account", account_data);
  decision.model_provider = context.model_endpoint.provider;
  decision.model_name = context.model_endpoint.model;
  decision.is_paper = context.is_paper;
  if (!store_->InsertDecision(&decision, &error)) {
    ++summary->errors;
    LogError("决策日志写入失败: trader_id=" + trader.id +
             ", client_order_id=" + client_order_id + ", error=" + error);
    return;
  }
  ++summary->decisions_created;
  summary->decision_ids.push_back(decision.id);

  const ModelResponse response = model_router_->Generate(
      context.model_endpoint, prompt.system_prompt, prompt.user_prompt, nullptr,
      trader.id);
  if (!response.success) {
    decision.status = DecisionStatus::kFailed;
    decision.execution_error =
        std::string("AI error: ") +
        ToString(response.error_type.value_or(ModelErrorType::kUnknown));
    LogWarn("模型调用失败: trader_id=" + trader.id +
            ", client_order_id=" + client_order_id +
            ", error=" + response.error_message);
    FinishDecision(decision, summary);
    return;
  }
  AddTokenUsage(response, &decision);

  ValidationResult validation = ValidateTradePlan(response.content);
  if (!validation.valid || !validation.plan.has_value()) {
    LogWarn("模型输出未通过校验，使用严格提示重试: trader_id=" + trader.id +
            ", client_order_id=" + client_order_id +
            ", errors=" + JoinReasons(validation.errors));
    const ModelResponse retry = model_router_->Generate(
        context.model_endpoint, RetrySystemPrompt(), prompt.user_prompt, nullptr,
        trader.id);
    if (retry.success) {
      AddTokenUsage(retry, &decision);
      validation = ValidateTradePlan(retry.content);
    } else {
      LogWarn("严格提示重试调用失败: trader_id=" + trader.id +
              ", client_order_id=" + client_order_id +
              ", error=" + retry.error_message);
    }
  }
  if (!validation.valid || !validation.plan.has_value()) {
    decision.status = DecisionStatus::kFailed;
    decision.execution_error = JoinReasons(validation.errors);
    FinishDecision(decision, summary);
    return;
  }

  const TradePlanOutput& plan = *validation.plan;
  decision.trade_plan = TradePlanSummaryToJson(plan);
  decision.confidence = plan.confidence;
  decision.reason_summary = plan.reason_summary;
  decision.evidence = EvidenceToJson(plan.evidence);

  if (plan.action == TradeAction::kSkip) {
    decision.status = DecisionStatus::kAllowed;
    decision.risk_allowed = true;
    decision.risk_reasons = {"Action is skip"};
    FinishDecision(decision, summary);
    return;
  }

  const RiskReport report =
      risk_manager_->Check(plan, profile, account, current_price);
  decision.risk_allowed = report.allowed;
  decision.risk_reasons = report.reasons;
  if (!report.allowed) {
    decision.status = DecisionStatus::kBlocked;
    LogInfo("风控拦截: trader_id=" + trader.id +
            ", client_order_id=" + client_order_id +
            ", reasons=" + JoinReasons(report.reasons));
    FinishDecision(decision, summary);
    return;
  }
  if (!report.normalized_plan.has_value()) {
    // close 动作：放行但不生成交易计划。
    decision.status = DecisionStatus::kAllowed;
    FinishDecision(decision, summary);
    return;
  }

  decision.normalized_plan = NormalizedPlanToJson(*report.normalized_plan);
  if (!store_->UpdateDecision(decision, &error)) {
    ++summary->errors;
    LogError("决策日志更新失败: decision_id=" + decision.id +
             ", error=" + error);
    return;
  }

  ExecutionRequest request;
  request.plan = *report.normalized_plan;
  request.exchange_account_id = trader.exchange_account_id;
  request.client_order_id = client_order_id;
  request.is_paper = context.is_paper;
  request.current_price = current_price;
  request.snapshot_close = snapshot_close;

  TradeExecutor executor(store_, clock_);
  TradePlanRecord trade_plan;
  if (!executor.Execute(request, context.adapter.get(), &trade_plan, &error)) {
    // 计划已落库时仍关联到决策，真实仓位不能丢失。
    decision.trade_plan_id = trade_plan.id;
    decision.status = DecisionStatus::kFailed;
    decision.execution_error = TruncateUtf8(error, kExecutionErrorMax);
    LogError("交易执行持久化失败: trader_id=" + trader.id +
             ", client_order_id=" + client_order_id + ", error=" + error);
    FinishDecision(decision, summary);
    return;
  }

  decision.trade_plan_id = trade_plan.id;
  decision.status = trade_plan.status == TradePlanStatus::kFailed
                        ? DecisionStatus::kFailed
                        : DecisionStatus::kExecuted;
  decision.execution_error = trade_plan.error_message;
  LogInfo("交易计划已执行: trader_id=" + trader.id +
          ", client_order_id=" + client_order_id +
          ", trade_plan_id=" + trade_plan.id +
          ", status=" + ToString(trade_plan.status) +
          ", is_paper=" + (trade_plan.is_paper ? "true" : "false"));
  FinishDecision(decision, summary);
}

}  // namespace trade_pilot
