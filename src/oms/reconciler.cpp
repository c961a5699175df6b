#include "oms/reconciler.h"

#include <algorithm>
#include <exception>
#include <memory>
#include <utility>

#include "core/decimal.h"
#include "core/log.h"
#include "core/text.h"
#include "lock/distributed_mutex.h"

namespace trade_pilot {

namespace {

constexpr std::int64_t kHourMs = 60LL * 60 * 1000;

bool IsExecutionSettled(ExecutionStatus status) {
  return status == ExecutionStatus::kFilled ||
         status == ExecutionStatus::kCancelled;
}

/// 交易所状态文本优先；适配器未给出文本时退回已归一的订单状态。
std::optional<ExecutionStatus> ResolveExecutionStatus(const OrderResult& order) {
  if (!order.exchange_status.empty()) {
    const std::optional<ExecutionStatus> mapped =
        MapExchangeOrderStatus(order.exchange_status);
    if (mapped.has_value()) {
      return mapped;
    }
  }
  if (!order.status.has_value()) {
    return std::nullopt;
  }
  switch (*order.status) {
    case OrderStatus::kFilled:
      return ExecutionStatus::kFilled;
    case OrderStatus::kCanceled:
    case OrderStatus::kExpired:
      return ExecutionStatus::kCancelled;
    case OrderStatus::kPartiallyFilled:
      return ExecutionStatus::kPartiallyFilled;
    case OrderStatus::kNew:
    case OrderStatus::kRejected:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace

std::optional<ExecutionStatus> MapExchangeOrderStatus(const std::string& status) {
  const std::string lower = ToLowerAscii(TrimAscii(status));
  if (lower == "filled" || lower == "closed") {
    return ExecutionStatus::kFilled;
  }
  if (lower == "cancelled" || lower == "canceled" || lower == "expired") {
    return ExecutionStatus::kCancelled;
  }
  if (lower == "partially_filled" || lower == "partial") {
    return ExecutionStatus::kPartiallyFilled;
  }
  return std::nullopt;
}

ReconciliationEngine::ReconciliationEngine(TradeStore* store,
                                           LockStore* lock_store,
                                           const SecretsCipher* cipher,
                                           ExchangeAdapterFactory adapter_factory,
                                           ReconcileOptions options,
                                           const Clock* clock)
    : store_(store),
      lock_store_(lock_store),
      cipher_(cipher),
      adapter_factory_(std::move(adapter_factory)),
      options_(std::move(options)),
      clock_(clock != nullptr ? clock : &DefaultClock()) {}

ReconcileSummary ReconciliationEngine::Run(const std::string& exchange_account_id) {
  ReconcileSummary summary;
  summary.exchange_account_id = exchange_account_id;

  DistributedMutex mutex(lock_store_, ReconcileLockName(exchange_account_id),
                         options_.lock_ttl_ms);
  ScopedMutexLock guard(&mutex, LockMode::kNonBlocking);
  if (!guard.owns_lock()) {
    summary.skipped_lock_contention = true;
    LogInfo("跳过对账，锁被占用: event=lock_contention, account_id=" +
            exchange_account_id);
    return summary;
  }

  std::string error;
  if (!store_->Refresh(&error)) {
    ++summary.errors;
    LogError("对账中止，存储同步失败: account_id=" + exchange_account_id +
             ", error=" + error);
    return summary;
  }

  ExchangeAccountRecord account;
  if (!store_->FindExchangeAccount(exchange_account_id, &account)) {
    LogWarn("对账跳过，账户不存在: account_id=" + exchange_account_id);
    return summary;
  }
  summary.account_found = true;

  const std::int64_t since_ms =
      clock_->NowMs() - static_cast<std::int64_t>(options_.lookback_hours) * kHourMs;
  const std::vector<TradePlanRecord> plans = store_->NonTerminalLivePlans(
      exchange_account_id, since_ms, options_.batch_size);
  if (plans.empty()) {
    return summary;
  }

  ExchangeCredentials credentials;
  std::unique_ptr<ExchangeAdapter> adapter;
  if (cipher_->Decrypt(account.api_key_encrypted, &credentials.api_key, &error) &&
      cipher_->Decrypt(account.api_secret_encrypted, &credentials.api_secret,
                       &error)) {
    adapter = adapter_factory_(account, credentials, &error);
  }
  if (adapter == nullptr) {
    LogError("对账中止，交易所适配器不可用: account_id=" + exchange_account_id +
             ", error=" + error);
    return summary;
  }

  for (const TradePlanRecord& plan : plans) {
    ++summary.checked;
    try {
      if (ReconcilePlan(plan, adapter.get(), &summary)) {
        ++summary.updated;
      }
    } catch (const std::exception& e) {
      ++summary.errors;
      LogError("对账计划异常: trade_plan_id=" + plan.id + ", error=" + e.what());
    }
  }

  LogInfo("对账完成: account_id=" + exchange_account_id +
          ", checked=" + std::to_string(summary.checked) +
          ", updated=" + std::to_string(summary.updated) +
          ", errors=" + std::to_string(summary.errors));
  return summary;
}

bool ReconciliationEngine::ApplyOrderState(const OrderResult& order,
                                           ExecutionRecord* execution) const {
  const std::optional<ExecutionStatus> status = ResolveExecutionStatus(order);
  if (!status.has_value()) {
    return false;
  }
  switch (*status) {
    case ExecutionStatus::kFilled:
      execution->status = ExecutionStatus::kFilled;
      if (order.filled_price.has_value()) {
        execution->price = order.filled_price;
      }
      execution->filled_at_ms = clock_->NowMs();
      return true;
    case ExecutionStatus::kCancelled:
      execution->status = ExecutionStatus::kCancelled;
      return true;
    case ExecutionStatus::kPartiallyFilled:
      execution->status = ExecutionStatus::kPartiallyFilled;
      if (order.filled_qty.has_value() && *order.filled_qty > 0) {
        execution->quantity = *order.filled_qty;
      }
      return true;
    default:
      return false;
  }
}

bool ReconciliationEngine::ReconcilePlan(const TradePlanRecord& plan,
                                         ExchangeAdapter* adapter,
                                         ReconcileSummary* summary) {
  std::vector<ExecutionRecord> executions = store_->ExecutionsForPlan(plan.id);
  bool updated = false;
  std::string error;

  for (ExecutionRecord& execution : executions) {
    if (IsExecutionSettled(execution.status) || execution.exchange_order_id.empty()) {
      continue;
    }
    const OrderResult order = adapter->GetOrder(OrderRef{
        .symbol = execution.symbol,
        .order_id = execution.exchange_order_id,
        .client_order_id = execution.client_order_id,
    });
    if (!order.success) {
      ++summary->errors;
      LogWarn("对账订单查询失败，跳过: execution_id=" + execution.id +
              ", order_id=" + execution.exchange_order_id +
              ", error=" + order.error_message);
      continue;
    }
    if (!ApplyOrderState(order, &execution)) {
      continue;
    }
    if (!store_->UpdateExecution(execution, &error)) {
      ++summary->errors;
      LogError("执行记录更新失败: execution_id=" + execution.id +
               ", error=" + error);
      continue;
    }
    updated = true;
    LogInfo("执行记录已对账: execution_id=" + execution.id +
            ", order_id=" + execution.exchange_order_id +
            ", status=" + ToString(execution.status));
  }

  if (!updated) {
    return false;
  }

  TradePlanRecord next = plan;
  bool plan_changed = false;

  std::vector<const ExecutionRecord*> entries;
  std::vector<const ExecutionRecord*> protections;
  for (const ExecutionRecord& execution : executions) {
    if (execution.order_type == ExecutionOrderType::kEntry) {
      entries.push_back(&execution);
    } else {
      protections.push_back(&execution);
    }
  }

  const bool entries_filled =
      !entries.empty() &&
      std::all_of(entries.begin(), entries.end(), [](const ExecutionRecord* e) {
        return e->status == ExecutionStatus::kFilled;
      });
  if (entries_filled) {
    if (next.status == TradePlanStatus::kEntryPlaced) {
      next.status = TradePlanStatus::kEntryFilled;
      plan_changed = true;
    }
    if (!next.entry_price.has_value() && entries.front()->price.has_value()) {
      next.entry_price = entries.front()->price;
      plan_changed = true;
    }
  }

  const bool protections_settled =
      !protections.empty() &&
      std::all_of(protections.begin(), protections.end(),
                  [](const ExecutionRecord* e) { return IsExecutionSettled(e->status); });
  if (protections_settled && next.status == TradePlanStatus::kTpSlPlaced) {
    next.status = TradePlanStatus::kCompleted;
    plan_changed = true;
  }

  if (plan_changed) {
    if (!store_->UpdateTradePlan(next, &error)) {
      ++summary->errors;
      LogError("交易计划更新失败: trade_plan_id=" + plan.id + ", error=" + error);
    } else {
      LogInfo("交易计划已对账: trade_plan_id=" + plan.id +
              ", status=" + ToString(plan.status) + " -> " + ToString(next.status));
    }
  }
  return true;
}

}  // namespace trade_pilot
