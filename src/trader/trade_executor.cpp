#include "trader/trade_executor.h"

#include <exception>
#include <functional>

#include "core/log.h"
#include "core/text.h"
#include "exchange/exchange_support.h"

namespace trade_pilot {

namespace {

constexpr std::size_t kErrorMessageMax = 500;

/// 适配器约定不抛异常；这里兜底把意外异常折叠成失败结果。
OrderResult GuardedOrder(const std::function<OrderResult()>& call) {
  try {
    return call();
  } catch (const std::exception& e) {
    return FailedOrderResult("EXCEPTION", e.what());
  }
}

std::string DescribeOrderFailure(const OrderResult& result) {
  if (!result.error_message.empty()) {
    return result.error_message;
  }
  if (!result.error_code.empty()) {
    return "error_code=" + result.error_code;
  }
  return "unknown error";
}

OrderResult PaperFill(const std::string& client_order_id,
                      const Decimal& quantity,
                      const Decimal& price) {
  OrderResult result;
  result.success = true;
  result.order_id = "paper-" + client_order_id;
  result.client_order_id = client_order_id;
  result.status = OrderStatus::kFilled;
  result.filled_qty = quantity;
  result.filled_price = price;
  return result;
}

}  // namespace

ExecutionStatus ExecutionStatusFromOrder(const OrderResult& result) {
  if (!result.success) {
    return ExecutionStatus::kFailed;
  }
  if (!result.status.has_value()) {
    return ExecutionStatus::kSubmitted;
  }
  switch (*result.status) {
    case OrderStatus::kFilled:
      return ExecutionStatus::kFilled;
    case OrderStatus::kPartiallyFilled:
      return ExecutionStatus::kPartiallyFilled;
    case OrderStatus::kCanceled:
    case OrderStatus::kExpired:
      return ExecutionStatus::kCancelled;
    case OrderStatus::kRejected:
      return ExecutionStatus::kFailed;
    case OrderStatus::kNew:
      return ExecutionStatus::kSubmitted;
  }
  return ExecutionStatus::kSubmitted;
}

TradeExecutor::TradeExecutor(TradeStore* store, const Clock* clock)
    : store_(store), clock_(clock != nullptr ? clock : &DefaultClock()) {}

bool TradeExecutor::Execute(const ExecutionRequest& request,
                            ExchangeAdapter* adapter,
                            TradePlanRecord* out_plan,
                            std::string* out_error) {
  if (store_ == nullptr || out_plan == nullptr) {
    if (out_error != nullptr) {
      *out_error = "TradeExecutor 未配置存储或输出参数为空";
    }
    return false;
  }

  TradePlanRecord plan;
  plan.exchange_account_id = request.exchange_account_id;
  plan.client_order_id = request.client_order_id;
  plan.symbol = request.plan.symbol;
  plan.side = request.plan.side;
  plan.quantity = request.plan.quantity;
  plan.tp_price = request.plan.tp_price;
  plan.sl_price = request.plan.sl_price;
  plan.leverage = request.plan.leverage;
  plan.status = TradePlanStatus::kPending;
  plan.is_paper = request.is_paper;
  if (!store_->InsertTradePlan(&plan, out_error)) {
    return false;
  }

  // 执行记录写失败不中断下单流程：计划状态与成交价仍要落库，再整体报错。
  std::string persist_error;
  if (request.is_paper) {
    ExecutePaper(request, &plan, &persist_error);
  } else {
    ExecuteLive(request, adapter, &plan, &persist_error);
  }
  if (!persist_error.empty()) {
    const std::string note = "Execution record not persisted: " + persist_error;
    plan.error_message = TruncateUtf8(
        plan.error_message.empty() ? note : plan.error_message + "; " + note,
        kErrorMessageMax);
  }

  *out_plan = plan;
  if (!store_->UpdateTradePlan(plan, out_error)) {
    LogError("交易计划状态写入失败: trade_plan_id=" + plan.id +
             ", status=" + ToString(plan.status) +
             ", error=" + (out_error != nullptr ? *out_error : std::string()));
    return false;
  }
  if (!store_->FindTradePlan(plan.id, out_plan)) {
    *out_plan = plan;
  }
  if (!persist_error.empty()) {
    if (out_error != nullptr) {
      *out_error = persist_error;
    }
    return false;
  }
  return true;
}

void TradeExecutor::ExecutePaper(const ExecutionRequest& request,
                                 TradePlanRecord* plan,
                                 std::string* persist_error) {
  std::optional<Decimal> fill_price = request.plan.entry_price;
  if (!fill_price.has_value()) {
    fill_price = request.current_price;
  }
  if (!fill_price.has_value()) {
    fill_price = request.snapshot_close;
  }
  if (!fill_price.has_value() || *fill_price <= 0) {
    plan->status = TradePlanStatus::kFailed;
    plan->error_message = "No price available for paper fill";
    return;
  }

  const OrderSide entry_side = EntryOrderSide(request.plan.side);
  const OrderResult entry =
      PaperFill(request.client_order_id, request.plan.quantity, *fill_price);
  RecordExecution(*plan, ExecutionOrderType::kEntry, request.client_order_id,
                  entry_side, entry, true, persist_error);
  plan->status = TradePlanStatus::kEntryFilled;
  plan->entry_price = fill_price;

  const OrderSide close_side = CloseOrderSide(request.plan.side);
  if (request.plan.tp_price.has_value()) {
    OrderResult tp;
    tp.success = true;
    tp.client_order_id = request.client_order_id + "_TP";
    tp.order_id = "paper-" + tp.client_order_id;
    tp.status = OrderStatus::kNew;
    tp.filled_price = request.plan.tp_price;
    RecordExecution(*plan, ExecutionOrderType::kTp, tp.client_order_id, close_side,
                    tp, true, persist_error);
  }
  if (request.plan.sl_price.has_value()) {
    OrderResult sl;
    sl.success = true;
    sl.client_order_id = request.client_order_id + "_SL";
    sl.order_id = "paper-" + sl.client_order_id;
    sl.status = OrderStatus::kNew;
    sl.filled_price = request.plan.sl_price;
    RecordExecution(*plan, ExecutionOrderType::kSl, sl.client_order_id, close_side,
                    sl, true, persist_error);
  }
  if (request.plan.tp_price.has_value() || request.plan.sl_price.has_value()) {
    plan->status = TradePlanStatus::kTpSlPlaced;
  }
}

void TradeExecutor::ExecuteLive(const ExecutionRequest& request,
                                ExchangeAdapter* adapter,
                                TradePlanRecord* plan,
                                std::string* persist_error) {
  if (adapter == nullptr) {
    plan->status = TradePlanStatus::kFailed;
    plan->error_message = "Exchange adapter unavailable";
    return;
  }

  const NormalizedPlan& normalized = request.plan;
  bool leverage_ok = false;
  try {
    leverage_ok = adapter->SetLeverage(normalized.symbol, normalized.leverage);
  } catch (const std::exception& e) {
    LogWarn(std::string("设置杠杆异常: ") + e.what());
  }
  if (!leverage_ok) {
    LogWarn("设置杠杆失败，继续下单: client_order_id=" + request.client_order_id +
            ", symbol=" + normalized.symbol +
            ", leverage=" + std::to_string(normalized.leverage));
  }

  const OrderSide entry_side = EntryOrderSide(normalized.side);
  const OrderResult entry = GuardedOrder([&] {
    return adapter->PlaceMarketOrder(normalized.symbol, entry_side,
                                     normalized.quantity,
                                     request.client_order_id);
  });
  RecordExecution(*plan, ExecutionOrderType::kEntry, request.client_order_id,
                  entry_side, entry, false, persist_error);
  plan->entry_order = entry.raw;

  if (!entry.success) {
    plan->status = TradePlanStatus::kFailed;
    plan->error_message =
        TruncateUtf8(DescribeOrderFailure(entry), kErrorMessageMax);
    LogWarn("入场下单失败: client_order_id=" + request.client_order_id +
            ", error=" + plan->error_message);
    return;
  }

  if (entry.status == OrderStatus::kFilled) {
    plan->status = TradePlanStatus::kEntryFilled;
    plan->entry_price = entry.filled_price;
  } else {
    plan->status = TradePlanStatus::kEntryPlaced;
  }

  if (!normalized.tp_price.has_value() && !normalized.sl_price.has_value()) {
    return;
  }

  const OrderSide close_side = CloseOrderSide(normalized.side);
  std::string protection_errors;
  if (normalized.tp_price.has_value()) {
    const std::string tp_id = request.client_order_id + "_TP";
    const OrderResult tp = GuardedOrder([&] {
      return adapter->PlaceTakeProfit(normalized.symbol, close_side,
                                      normalized.quantity, *normalized.tp_price,
                                      tp_id);
    });
    plan->tp_order = tp.raw;
    RecordExecution(*plan, ExecutionOrderType::kTp, tp_id, close_side, tp, false,
                    persist_error);
    if (!tp.success) {
      protection_errors += "TP placement failed: " + DescribeOrderFailure(tp);
    }
  }
  if (normalized.sl_price.has_value()) {
    const std::string sl_id = request.client_order_id + "_SL";
    const OrderResult sl = GuardedOrder([&] {
      return adapter->PlaceStopLoss(normalized.symbol, close_side,
                                    normalized.quantity, *normalized.sl_price,
                                    sl_id);
    });
    plan->sl_order = sl.raw;
    RecordExecution(*plan, ExecutionOrderType::kSl, sl_id, close_side, sl, false,
                    persist_error);
    if (!sl.success) {
      protection_errors += protection_errors.empty() ? "" : "; ";
      protection_errors += "SL placement failed: " + DescribeOrderFailure(sl);
    }
  }

  if (protection_errors.empty()) {
    plan->status = TradePlanStatus::kTpSlPlaced;
    return;
  }
  plan->error_message = TruncateUtf8(protection_errors, kErrorMessageMax);
  LogWarn("止盈止损下单失败，仓位已存在: client_order_id=" +
          request.client_order_id + ", status=" + ToString(plan->status) +
          ", error=" + plan->error_message);
}

void TradeExecutor::RecordExecution(const TradePlanRecord& plan,
                                    ExecutionOrderType order_type,
                                    const std::string& client_order_id,
                                    OrderSide side,
                                    const OrderResult& result,
                                    bool is_paper,
                                    std::string* persist_error) {
  ExecutionRecord execution;
  execution.trade_plan_id = plan.id;
  execution.order_type = order_type;
  execution.exchange_order_id = result.success ? result.order_id : "";
  execution.client_order_id = client_order_id;
  execution.symbol = plan.symbol;
  execution.side = side;
  execution.quantity = plan.quantity;
  execution.price = result.filled_price;
  execution.status = ExecutionStatusFromOrder(result);
  execution.exchange_response = result.raw;
  execution.is_paper = is_paper;
  if (!result.success) {
    execution.error_message =
        TruncateUtf8(DescribeOrderFailure(result), kErrorMessageMax);
  }
  if (execution.status == ExecutionStatus::kFilled) {
    execution.filled_at_ms = clock_->NowMs();
  }
  std::string error;
  if (store_->InsertExecution(&execution, &error)) {
    return;
  }
  LogError("执行记录写入失败: trade_plan_id=" + plan.id +
           ", client_order_id=" + client_order_id + ", error=" + error);
  if (!persist_error->empty()) {
    *persist_error += "; ";
  }
  *persist_error += client_order_id + ": " + error;
}

}  // namespace trade_pilot
