#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/decimal.h"
#include "core/json_utils.h"

namespace trade_pilot {

/// 仓位方向（信号与交易计划共用）。
enum class PositionSide {
  kLong,
  kShort,
};

/// 模型给出的动作。
enum class TradeAction {
  kOpen,
  kClose,
  kSkip,
};

/// 入场方式。
enum class EntryType {
  kMarket,
  kLimit,
};

/// 仓位大小口径：名义金额或直接数量。
enum class SizeMode {
  kNotional,
  kQty,
};

/// 止盈/止损口径：相对当前价百分比或绝对价格。
enum class PriceTargetMode {
  kPercent,
  kPrice,
};

enum class TimeInForce {
  kGtc,
  kIoc,
};

/// 交易所下单方向。
enum class OrderSide {
  kBuy,
  kSell,
};

/// 交易所订单状态（跨交易所归一化词表）。
enum class OrderStatus {
  kNew,
  kPartiallyFilled,
  kFilled,
  kCanceled,
  kRejected,
  kExpired,
};

/**
 * @brief 交易计划状态机
 *
 * `pending -> entry_placed -> entry_filled -> tp_sl_placed -> completed`；
 * `failed`/`cancelled` 可由任意非终态进入。只允许前进，不允许回退。
 */
enum class TradePlanStatus {
  kPending,
  kEntryPlaced,
  kEntryFilled,
  kTpSlPlaced,
  kCompleted,
  kFailed,
  kCancelled,
};

/// 单笔交易所订单的本地状态。
enum class ExecutionStatus {
  kPending,
  kSubmitted,
  kFilled,
  kPartiallyFilled,
  kFailed,
  kCancelled,
};

/// 执行记录用途：入场/止盈/止损。
enum class ExecutionOrderType {
  kEntry,
  kTp,
  kSl,
};

/// 决策日志状态。
enum class DecisionStatus {
  kPending,
  kAllowed,
  kBlocked,
  kExecuted,
  kFailed,
};

enum class TraderMode {
  kPaper,
  kLive,
};

/// 交易所 symbol 精度与下单限制。
struct SymbolInfo {
  std::string symbol;
  int price_precision{2};  ///< 价格小数位。
  int qty_precision{3};  ///< 数量小数位。
  Decimal min_qty{"0.001"};
  Decimal max_qty{"1000000"};
  Decimal min_notional{"5"};
};

/// 交易所持仓快照。
struct PositionInfo {
  std::string symbol;
  PositionSide side{PositionSide::kLong};
  Decimal quantity{0};
  Decimal entry_price{0};
  Decimal unrealized_pnl{0};
  int leverage{1};
  std::string margin_type;  ///< CROSS / ISOLATED。
};

/**
 * @brief 统一下单/查单结果
 *
 * 适配器边界把 HTTP 与业务错误全部折叠成 `success=false`，
 * 调用方不需要任何交易所相关的异常处理。
 */
struct OrderResult {
  bool success{false};
  std::string order_id;
  std::string client_order_id;
  std::optional<OrderStatus> status;
  std::string exchange_status;  ///< 交易所原始状态文本（排障用）。
  std::optional<Decimal> filled_qty;
  std::optional<Decimal> filled_price;
  std::string error_code;
  std::string error_message;
  JsonValue raw;  ///< 原始响应（可能为空）。
};

/// 订单定位：交易所订单号或幂等键二选一（优先订单号）。
struct OrderRef {
  std::string symbol;
  std::string order_id;
  std::string client_order_id;
};

struct EntrySpec {
  EntryType type{EntryType::kMarket};
  std::optional<Decimal> price;
};

struct PositionSize {
  SizeMode mode{SizeMode::kNotional};
  Decimal value{0};
};

struct PriceTarget {
  PriceTargetMode mode{PriceTargetMode::kPercent};
  Decimal value{0};
};

/// 模型给出的结构化证据（只保留结构化键）。
struct TradeEvidence {
  JsonValue signals{MakeJsonArray()};
  JsonValue indicators{MakeJsonObject()};
  JsonValue key_levels{MakeJsonObject()};
};

/**
 * @brief 模型输出的交易计划（风控前）
 *
 * 不变式：`action == kOpen` 时 symbol/side/entry/position_size 必须存在，
 * 由校验器的业务阶段保证。
 */
struct TradePlanOutput {
  TradeAction action{TradeAction::kSkip};
  std::optional<std::string> symbol;
  std::optional<PositionSide> side;
  std::optional<EntrySpec> entry;
  std::optional<PositionSize> position_size;
  int leverage{1};
  std::optional<PriceTarget> tp;
  std::optional<PriceTarget> sl;
  std::optional<TimeInForce> time_in_force;
  double confidence{0.0};
  std::string reason_summary;
  TradeEvidence evidence;
};

/**
 * @brief 风控归一化后的下单参数
 *
 * 数量已按精度向零截断，杠杆已钳制到上限，TP/SL 已换算为绝对价格。
 * 无可用当前价时 TP/SL 可能为空（“无价”降级）。
 */
struct NormalizedPlan {
  std::string symbol;
  PositionSide side{PositionSide::kLong};
  Decimal quantity{0};
  int leverage{1};
  EntryType entry_type{EntryType::kMarket};
  std::optional<Decimal> entry_price;
  std::optional<Decimal> tp_price;
  std::optional<Decimal> sl_price;
  std::optional<TimeInForce> time_in_force;
};

inline const char* ToString(PositionSide side) {
  switch (side) {
    case PositionSide::kLong:
      return "long";
    case PositionSide::kShort:
      return "short";
  }
  return "unknown";
}

inline const char* ToString(TradeAction action) {
  switch (action) {
    case TradeAction::kOpen:
      return "open";
    case TradeAction::kClose:
      return "close";
    case TradeAction::kSkip:
      return "skip";
  }
  return "unknown";
}

inline const char* ToString(EntryType type) {
  switch (type) {
    case EntryType::kMarket:
      return "market";
    case EntryType::kLimit:
      return "limit";
  }
  return "unknown";
}

inline const char* ToString(SizeMode mode) {
  switch (mode) {
    case SizeMode::kNotional:
      return "notional";
    case SizeMode::kQty:
      return "qty";
  }
  return "unknown";
}

inline const char* ToString(PriceTargetMode mode) {
  switch (mode) {
    case PriceTargetMode::kPercent:
      return "percent";
    case PriceTargetMode::kPrice:
      return "price";
  }
  return "unknown";
}

inline const char* ToString(TimeInForce tif) {
  switch (tif) {
    case TimeInForce::kGtc:
      return "GTC";
    case TimeInForce::kIoc:
      return "IOC";
  }
  return "unknown";
}

inline const char* ToString(OrderSide side) {
  switch (side) {
    case OrderSide::kBuy:
      return "BUY";
    case OrderSide::kSell:
      return "SELL";
  }
  return "unknown";
}

/// 小写下划线形式，与对账状态词表对齐（filled/canceled/...）。
inline const char* ToString(OrderStatus status) {
  switch (status) {
    case OrderStatus::kNew:
      return "new";
    case OrderStatus::kPartiallyFilled:
      return "partially_filled";
    case OrderStatus::kFilled:
      return "filled";
    case OrderStatus::kCanceled:
      return "canceled";
    case OrderStatus::kRejected:
      return "rejected";
    case OrderStatus::kExpired:
      return "expired";
  }
  return "unknown";
}

inline const char* ToString(TradePlanStatus status) {
  switch (status) {
    case TradePlanStatus::kPending:
      return "pending";
    case TradePlanStatus::kEntryPlaced:
      return "entry_placed";
    case TradePlanStatus::kEntryFilled:
      return "entry_filled";
    case TradePlanStatus::kTpSlPlaced:
      return "tp_sl_placed";
    case TradePlanStatus::kCompleted:
      return "completed";
    case TradePlanStatus::kFailed:
      return "failed";
    case TradePlanStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

inline const char* ToString(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::kPending:
      return "pending";
    case ExecutionStatus::kSubmitted:
      return "submitted";
    case ExecutionStatus::kFilled:
      return "filled";
    case ExecutionStatus::kPartiallyFilled:
      return "partially_filled";
    case ExecutionStatus::kFailed:
      return "failed";
    case ExecutionStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

inline const char* ToString(ExecutionOrderType type) {
  switch (type) {
    case ExecutionOrderType::kEntry:
      return "entry";
    case ExecutionOrderType::kTp:
      return "tp";
    case ExecutionOrderType::kSl:
      return "sl";
  }
  return "unknown";
}

inline const char* ToString(DecisionStatus status) {
  switch (status) {
    case DecisionStatus::kPending:
      return "pending";
    case DecisionStatus::kAllowed:
      return "allowed";
    case DecisionStatus::kBlocked:
      return "blocked";
    case DecisionStatus::kExecuted:
      return "executed";
    case DecisionStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

inline const char* ToString(TraderMode mode) {
  switch (mode) {
    case TraderMode::kPaper:
      return "paper";
    case TraderMode::kLive:
      return "live";
  }
  return "unknown";
}

/// 文本解析族：与 ToString 互逆；未知文本返回 false。
bool ParsePositionSide(const std::string& text, PositionSide* out);
bool ParseTradeAction(const std::string& text, TradeAction* out);
bool ParseEntryType(const std::string& text, EntryType* out);
bool ParseSizeMode(const std::string& text, SizeMode* out);
bool ParsePriceTargetMode(const std::string& text, PriceTargetMode* out);
bool ParseTimeInForce(const std::string& text, TimeInForce* out);
bool ParseOrderSide(const std::string& text, OrderSide* out);
bool ParseTradePlanStatus(const std::string& text, TradePlanStatus* out);
bool ParseExecutionStatus(const std::string& text, ExecutionStatus* out);
bool ParseExecutionOrderType(const std::string& text, ExecutionOrderType* out);
bool ParseDecisionStatus(const std::string& text, DecisionStatus* out);
bool ParseTraderMode(const std::string& text, TraderMode* out);

/// 交易计划是否已处于终态（completed/failed/cancelled）。
bool IsTerminal(TradePlanStatus status);

/// 执行记录是否已处于终态（filled/cancelled/failed）。
bool IsTerminal(ExecutionStatus status);

/**
 * @brief 交易计划状态迁移是否合法
 *
 * 同状态视为合法（无迁移）；终态不可再迁移；
 * 非终态只能沿主链前进，或进入 failed/cancelled。
 */
bool IsAllowedTransition(TradePlanStatus from, TradePlanStatus to);

/// 开仓方向对应的入场下单方向（long -> BUY）。
OrderSide EntryOrderSide(PositionSide side);
/// 平仓（TP/SL）下单方向，与入场方向相反。
OrderSide CloseOrderSide(PositionSide side);

}  // namespace trade_pilot
