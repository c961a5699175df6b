#include "core/types.h"

namespace trade_pilot {
namespace {

template <typename Enum, std::size_t N>
bool ParseByTable(const std::string& text,
                  const Enum (&values)[N],
                  Enum* out) {
  for (const Enum value : values) {
    if (text == ToString(value)) {
      if (out != nullptr) {
        *out = value;
      }
      return true;
    }
  }
  return false;
}

// 主链上的前进序号；failed/cancelled 不在主链上。
int ForwardRank(TradePlanStatus status) {
  switch (status) {
    case TradePlanStatus::kPending:
      return 0;
    case TradePlanStatus::kEntryPlaced:
      return 1;
    case TradePlanStatus::kEntryFilled:
      return 2;
    case TradePlanStatus::kTpSlPlaced:
      return 3;
    case TradePlanStatus::kCompleted:
      return 4;
    case TradePlanStatus::kFailed:
    case TradePlanStatus::kCancelled:
      return -1;
  }
  return -1;
}

}  // namespace

bool ParsePositionSide(const std::string& text, PositionSide* out) {
  static const PositionSide kValues[] = {PositionSide::kLong,
                                         PositionSide::kShort};
  return ParseByTable(text, kValues, out);
}

bool ParseTradeAction(const std::string& text, TradeAction* out) {
  static const TradeAction kValues[] = {TradeAction::kOpen, TradeAction::kClose,
                                        TradeAction::kSkip};
  return ParseByTable(text, kValues, out);
}

bool ParseEntryType(const std::string& text, EntryType* out) {
  static const EntryType kValues[] = {EntryType::kMarket, EntryType::kLimit};
  return ParseByTable(text, kValues, out);
}

bool ParseSizeMode(const std::string& text, SizeMode* out) {
  static const SizeMode kValues[] = {SizeMode::kNotional, SizeMode::kQty};
  return ParseByTable(text, kValues, out);
}

bool ParsePriceTargetMode(const std::string& text, PriceTargetMode* out) {
  static const PriceTargetMode kValues[] = {PriceTargetMode::kPercent,
                                            PriceTargetMode::kPrice};
  return ParseByTable(text, kValues, out);
}

bool ParseTimeInForce(const std::string& text, TimeInForce* out) {
  static const TimeInForce kValues[] = {TimeInForce::kGtc, TimeInForce::kIoc};
  return ParseByTable(text, kValues, out);
}

bool ParseOrderSide(const std::string& text, OrderSide* out) {
  static const OrderSide kValues[] = {OrderSide::kBuy, OrderSide::kSell};
  return ParseByTable(text, kValues, out);
}

bool ParseTradePlanStatus(const std::string& text, TradePlanStatus* out) {
  static const TradePlanStatus kValues[] = {
      TradePlanStatus::kPending,    TradePlanStatus::kEntryPlaced,
      TradePlanStatus::kEntryFilled, TradePlanStatus::kTpSlPlaced,
      TradePlanStatus::kCompleted,  TradePlanStatus::kFailed,
      TradePlanStatus::kCancelled};
  return ParseByTable(text, kValues, out);
}

bool ParseExecutionStatus(const std::string& text, ExecutionStatus* out) {
  static const ExecutionStatus kValues[] = {
      ExecutionStatus::kPending,         ExecutionStatus::kSubmitted,
      ExecutionStatus::kFilled,          ExecutionStatus::kPartiallyFilled,
      ExecutionStatus::kFailed,          ExecutionStatus::kCancelled};
  return ParseByTable(text, kValues, out);
}

bool ParseExecutionOrderType(const std::string& text, ExecutionOrderType* out) {
  static const ExecutionOrderType kValues[] = {ExecutionOrderType::kEntry,
                                               ExecutionOrderType::kTp,
                                               ExecutionOrderType::kSl};
  return ParseByTable(text, kValues, out);
}

bool ParseDecisionStatus(const std::string& text, DecisionStatus* out) {
  static const DecisionStatus kValues[] = {
      DecisionStatus::kPending, DecisionStatus::kAllowed,
      DecisionStatus::kBlocked, DecisionStatus::kExecuted,
      DecisionStatus::kFailed};
  return ParseByTable(text, kValues, out);
}

bool ParseTraderMode(const std::string& text, TraderMode* out) {
  static const TraderMode kValues[] = {TraderMode::kPaper, TraderMode::kLive};
  return ParseByTable(text, kValues, out);
}

bool IsTerminal(TradePlanStatus status) {
  return status == TradePlanStatus::kCompleted ||
         status == TradePlanStatus::kFailed ||
         status == TradePlanStatus::kCancelled;
}

bool IsTerminal(ExecutionStatus status) {
  return status == ExecutionStatus::kFilled ||
         status == ExecutionStatus::kCancelled ||
         status == ExecutionStatus::kFailed;
}

bool IsAllowedTransition(TradePlanStatus from, TradePlanStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == TradePlanStatus::kFailed || to == TradePlanStatus::kCancelled) {
    return true;
  }
  return ForwardRank(to) > ForwardRank(from);
}

OrderSide EntryOrderSide(PositionSide side) {
  return side == PositionSide::kLong ? OrderSide::kBuy : OrderSide::kSell;
}

OrderSide CloseOrderSide(PositionSide side) {
  return side == PositionSide::kLong ? OrderSide::kSell : OrderSide::kBuy;
}

}  // namespace trade_pilot
