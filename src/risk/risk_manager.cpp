#include "risk/risk_manager.h"

#include <algorithm>

#include "core/crypto.h"

namespace trade_pilot {

namespace {

constexpr std::size_t kClientOrderIdHashLength = 16;

Decimal TargetPrice(const PriceTarget& target,
                    const Decimal& current_price,
                    bool above_price) {
  if (target.mode == PriceTargetMode::kPrice) {
    return target.value;
  }
  const Decimal ratio = target.value / 100;
  Decimal factor = 1;
  if (above_price) {
    factor += ratio;
  } else {
    factor -= ratio;
  }
  return Decimal(current_price * factor);
}

}  // namespace

RiskManager::RiskManager(const Clock* clock)
    : clock_(clock != nullptr ? clock : &DefaultClock()) {}

RiskReport RiskManager::Check(const TradePlanOutput& plan,
                              const RiskProfile& profile,
                              const AccountState& account,
                              const std::optional<Decimal>& current_price) const {
  RiskReport report;
  if (plan.action == TradeAction::kSkip) {
    report.allowed = true;
    report.reasons.push_back("Action is skip");
    return report;
  }
  if (plan.action == TradeAction::kClose) {
    report.allowed = true;
    report.reasons.push_back("Close action allowed");
    return report;
  }
  if (!plan.symbol.has_value() || plan.symbol->empty() ||
      !plan.side.has_value() || !plan.position_size.has_value()) {
    report.reasons.push_back("Missing required fields for open action");
    return report;
  }

  std::vector<std::string>& reasons = report.reasons;
  if (plan.leverage > profile.max_leverage) {
    reasons.push_back("Leverage " + std::to_string(plan.leverage) +
                      " exceeds max " + std::to_string(profile.max_leverage));
  }
  if (account.open_positions >= profile.max_concurrent_positions) {
    reasons.push_back("Max concurrent positions (" +
                      std::to_string(profile.max_concurrent_positions) +
                      ") reached");
  }

  const std::optional<Decimal> quantity =
      CalculateQuantity(plan, profile, current_price);
  if (!quantity.has_value()) {
    reasons.push_back("Could not calculate valid quantity");
  } else {
    std::optional<Decimal> notional;
    if (current_price.has_value() && *current_price > 0) {
      notional = Decimal(*quantity * *current_price);
    }
    if (profile.max_position_notional.has_value() && notional.has_value() &&
        *notional > *profile.max_position_notional) {
      reasons.push_back("Position notional " + DecimalToString(*notional) +
                        " exceeds max " +
                        DecimalToString(*profile.max_position_notional));
    }
    if (profile.max_position_qty.has_value() &&
        *quantity > *profile.max_position_qty) {
      reasons.push_back("Position qty " + DecimalToString(*quantity) +
                        " exceeds max " +
                        DecimalToString(*profile.max_position_qty));
    }
    if (*quantity < profile.min_quantity) {
      reasons.push_back("Position qty " + DecimalToString(*quantity) +
                        " below min " + DecimalToString(profile.min_quantity));
    }
    if (notional.has_value() && *notional < profile.min_notional) {
      reasons.push_back("Position notional " + DecimalToString(*notional) +
                        " below min " + DecimalToString(profile.min_notional));
    }
  }

  if (profile.daily_loss_cap.has_value() && *profile.daily_loss_cap > 0 &&
      account.current_daily_pnl < -*profile.daily_loss_cap) {
    reasons.push_back("Daily loss cap " +
                      DecimalToString(*profile.daily_loss_cap) + " exceeded");
  }

  if (const auto cooldown = CheckCooldown(*plan.symbol, *plan.side,
                                          account.recent_trades,
                                          profile.cooldown_seconds);
      cooldown.has_value()) {
    reasons.push_back(*cooldown);
  }

  if (quantity.has_value() && current_price.has_value() && *current_price > 0 &&
      plan.leverage > 0) {
    const Decimal required_margin =
        Decimal(*quantity * *current_price) / plan.leverage;
    if (required_margin > account.available_balance) {
      reasons.push_back("Insufficient margin: need " +
                        DecimalToString(required_margin) + ", have " +
                        DecimalToString(account.available_balance));
    }
  }

  if (!reasons.empty()) {
    return report;
  }
  report.allowed = true;
  report.normalized_plan = Normalize(plan, *quantity, profile, current_price);
  return report;
}

std::optional<Decimal> RiskManager::CalculateQuantity(
    const TradePlanOutput& plan,
    const RiskProfile& profile,
    const std::optional<Decimal>& current_price) {
  if (!plan.position_size.has_value()) {
    return std::nullopt;
  }
  Decimal quantity;
  if (plan.position_size->mode == SizeMode::kQty) {
    quantity = plan.position_size->value;
  } else {
    if (!current_price.has_value() || *current_price <= 0) {
      return std::nullopt;
    }
    quantity = plan.position_size->value / *current_price;
  }
  quantity = RoundQuantity(quantity, profile.quantity_precision);
  if (quantity <= 0) {
    return std::nullopt;
  }
  return quantity;
}

std::optional<std::string> RiskManager::CheckCooldown(
    const std::string& symbol,
    PositionSide side,
    const std::vector<RecentTrade>& recent_trades,
    int cooldown_seconds) const {
  const std::int64_t cutoff_ms =
      clock_->NowMs() - static_cast<std::int64_t>(cooldown_seconds) * 1000;
  for (const auto& trade : recent_trades) {
    if (trade.symbol == symbol && trade.side == side &&
        trade.created_at_ms > cutoff_ms) {
      return "Cooldown active for " + symbol + " " + ToString(side) +
             " (wait " + std::to_string(cooldown_seconds) + "s)";
    }
  }
  return std::nullopt;
}

NormalizedPlan RiskManager::Normalize(
    const TradePlanOutput& plan,
    const Decimal& quantity,
    const RiskProfile& profile,
    const std::optional<Decimal>& current_price) const {
  NormalizedPlan normalized;
  normalized.symbol = *plan.symbol;
  normalized.side = *plan.side;
  normalized.quantity = quantity;
  normalized.leverage = std::min(plan.leverage, profile.max_leverage);
  normalized.entry_type =
      plan.entry.has_value() ? plan.entry->type : EntryType::kMarket;
  normalized.time_in_force = plan.time_in_force;
  if (plan.entry.has_value() && plan.entry->price.has_value() &&
      *plan.entry->price > 0) {
    normalized.entry_price =
        RoundPrice(*plan.entry->price, profile.price_precision);
  }

  // 多头 TP 在上方、SL 在下方；空头相反。
  const bool is_long = *plan.side == PositionSide::kLong;
  if (current_price.has_value() && *current_price > 0) {
    if (plan.tp.has_value()) {
      normalized.tp_price = RoundPrice(
          TargetPrice(*plan.tp, *current_price, is_long), profile.price_precision);
    }
    if (plan.sl.has_value()) {
      normalized.sl_price = RoundPrice(
          TargetPrice(*plan.sl, *current_price, !is_long), profile.price_precision);
    }
  }
  return normalized;
}

bool GenerateClientOrderId(const std::string& trader_id,
                           const std::string& signal_id,
                           std::int64_t timestamp_ms,
                           std::string* out_client_order_id,
                           std::string* out_error) {
  if (out_client_order_id == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_client_order_id 不能为空";
    }
    return false;
  }
  const std::string payload =
      trader_id + ":" + signal_id + ":" + FormatUtcMinuteBucket(timestamp_ms);
  std::string digest;
  if (!Sha256Hex(payload, &digest, out_error)) {
    return false;
  }
  *out_client_order_id = "T" + digest.substr(0, kClientOrderIdHashLength);
  return true;
}

}  // namespace trade_pilot
