#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/clock.h"
#include "core/decimal.h"
#include "core/types.h"

namespace trade_pilot {

/// 策略 + trader 级风控参数（每轮周期只读快照）。
struct RiskProfile {
  int max_leverage{10};
  std::optional<Decimal> max_position_notional;
  std::optional<Decimal> max_position_qty;
  int max_concurrent_positions{5};
  int cooldown_seconds{3600};
  std::optional<Decimal> daily_loss_cap;
  int price_precision{2};
  int quantity_precision{3};
  Decimal min_quantity{"0.001"};
  Decimal min_notional{"5"};
};

/// 冷却检查使用的近期成交（来自已执行的决策日志）。
struct RecentTrade {
  std::string symbol;
  PositionSide side{PositionSide::kLong};
  std::int64_t created_at_ms{0};
};

/// 账户状态：每轮重新构建，不跨周期缓存。
struct AccountState {
  Decimal available_balance{0};
  int open_positions{0};
  Decimal current_daily_pnl{0};
  std::vector<RecentTrade> recent_trades;
};

/**
 * @brief 风控结论
 *
 * 不变式：`allowed == false` 时 normalized_plan 必为空，
 * reasons 包含本次检查发现的全部违例。
 */
struct RiskReport {
  bool allowed{false};
  std::vector<std::string> reasons;
  std::optional<NormalizedPlan> normalized_plan;
};

/**
 * @brief 风控硬闸门
 *
 * 只对 open 动作做仓位风控，skip/close 直接放行。
 * 各项检查独立求值并全部收集，不短路；全部通过才输出归一化计划。
 */
class RiskManager {
 public:
  explicit RiskManager(const Clock* clock = nullptr);

  /**
   * @param current_price 当前价；为空时按“无价”降级：
   *        名义金额仓位无法换算数量，TP/SL 不计算
   */
  RiskReport Check(const TradePlanOutput& plan,
                   const RiskProfile& profile,
                   const AccountState& account,
                   const std::optional<Decimal>& current_price) const;

  /// 按仓位口径计算数量并向零截断；结果不为正时返回空。
  static std::optional<Decimal> CalculateQuantity(
      const TradePlanOutput& plan,
      const RiskProfile& profile,
      const std::optional<Decimal>& current_price);

 private:
  std::optional<std::string> CheckCooldown(
      const std::string& symbol,
      PositionSide side,
      const std::vector<RecentTrade>& recent_trades,
      int cooldown_seconds) const;

  NormalizedPlan Normalize(const TradePlanOutput& plan,
                           const Decimal& quantity,
                           const RiskProfile& profile,
                           const std::optional<Decimal>& current_price) const;

  const Clock* clock_{nullptr};
};

/**
 * @brief 生成幂等 client_order_id
 *
 * `"T" + sha256("trader:signal:%Y%m%d%H%M")[0:16]`，时间按 UTC 分钟截断：
 * 同一 trader/signal 在同一分钟内重复调用得到同一个键。
 */
bool GenerateClientOrderId(const std::string& trader_id,
                           const std::string& signal_id,
                           std::int64_t timestamp_ms,
                           std::string* out_client_order_id,
                           std::string* out_error);

}  // namespace trade_pilot
