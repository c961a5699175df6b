#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/decimal.h"
#include "core/json_utils.h"
#include "core/types.h"

namespace trade_pilot {

/**
 * 持久化记录（存储无关的逻辑形状）。
 *
 * `id` 与 `created_at_ms` 由存储层在插入时分配；
 * 时间戳统一为 UTC 毫秒。
 */

/// 交易所账户（凭证为密文，只在周期内解密）。
struct ExchangeAccountRecord {
  std::string id;
  std::string exchange;  ///< binance / gate / bybit。
  std::string label;
  std::string api_key_encrypted;
  std::string api_secret_encrypted;
  bool is_testnet{false};
  std::string status{"active"};
  std::int64_t created_at_ms{0};
};

/// 模型配置。
struct ModelConfigRecord {
  std::string id;
  std::string provider;  ///< openai / anthropic / google。
  std::string model_name;
  std::string label;
  std::string api_key_encrypted;
  std::string base_url;  ///< 为空使用供应商默认地址。
  std::int64_t created_at_ms{0};
};

/// 策略：风控参数以 JSON 保存，周期开始时转换为 RiskProfile。
struct StrategyRecord {
  std::string id;
  std::string name;
  bool enabled{false};
  std::vector<std::string> symbols;
  std::string timeframe{"1h"};
  JsonValue risk_json{MakeJsonObject()};
  int cooldown_seconds{3600};
  std::int64_t created_at_ms{0};
};

struct TraderRecord {
  std::string id;
  std::string name;
  std::string exchange_account_id;
  std::string model_config_id;
  std::string strategy_id;
  bool enabled{false};
  TraderMode mode{TraderMode::kPaper};
  int max_concurrent_positions{3};
  std::optional<Decimal> daily_loss_cap;
  std::int64_t created_at_ms{0};
};

/// 行情快照：ohlcv 为 `{open:[],high:[],low:[],close:[],volume:[]}`。
struct MarketSnapshotRecord {
  std::string id;
  std::string exchange;
  std::string symbol;
  std::string timeframe;
  std::int64_t timestamp_ms{0};
  JsonValue ohlcv{MakeJsonObject()};
  JsonValue indicators{MakeJsonObject()};
  std::int64_t created_at_ms{0};
};

/// 触发器产出的信号，创建后不可变。
struct SignalRecord {
  std::string id;
  std::string strategy_id;
  std::string symbol;
  std::string timeframe;
  PositionSide side{PositionSide::kLong};
  Decimal score{1};
  std::string snapshot_id;  ///< 可为空。
  std::string reason_summary;
  std::int64_t created_at_ms{0};
};

/**
 * @brief 决策日志（每个 signal x trader 一条审计记录）
 *
 * 不变式：`risk_allowed == false` 时 trade_plan_id 必为空。
 * 不保存模型原始输出。
 */
struct DecisionLogRecord {
  std::string id;
  std::string trader_id;
  std::string signal_id;
  std::string client_order_id;
  DecisionStatus status{DecisionStatus::kPending};
  JsonValue input_snapshot{MakeJsonObject()};
  JsonValue trade_plan;  ///< 计划摘要；校验失败时为 null。
  std::optional<double> confidence;
  std::string reason_summary;
  JsonValue evidence;
  std::optional<bool> risk_allowed;
  std::vector<std::string> risk_reasons;
  JsonValue normalized_plan;
  std::string trade_plan_id;
  std::string execution_error;
  std::string model_provider;
  std::string model_name;
  std::optional<std::int64_t> tokens_used;
  bool is_paper{false};
  std::int64_t created_at_ms{0};
};

/// 交易计划：一次开仓意图，状态只前进。
struct TradePlanRecord {
  std::string id;
  std::string exchange_account_id;
  std::string client_order_id;
  std::string symbol;
  PositionSide side{PositionSide::kLong};
  Decimal quantity{0};
  std::optional<Decimal> entry_price;  ///< 实际成交价。
  std::optional<Decimal> tp_price;
  std::optional<Decimal> sl_price;
  int leverage{1};
  JsonValue entry_order;
  JsonValue tp_order;
  JsonValue sl_order;
  TradePlanStatus status{TradePlanStatus::kPending};
  bool is_paper{true};
  std::string error_message;
  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};
};

/// 单笔交易所订单。
struct ExecutionRecord {
  std::string id;
  std::string trade_plan_id;
  ExecutionOrderType order_type{ExecutionOrderType::kEntry};
  std::string exchange_order_id;  ///< 下单失败时为空。
  std::string client_order_id;
  std::string symbol;
  OrderSide side{OrderSide::kBuy};
  Decimal quantity{0};
  std::optional<Decimal> price;
  ExecutionStatus status{ExecutionStatus::kPending};
  JsonValue exchange_response;
  std::string error_message;
  bool is_paper{true};
  std::optional<std::int64_t> filled_at_ms;
  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};
};

/// 决策查询条件（空值表示不过滤）。
struct DecisionFilter {
  std::string trader_id;
  std::optional<DecisionStatus> status;
  std::optional<bool> is_paper;
  std::size_t limit{100};
};

/// 交易计划查询条件。
struct TradePlanFilter {
  std::string exchange_account_id;
  std::optional<TradePlanStatus> status;
  std::optional<bool> is_paper;
  std::size_t limit{100};
};

}  // namespace trade_pilot
