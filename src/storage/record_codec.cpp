#include "storage/record_codec.h"

#include <cstdint>
#include <optional>

#include "core/decimal.h"

namespace trade_pilot {

namespace {

std::string Str(const JsonValue& json, const std::string& key) {
  return JsonAsString(JsonObjectField(&json, key)).value_or("");
}

bool Bool(const JsonValue& json, const std::string& key, bool fallback) {
  return JsonAsBool(JsonObjectField(&json, key)).value_or(fallback);
}

std::int64_t Int64(const JsonValue& json,
                   const std::string& key,
                   std::int64_t fallback) {
  return JsonAsInt64(JsonObjectField(&json, key)).value_or(fallback);
}

std::optional<std::int64_t> OptionalInt64(const JsonValue& json,
                                          const std::string& key) {
  return JsonAsInt64(JsonObjectField(&json, key));
}

JsonValue Field(const JsonValue& json, const std::string& key) {
  const JsonValue* value = JsonObjectField(&json, key);
  return value != nullptr ? *value : MakeJsonNull();
}

JsonValue OptionalInt64ToJson(const std::optional<std::int64_t>& value) {
  return value.has_value() ? MakeJsonInt(*value) : MakeJsonNull();
}

bool RequireObject(const JsonValue& json,
                   const char* kind,
                   std::string* out_error) {
  if (json.type != JsonType::kObject || Str(json, "id").empty()) {
    if (out_error != nullptr) {
      *out_error = std::string(kind) + " 记录缺少 id 或不是对象";
    }
    return false;
  }
  return true;
}

bool RequireDecimal(const JsonValue& json,
                    const std::string& key,
                    Decimal* out_value,
                    std::string* out_error) {
  const auto parsed = JsonAsDecimal(JsonObjectField(&json, key));
  if (!parsed.has_value()) {
    if (out_error != nullptr) {
      *out_error = "字段 " + key + " 不是合法十进制数";
    }
    return false;
  }
  *out_value = *parsed;
  return true;
}

template <typename Enum>
bool RequireEnum(const JsonValue& json,
                 const std::string& key,
                 bool (*parse)(const std::string&, Enum*),
                 Enum* out_value,
                 std::string* out_error) {
  const std::string text = Str(json, key);
  if (!parse(text, out_value)) {
    if (out_error != nullptr) {
      *out_error = "字段 " + key + " 取值非法: " + text;
    }
    return false;
  }
  return true;
}

JsonValue StringsToJson(const std::vector<std::string>& values) {
  JsonValue out = MakeJsonArray();
  for (const auto& value : values) {
    JsonPush(&out, MakeJsonString(value));
  }
  return out;
}

std::vector<std::string> StringsFromJson(const JsonValue* array) {
  std::vector<std::string> out;
  if (array == nullptr || array->type != JsonType::kArray) {
    return out;
  }
  for (const auto& item : array->array_value) {
    if (const auto text = JsonAsString(&item); text.has_value()) {
      out.push_back(*text);
    }
  }
  return out;
}

JsonValue OptionalDecimalText(const std::optional<Decimal>& value) {
  return value.has_value() ? MakeJsonString(DecimalToString(*value))
                           : MakeJsonNull();
}

}  // namespace

JsonValue RecordToJson(const ExchangeAccountRecord& record) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "id", MakeJsonString(record.id));
  JsonSet(&out, "exchange", MakeJsonString(record.exchange));
  JsonSet(&out, "label", MakeJsonString(record.label));
  JsonSet(&out, "api_key_encrypted", MakeJsonString(record.api_key_encrypted));
  JsonSet(&out, "api_secret_encrypted",
          MakeJsonString(record.api_secret_encrypted));
  JsonSet(&out, "is_testnet", MakeJsonBool(record.is_testnet));
  JsonSet(&out, "status", MakeJsonString(record.status));
  JsonSet(&out, "created_at_ms", MakeJsonInt(record.created_at_ms));
  return out;
}

bool RecordFromJson(const JsonValue& json,
                    ExchangeAccountRecord* out_record,
                    std::string* out_error) {
  if (!RequireObject(json, "exchange_account", out_error)) {
    return false;
  }
  ExchangeAccountRecord record;
  record.id = Str(json, "id");
  record.exchange = Str(json, "exchange");
  record.label = Str(json, "label");
  record.api_key_encrypted = Str(json, "api_key_encrypted");
  record.api_secret_encrypted = Str(json, "api_secret_encrypted");
  record.is_testnet = Bool(json, "is_testnet", false);
  record.status = Str(json, "status");
  record.created_at_ms = Int64(json, "created_at_ms", 0);
  *out_record = std::move(record);
  return true;
}

JsonValue RecordToJson(const ModelConfigRecord& record) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "id", MakeJsonString(record.id));
  JsonSet(&out, "provider", MakeJsonString(record.provider));
  JsonSet(&out, "model_name", MakeJsonString(record.model_name));
  JsonSet(&out, "label", MakeJsonString(record.label));
  JsonSet(&out, "api_key_encrypted", MakeJsonString(record.api_key_encrypted));
  JsonSet(&out, "base_url", MakeJsonString(record.base_url));
  JsonSet(&out, "created_at_ms", MakeJsonInt(record.created_at_ms));
  return out;
}

bool RecordFromJson(const JsonValue& json,
                    ModelConfigRecord* out_record,
                    std::string* out_error) {
  if (!RequireObject(json, "model_config", out_error)) {
    return false;
  }
  ModelConfigRecord record;
  record.id = Str(json, "id");
  record.provider = Str(json, "provider");
  record.model_name = Str(json, "model_name");
  record.label = Str(json, "label");
  record.api_key_encrypted = Str(json, "api_key_encrypted");
  record.base_url = Str(json, "base_url");
  record.created_at_ms = Int64(json, "created_at_ms", 0);
  *out_record = std::move(record);
  return true;
}

JsonValue RecordToJson(const StrategyRecord& record) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "id", MakeJsonString(record.id));
  JsonSet(&out, "name", MakeJsonString(record.name));
  JsonSet(&out, "enabled", MakeJsonBool(record.enabled));
  JsonSet(&out, "symbols", StringsToJson(record.symbols));
  JsonSet(&out, "timeframe", MakeJsonString(record.timeframe));
  JsonSet(&out, "risk_json", record.risk_json);
  JsonSet(&out, "cooldown_seconds", MakeJsonInt(record.cooldown_seconds));
  JsonSet(&out, "created_at_ms", MakeJsonInt(record.created_at_ms));
  return out;
}

bool RecordFromJson(const JsonValue& json,
                    StrategyRecord* out_record,
                    std::string* out_error) {
  if (!RequireObject(json, "strategy", out_error)) {
    return false;
  }
  StrategyRecord record;
  record.id = Str(json, "id");
  record.name = Str(json, "name");
  record.enabled = Bool(json, "enabled", false);
  record.symbols = StringsFromJson(JsonObjectField(&json, "symbols"));
  record.timeframe = Str(json, "timeframe");
  record.risk_json = Field(json, "risk_json");
  if (record.risk_json.type != JsonType::kObject) {
    record.risk_json = MakeJsonObject();
  }
  record.cooldown_seconds =
      static_cast<int>(Int64(json, "cooldown_seconds", 3600));
  record.created_at_ms = Int64(json, "created_at_ms", 0);
  *out_record = std::move(record);
  return true;
}

JsonValue RecordToJson(const TraderRecord& record) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "id", MakeJsonString(record.id));
  JsonSet(&out, "name", MakeJsonString(record.name));
  JsonSet(&out, "exchange_account_id",
          MakeJsonString(record.exchange_account_id));
  JsonSet(&out, "model_config_id", MakeJsonString(record.model_config_id));
  JsonSet(&out, "strategy_id", MakeJsonString(record.strategy_id));
  JsonSet(&out, "enabled", MakeJsonBool(record.enabled));
  JsonSet(&out, "mode", MakeJsonString(ToString(record.mode)));
  JsonSet(&out, "max_concurrent_positions",
          MakeJsonInt(record.max_concurrent_positions));
  JsonSet(&out, "daily_loss_cap", MakeJsonOptionalDecimal(record.daily_loss_cap));
  JsonSet(&out, "created_at_ms", MakeJsonInt(record.created_at_ms));
  return out;
}

bool RecordFromJson(const JsonValue& json,
                    TraderRecord* out_record,
                    std::string* out_error) {
  if (!RequireObject(json, "trader", out_error)) {
    return false;
  }
  TraderRecord record;
  record.id = Str(json, "id");
  record.name = Str(json, "name");
  record.exchange_account_id = Str(json, "exchange_account_id");
  record.model_config_id = Str(json, "model_config_id");
  record.strategy_id = Str(json, "strategy_id");
  record.enabled = Bool(json, "enabled", false);
  if (!RequireEnum(json, "mode", &ParseTraderMode, &record.mode, out_error)) {
    return false;
  }
  record.max_concurrent_positions =
      static_cast<int>(Int64(json, "max_concurrent_positions", 3));
  record.daily_loss_cap = JsonAsDecimal(JsonObjectField(&json, "daily_loss_cap"));
  record.created_at_ms = Int64(json, "created_at_ms", 0);
  *out_record = std::move(record);
  return true;
}

JsonValue RecordToJson(const MarketSnapshotRecord& record) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "id", MakeJsonString(record.id));
  JsonSet(&out, "exchange", MakeJsonString(record.exchange));
  JsonSet(&out, "symbol", MakeJsonString(record.symbol));
  JsonSet(&out, "timeframe", MakeJsonString(record.timeframe));
  JsonSet(&out, "timestamp_ms", MakeJsonInt(record.timestamp_ms));
  JsonSet(&out, "ohlcv", record.ohlcv);
  JsonSet(&out, "indicators", record.indicators);
  JsonSet(&out, "created_at_ms", MakeJsonInt(record.created_at_ms));
  return out;
}

bool RecordFromJson(const JsonValue& json,
                    MarketSnapshotRecord* out_record,
                    std::string* out_error) {
  if (!RequireObject(json, "market_snapshot", out_error)) {
    return false;
  }
  MarketSnapshotRecord record;
  record.id = Str(json, "id");
  record.exchange = Str(json, "exchange");
  record.symbol = Str(json, "symbol");
  record.timeframe = Str(json, "timeframe");
  record.timestamp_ms = Int64(json, "timestamp_ms", 0);
  record.ohlcv = Field(json, "ohlcv");
  record.indicators = Field(json, "indicators");
  record.created_at_ms = Int64(json, "created_at_ms", 0);
  *out_record = std::move(record);
  return true;
}

JsonValue RecordToJson(const SignalRecord& record) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "id", MakeJsonString(record.id));
  JsonSet(&out, "strategy_id", MakeJsonString(record.strategy_id));
  JsonSet(&out, "symbol", MakeJsonString(record.symbol));
  JsonSet(&out, "timeframe", MakeJsonString(record.timeframe));
  JsonSet(&out, "side", MakeJsonString(ToString(record.side)));
  JsonSet(&out, "score", MakeJsonDecimal(record.score));
  JsonSet(&out, "snapshot_id", MakeJsonString(record.snapshot_id));
  JsonSet(&out, "reason_summary", MakeJsonString(record.reason_summary));
  JsonSet(&out, "created_at_ms", MakeJsonInt(record.created_at_ms));
  return out;
}

bool RecordFromJson(const JsonValue& json,
                    SignalRecord* out_record,
                    std::string* out_error) {
  if (!RequireObject(json, "signal", out_error)) {
    return false;
  }
  SignalRecord record;
  record.id = Str(json, "id");
  record.strategy_id = Str(json, "strategy_id");
  record.symbol = Str(json, "symbol");
  record.timeframe = Str(json, "timeframe");
  if (!RequireEnum(json, "side", &ParsePositionSide, &record.side, out_error) ||
      !RequireDecimal(json, "score", &record.score, out_error)) {
    return false;
  }
  record.snapshot_id = Str(json, "snapshot_id");
  record.reason_summary = Str(json, "reason_summary");
  record.created_at_ms = Int64(json, "created_at_ms", 0);
  *out_record = std::move(record);
  return true;
}

JsonValue RecordToJson(const DecisionLogRecord& record) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "id", MakeJsonString(record.id));
  JsonSet(&out, "trader_id", MakeJsonString(record.trader_id));
  JsonSet(&out, "signal_id", MakeJsonString(record.signal_id));
  JsonSet(&out, "client_order_id", MakeJsonString(record.client_order_id));
  JsonSet(&out, "status", MakeJsonString(ToString(record.status)));
  JsonSet(&out, "input_snapshot", record.input_snapshot);
  JsonSet(&out, "trade_plan", record.trade_plan);
  JsonSet(&out, "confidence",
          record.confidence.has_value() ? MakeJsonNumber(*record.confidence)
                                        : MakeJsonNull());
  JsonSet(&out, "reason_summary", MakeJsonString(record.reason_summary));
  JsonSet(&out, "evidence", record.evidence);
  JsonSet(&out, "risk_allowed",
          record.risk_allowed.has_value() ? MakeJsonBool(*record.risk_allowed)
                                          : MakeJsonNull());
  JsonSet(&out, "risk_reasons", StringsToJson(record.risk_reasons));
  JsonSet(&out, "normalized_plan", record.normalized_plan);
  JsonSet(&out, "trade_plan_id", MakeJsonString(record.trade_plan_id));
  JsonSet(&out, "execution_error", MakeJsonString(record.execution_error));
  JsonSet(&out, "model_provider", MakeJsonString(record.model_provider));
  JsonSet(&out, "model_name", MakeJsonString(record.model_name));
  JsonSet(&out, "tokens_used", OptionalInt64ToJson(record.tokens_used));
  JsonSet(&out, "is_paper", MakeJsonBool(record.is_paper));
  JsonSet(&out, "created_at_ms", MakeJsonInt(record.created_at_ms));
  return out;
}

bool RecordFromJson(const JsonValue& json,
                    DecisionLogRecord* out_record,
                    std::string* out_error) {
  if (!RequireObject(json, "decision_log", out_error)) {
    return false;
  }
  DecisionLogRecord record;
  record.id = Str(json, "id");
  record.trader_id = Str(json, "trader_id");
  record.signal_id = Str(json, "signal_id");
  record.client_order_id = Str(json, "client_order_id");
  if (!RequireEnum(json, "status", &ParseDecisionStatus, &record.status,
                   out_error)) {
    return false;
  }
  record.input_snapshot = Field(json, "input_snapshot");
  record.trade_plan = Field(json, "trade_plan");
  record.confidence = JsonAsNumber(JsonObjectField(&json, "confidence"));
  record.reason_summary = Str(json, "reason_summary");
  record.evidence = Field(json, "evidence");
  record.risk_allowed = JsonAsBool(JsonObjectField(&json, "risk_allowed"));
  record.risk_reasons = StringsFromJson(JsonObjectField(&json, "risk_reasons"));
  record.normalized_plan = Field(json, "normalized_plan");
  record.trade_plan_id = Str(json, "trade_plan_id");
  record.execution_error = Str(json, "execution_error");
  record.model_provider = Str(json, "model_provider");
  record.model_name = Str(json, "model_name");
  record.tokens_used = OptionalInt64(json, "tokens_used");
  record.is_paper = Bool(json, "is_paper", false);
  record.created_at_ms = Int64(json, "created_at_ms", 0);
  *out_record = std::move(record);
  return true;
}

JsonValue RecordToJson(const TradePlanRecord& record) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "id", MakeJsonString(record.id));
  JsonSet(&out, "exchange_account_id",
          MakeJsonString(record.exchange_account_id));
  JsonSet(&out, "client_order_id", MakeJsonString(record.client_order_id));
  JsonSet(&out, "symbol", MakeJsonString(record.symbol));
  JsonSet(&out, "side", MakeJsonString(ToString(record.side)));
  JsonSet(&out, "quantity", MakeJsonDecimal(record.quantity));
  JsonSet(&out, "entry_price", MakeJsonOptionalDecimal(record.entry_price));
  JsonSet(&out, "tp_price", MakeJsonOptionalDecimal(record.tp_price));
  JsonSet(&out, "sl_price", MakeJsonOptionalDecimal(record.sl_price));
  JsonSet(&out, "leverage", MakeJsonInt(record.leverage));
  JsonSet(&out, "entry_order", record.entry_order);
  JsonSet(&out, "tp_order", record.tp_order);
  JsonSet(&out, "sl_order", record.sl_order);
  JsonSet(&out, "status", MakeJsonString(ToString(record.status)));
  JsonSet(&out, "is_paper", MakeJsonBool(record.is_paper));
  JsonSet(&out, "error_message", MakeJsonString(record.error_message));
  JsonSet(&out, "created_at_ms", MakeJsonInt(record.created_at_ms));
  JsonSet(&out, "updated_at_ms", MakeJsonInt(record.updated_at_ms));
  return out;
}

bool RecordFromJson(const JsonValue& json,
                    TradePlanRecord* out_record,
                    std::string* out_error) {
  if (!RequireObject(json, "trade_plan", out_error)) {
    return false;
  }
  TradePlanRecord record;
  record.id = Str(json, "id");
  record.exchange_account_id = Str(json, "exchange_account_id");
  record.client_order_id = Str(json, "client_order_id");
  record.symbol = Str(json, "symbol");
  if (!RequireEnum(json, "side", &ParsePositionSide, &record.side, out_error) ||
      !RequireDecimal(json, "quantity", &record.quantity, out_error) ||
      !RequireEnum(json, "status", &ParseTradePlanStatus, &record.status,
                   out_error)) {
    return false;
  }
  record.entry_price = JsonAsDecimal(JsonObjectField(&json, "entry_price"));
  record.tp_price = JsonAsDecimal(JsonObjectField(&json, "tp_price"));
  record.sl_price = JsonAsDecimal(JsonObjectField(&json, "sl_price"));
  record.leverage = static_cast<int>(Int64(json, "leverage", 1));
  record.entry_order = Field(json, "entry_order");
  record.tp_order = Field(json, "tp_order");
  record.sl_order = Field(json, "sl_order");
  record.is_paper = Bool(json, "is_paper", true);
  record.error_message = Str(json, "error_message");
  record.created_at_ms = Int64(json, "created_at_ms", 0);
  record.updated_at_ms = Int64(json, "updated_at_ms", record.created_at_ms);
  *out_record = std::move(record);
  return true;
}

JsonValue RecordToJson(const ExecutionRecord& record) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "id", MakeJsonString(record.id));
  JsonSet(&out, "trade_plan_id", MakeJsonString(record.trade_plan_id));
  JsonSet(&out, "order_type", MakeJsonString(ToString(record.order_type)));
  JsonSet(&out, "exchange_order_id", MakeJsonString(record.exchange_order_id));
  JsonSet(&out, "client_order_id", MakeJsonString(record.client_order_id));
  JsonSet(&out, "symbol", MakeJsonString(record.symbol));
  JsonSet(&out, "side", MakeJsonString(ToString(record.side)));
  JsonSet(&out, "quantity", MakeJsonDecimal(record.quantity));
  JsonSet(&out, "price", MakeJsonOptionalDecimal(record.price));
  JsonSet(&out, "status", MakeJsonString(ToString(record.status)));
  JsonSet(&out, "exchange_response", record.exchange_response);
  JsonSet(&out, "error_message", MakeJsonString(record.error_message));
  JsonSet(&out, "is_paper", MakeJsonBool(record.is_paper));
  JsonSet(&out, "filled_at_ms", OptionalInt64ToJson(record.filled_at_ms));
  JsonSet(&out, "created_at_ms", MakeJsonInt(record.created_at_ms));
  JsonSet(&out, "updated_at_ms", MakeJsonInt(record.updated_at_ms));
  return out;
}

bool RecordFromJson(const JsonValue& json,
                    ExecutionRecord* out_record,
                    std::string* out_error) {
  if (!RequireObject(json, "execution", out_error)) {
    return false;
  }
  ExecutionRecord record;
  record.id = Str(json, "id");
  record.trade_plan_id = Str(json, "trade_plan_id");
  if (!RequireEnum(json, "order_type", &ParseExecutionOrderType,
                   &record.order_type, out_error) ||
      !RequireEnum(json, "side", &ParseOrderSide, &record.side, out_error) ||
      !RequireDecimal(json, "quantity", &record.quantity, out_error) ||
      !RequireEnum(json, "status", &ParseExecutionStatus, &record.status,
                   out_error)) {
    return false;
  }
  record.exchange_order_id = Str(json, "exchange_order_id");
  record.client_order_id = Str(json, "client_order_id");
  record.symbol = Str(json, "symbol");
  record.price = JsonAsDecimal(JsonObjectField(&json, "price"));
  record.exchange_response = Field(json, "exchange_response");
  record.error_message = Str(json, "error_message");
  record.is_paper = Bool(json, "is_paper", true);
  record.filled_at_ms = OptionalInt64(json, "filled_at_ms");
  record.created_at_ms = Int64(json, "created_at_ms", 0);
  record.updated_at_ms = Int64(json, "updated_at_ms", record.created_at_ms);
  *out_record = std::move(record);
  return true;
}

JsonValue NormalizedPlanToJson(const NormalizedPlan& plan) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "symbol", MakeJsonString(plan.symbol));
  JsonSet(&out, "side", MakeJsonString(ToString(plan.side)));
  JsonSet(&out, "quantity", MakeJsonString(DecimalToString(plan.quantity)));
  JsonSet(&out, "leverage", MakeJsonInt(plan.leverage));
  JsonSet(&out, "entry_type", MakeJsonString(ToString(plan.entry_type)));
  JsonSet(&out, "entry_price", OptionalDecimalText(plan.entry_price));
  JsonSet(&out, "tp_price", OptionalDecimalText(plan.tp_price));
  JsonSet(&out, "sl_price", OptionalDecimalText(plan.sl_price));
  JsonSet(&out, "time_in_force",
          plan.time_in_force.has_value()
              ? MakeJsonString(ToString(*plan.time_in_force))
              : MakeJsonNull());
  return out;
}

JsonValue OhlcvTail(const JsonValue& ohlcv, std::size_t points) {
  if (ohlcv.type != JsonType::kObject) {
    return MakeJsonObject();
  }
  JsonValue out = MakeJsonObject();
  for (const auto& [key, series] : ohlcv.object_value) {
    if (series.type != JsonType::kArray || series.array_value.size() <= points) {
      JsonSet(&out, key, series);
      continue;
    }
    JsonValue tail = MakeJsonArray();
    const std::size_t begin = series.array_value.size() - points;
    for (std::size_t i = begin; i < series.array_value.size(); ++i) {
      JsonPush(&tail, series.array_value[i]);
    }
    JsonSet(&out, key, std::move(tail));
  }
  return out;
}

std::optional<Decimal> OhlcvLastClose(const JsonValue& ohlcv) {
  const JsonValue* close = JsonObjectField(&ohlcv, "close");
  if (close == nullptr || close->type != JsonType::kArray ||
      close->array_value.empty()) {
    return std::nullopt;
  }
  return JsonAsDecimal(&close->array_value.back());
}

}  // namespace trade_pilot
