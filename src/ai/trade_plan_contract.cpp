#include "ai/trade_plan_contract.h"

#include <cmath>
#include <cstddef>

#include "core/decimal.h"
#include "core/log.h"
#include "core/text.h"

namespace trade_pilot {

namespace {

constexpr std::size_t kInvalidJsonReasonMax = 100;
constexpr std::size_t kSchemaReasonMax = 200;

constexpr char kTradePlanSchemaText[] = R"json({
  "type": "object",
  "properties": {
    "action": {"type": "string", "enum": ["open", "close", "skip"]},
    "symbol": {"type": "string"},
    "side": {"type": "string", "enum": ["long", "short"]},
    "entry": {
      "type": "object",
      "properties": {
        "type": {"type": "string", "enum": ["market", "limit"]},
        "price": {"type": ["number", "null"]}
      },
      "required": ["type"]
    },
    "position_size": {
      "type": "object",
      "properties": {
        "mode": {"type": "string", "enum": ["notional", "qty"]},
        "value": {"type": "number"}
      },
      "required": ["mode", "value"]
    },
    "leverage": {"type": "integer", "minimum": 1, "maximum": 125},
    "tp": {
      "type": "object",
      "properties": {
        "mode": {"type": "string", "enum": ["percent", "price"]},
        "value": {"type": "number"}
      },
      "required": ["mode", "value"]
    },
    "sl": {
      "type": "object",
      "properties": {
        "mode": {"type": "string", "enum": ["percent", "price"]},
        "value": {"type": "number"}
      },
      "required": ["mode", "value"]
    },
    "time_in_force": {"type": ["string", "null"], "enum": ["GTC", "IOC", null]},
    "confidence": {"type": "number", "minimum": 0, "maximum": 1},
    "reason_summary": {"type": "string", "maxLength": 500},
    "evidence": {
      "type": "object",
      "properties": {
        "signals": {"type": "array"},
        "indicators": {"type": "object"},
        "key_levels": {"type": "object"}
      }
    }
  },
  "required": ["action", "confidence", "reason_summary"],
  "additionalProperties": false
})json";

bool IsIntegral(const JsonValue& value) {
  if (value.type != JsonType::kNumber) {
    return false;
  }
  return std::isfinite(value.number_value) &&
         std::floor(value.number_value) == value.number_value;
}

bool MatchesType(const std::string& type, const JsonValue& value) {
  if (type == "integer") {
    return IsIntegral(value);
  }
  if (type == "object") {
    return value.type == JsonType::kObject;
  }
  if (type == "array") {
    return value.type == JsonType::kArray;
  }
  if (type == "string") {
    return value.type == JsonType::kString;
  }
  if (type == "number") {
    return value.type == JsonType::kNumber;
  }
  if (type == "boolean") {
    return value.type == JsonType::kBool;
  }
  return type == "null" && value.type == JsonType::kNull;
}

bool JsonEquals(const JsonValue& lhs, const JsonValue& rhs) {
  if (lhs.type != rhs.type) {
    return false;
  }
  switch (lhs.type) {
    case JsonType::kNull:
      return true;
    case JsonType::kBool:
      return lhs.bool_value == rhs.bool_value;
    case JsonType::kNumber:
      return lhs.number_value == rhs.number_value;
    case JsonType::kString:
      return lhs.string_value == rhs.string_value;
    default:
      return SerializeJson(lhs) == SerializeJson(rhs);
  }
}

std::string Quoted(const JsonValue& value) {
  if (value.type == JsonType::kString) {
    return "'" + value.string_value + "'";
  }
  return SerializeJson(value);
}

bool Fail(std::string* out_message, const std::string& message) {
  if (out_message != nullptr) {
    *out_message = message;
  }
  return false;
}

std::optional<PriceTarget> ParsePriceTarget(const JsonValue* node) {
  if (JsonIsNull(node)) {
    return std::nullopt;
  }
  PriceTarget target;
  ParsePriceTargetMode(JsonAsString(JsonObjectField(node, "mode")).value_or(""),
                       &target.mode);
  target.value = JsonAsDecimal(JsonObjectField(node, "value")).value_or(Decimal(0));
  return target;
}

/// schema 已保证类型与枚举合法，这里只做字段搬运。
TradePlanOutput ParseTradePlan(const JsonValue& root) {
  TradePlanOutput plan;
  ParseTradeAction(JsonAsString(JsonObjectField(&root, "action")).value_or(""),
                   &plan.action);
  if (const auto symbol = JsonAsString(JsonObjectField(&root, "symbol"));
      symbol.has_value()) {
    plan.symbol = *symbol;
  }
  if (const auto side = JsonAsString(JsonObjectField(&root, "side"));
      side.has_value()) {
    PositionSide parsed = PositionSide::kLong;
    if (ParsePositionSide(*side, &parsed)) {
      plan.side = parsed;
    }
  }
  if (const JsonValue* entry = JsonObjectField(&root, "entry");
      !JsonIsNull(entry)) {
    EntrySpec spec;
    ParseEntryType(JsonAsString(JsonObjectField(entry, "type")).value_or(""),
                   &spec.type);
    spec.price = JsonAsDecimal(JsonObjectField(entry, "price"));
    plan.entry = spec;
  }
  if (const JsonValue* size = JsonObjectField(&root, "position_size");
      !JsonIsNull(size)) {
    PositionSize spec;
    ParseSizeMode(JsonAsString(JsonObjectField(size, "mode")).value_or(""),
                  &spec.mode);
    spec.value = JsonAsDecimal(JsonObjectField(size, "value")).value_or(Decimal(0));
    plan.position_size = spec;
  }
  if (const auto leverage = JsonAsNumber(JsonObjectField(&root, "leverage"));
      leverage.has_value()) {
    plan.leverage = static_cast<int>(*leverage);
  }
  plan.tp = ParsePriceTarget(JsonObjectField(&root, "tp"));
  plan.sl = ParsePriceTarget(JsonObjectField(&root, "sl"));
  if (const auto tif = JsonAsString(JsonObjectField(&root, "time_in_force"));
      tif.has_value()) {
    TimeInForce parsed = TimeInForce::kGtc;
    if (ParseTimeInForce(*tif, &parsed)) {
      plan.time_in_force = parsed;
    }
  }
  plan.confidence =
      JsonAsNumber(JsonObjectField(&root, "confidence")).value_or(0.0);
  plan.reason_summary =
      JsonAsString(JsonObjectField(&root, "reason_summary")).value_or("");
  if (const JsonValue* evidence = JsonObjectField(&root, "evidence");
      evidence != nullptr && evidence->type == JsonType::kObject) {
    if (const JsonValue* signals = JsonObjectField(evidence, "signals");
        signals != nullptr) {
      plan.evidence.signals = *signals;
    }
    if (const JsonValue* indicators = JsonObjectField(evidence, "indicators");
        indicators != nullptr) {
      plan.evidence.indicators = *indicators;
    }
    if (const JsonValue* key_levels = JsonObjectField(evidence, "key_levels");
        key_levels != nullptr) {
      plan.evidence.key_levels = *key_levels;
    }
  }
  return plan;
}

std::vector<std::string> BusinessErrors(const TradePlanOutput& plan) {
  std::vector<std::string> errors;
  if (plan.action == TradeAction::kOpen) {
    if (!plan.symbol.has_value()) {
      errors.push_back("symbol is required when action is 'open'");
    }
    if (!plan.side.has_value()) {
      errors.push_back("side is required when action is 'open'");
    }
    if (!plan.entry.has_value()) {
      errors.push_back("entry is required when action is 'open'");
    }
    if (!plan.position_size.has_value()) {
      errors.push_back("position_size is required when action is 'open'");
    }
  }
  if (plan.position_size.has_value() && plan.position_size->value <= 0) {
    errors.push_back("position_size.value must be greater than 0");
  }
  if (plan.tp.has_value() && plan.tp->value <= 0) {
    errors.push_back("tp.value must be greater than 0");
  }
  if (plan.sl.has_value() && plan.sl->value <= 0) {
    errors.push_back("sl.value must be greater than 0");
  }
  return errors;
}

JsonValue PriceTargetToJson(const PriceTarget& target) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "mode", MakeJsonString(ToString(target.mode)));
  JsonSet(&out, "value", MakeJsonDecimal(target.value));
  return out;
}

}  // namespace

const JsonValue& TradePlanJsonSchema() {
  static const JsonValue schema = [] {
    JsonValue parsed;
    std::string error;
    if (!ParseJson(kTradePlanSchemaText, &parsed, &error)) {
      LogError("交易计划 schema 解析失败: " + error);
    }
    return parsed;
  }();
  return schema;
}

std::string StripCodeFence(const std::string& text) {
  std::string content = TrimAscii(text);
  if (content.rfind("```", 0) != 0) {
    return content;
  }
  const std::size_t first_newline = content.find('\n');
  if (first_newline == std::string::npos) {
    return content;
  }
  content = content.substr(first_newline + 1);
  const std::size_t closing = content.rfind("```");
  if (closing != std::string::npos) {
    content = content.substr(0, closing);
  }
  return TrimAscii(content);
}

bool ValidateJsonAgainstSchema(const JsonValue& schema,
                               const JsonValue& value,
                               std::string* out_message) {
  if (const JsonValue* type = JsonObjectField(&schema, "type"); type != nullptr) {
    bool matched = false;
    std::string expected;
    if (type->type == JsonType::kArray) {
      for (const auto& item : type->array_value) {
        matched = matched || MatchesType(item.string_value, value);
        expected += expected.empty() ? "" : ", ";
        expected += "'" + item.string_value + "'";
      }
      expected = "[" + expected + "]";
    } else {
      matched = MatchesType(type->string_value, value);
      expected = "'" + type->string_value + "'";
    }
    if (!matched) {
      return Fail(out_message, Quoted(value) + " is not of type " + expected);
    }
  }

  if (const JsonValue* options = JsonObjectField(&schema, "enum");
      options != nullptr && options->type == JsonType::kArray) {
    bool found = false;
    std::string listed;
    for (const auto& option : options->array_value) {
      found = found || JsonEquals(option, value);
      listed += listed.empty() ? "" : ", ";
      listed += Quoted(option);
    }
    if (!found) {
      return Fail(out_message,
                  Quoted(value) + " is not one of [" + listed + "]");
    }
  }

  if (value.type == JsonType::kNumber) {
    if (const auto minimum = JsonAsNumber(JsonObjectField(&schema, "minimum"));
        minimum.has_value() && value.number_value < *minimum) {
      return Fail(out_message, SerializeJson(value) +
                                   " is less than the minimum of " +
                                   SerializeJson(*JsonObjectField(&schema, "minimum")));
    }
    if (const auto maximum = JsonAsNumber(JsonObjectField(&schema, "maximum"));
        maximum.has_value() && value.number_value > *maximum) {
      return Fail(out_message, SerializeJson(value) +
                                   " is greater than the maximum of " +
                                   SerializeJson(*JsonObjectField(&schema, "maximum")));
    }
  }

  if (value.type == JsonType::kString) {
    if (const auto max_length = JsonAsInt64(JsonObjectField(&schema, "maxLength"));
        max_length.has_value() &&
        Utf8Length(value.string_value) > static_cast<std::size_t>(*max_length)) {
      return Fail(out_message, Quoted(value) + " is too long");
    }
  }

  if (value.type != JsonType::kObject) {
    return true;
  }

  if (const JsonValue* required = JsonObjectField(&schema, "required");
      required != nullptr && required->type == JsonType::kArray) {
    for (const auto& key : required->array_value) {
      if (value.object_value.find(key.string_value) == value.object_value.end()) {
        return Fail(out_message,
                    "'" + key.string_value + "' is a required property");
      }
    }
  }

  const JsonValue* properties = JsonObjectField(&schema, "properties");
  if (const auto additional =
          JsonAsBool(JsonObjectField(&schema, "additionalProperties"));
      additional.has_value() && !*additional) {
    std::string unexpected;
    for (const auto& [key, item] : value.object_value) {
      if (JsonObjectField(properties, key) == nullptr) {
        unexpected += unexpected.empty() ? "" : ", ";
        unexpected += "'" + key + "'";
      }
    }
    if (!unexpected.empty()) {
      return Fail(out_message, "Additional properties are not allowed (" +
                                   unexpected + " was unexpected)");
    }
  }

  if (properties != nullptr && properties->type == JsonType::kObject) {
    for (const auto& [key, sub_schema] : properties->object_value) {
      const auto it = value.object_value.find(key);
      if (it == value.object_value.end()) {
        continue;
      }
      if (!ValidateJsonAgainstSchema(sub_schema, it->second, out_message)) {
        return false;
      }
    }
  }
  return true;
}

ValidationResult ValidateTradePlan(const std::string& raw_output) {
  ValidationResult result;
  JsonValue root;
  std::string error;
  if (!ParseJson(StripCodeFence(raw_output), &root, &error)) {
    result.errors.push_back("Invalid JSON: " +
                            TruncateCodePoints(error, kInvalidJsonReasonMax));
    return result;
  }

  if (!ValidateJsonAgainstSchema(TradePlanJsonSchema(), root, &error)) {
    result.errors.push_back("Schema error: " +
                            TruncateCodePoints(error, kSchemaReasonMax));
    return result;
  }

  TradePlanOutput plan = ParseTradePlan(root);
  for (const auto& violation : BusinessErrors(plan)) {
    result.errors.push_back("Validation error: " + violation);
  }
  if (!result.errors.empty()) {
    return result;
  }
  result.valid = true;
  result.plan = std::move(plan);
  return result;
}

JsonValue TradePlanSummaryToJson(const TradePlanOutput& plan) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "action", MakeJsonString(ToString(plan.action)));
  JsonSet(&out, "symbol",
          plan.symbol.has_value() ? MakeJsonString(*plan.symbol) : MakeJsonNull());
  JsonSet(&out, "side",
          plan.side.has_value() ? MakeJsonString(ToString(*plan.side))
                                : MakeJsonNull());
  JsonSet(&out, "leverage", MakeJsonInt(plan.leverage));
  JsonSet(&out, "confidence", MakeJsonNumber(plan.confidence));
  if (plan.position_size.has_value()) {
    JsonValue size = MakeJsonObject();
    JsonSet(&size, "mode", MakeJsonString(ToString(plan.position_size->mode)));
    JsonSet(&size, "value", MakeJsonDecimal(plan.position_size->value));
    JsonSet(&out, "position_size", std::move(size));
  }
  if (plan.tp.has_value()) {
    JsonSet(&out, "tp", PriceTargetToJson(*plan.tp));
  }
  if (plan.sl.has_value()) {
    JsonSet(&out, "sl", PriceTargetToJson(*plan.sl));
  }
  return out;
}

JsonValue EvidenceToJson(const TradeEvidence& evidence) {
  JsonValue out = MakeJsonObject();
  JsonSet(&out, "signals", evidence.signals);
  JsonSet(&out, "indicators", evidence.indicators);
  JsonSet(&out, "key_levels", evidence.key_levels);
  return out;
}

}  // namespace trade_pilot
