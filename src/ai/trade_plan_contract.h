#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/json_utils.h"
#include "core/types.h"

namespace trade_pilot {

/**
 * @brief 交易计划校验结果
 *
 * 校验失败从不抛异常，由调用方把 errors 记入失败的决策日志。
 */
struct ValidationResult {
  bool valid{false};
  std::optional<TradePlanOutput> plan;
  std::vector<std::string> errors;
};

/// 交易计划输出 schema（传给模型做结构化输出，同时驱动结构校验）。
const JsonValue& TradePlanJsonSchema();

/**
 * @brief 剥离 Markdown 代码块围栏
 *
 * 形如 ```json ... ``` 的输出取围栏内文本；没有围栏时只去掉首尾空白。
 */
std::string StripCodeFence(const std::string& text);

/**
 * @brief 按 schema 校验 JSON 节点
 *
 * 支持 type/enum/required/properties/additionalProperties/
 * minimum/maximum/maxLength；首个违例写入 out_message。
 */
bool ValidateJsonAgainstSchema(const JsonValue& schema,
                               const JsonValue& value,
                               std::string* out_message);

/**
 * @brief 两阶段校验模型输出
 *
 * 1. JSON 解析（`Invalid JSON: ...`，原因截断到 100 字节）；
 * 2. schema 结构校验（`Schema error: ...`，截断到 200 字节）；
 * 3. 业务校验（`Validation error: ...`）：open 动作必须给出
 *    symbol/side/entry/position_size，数量与 TP/SL 数值必须大于 0。
 */
ValidationResult ValidateTradePlan(const std::string& raw_output);

/// 计划摘要（写入决策日志的 trade_plan 字段）。
JsonValue TradePlanSummaryToJson(const TradePlanOutput& plan);

/// evidence 只保留结构化键。
JsonValue EvidenceToJson(const TradeEvidence& evidence);

}  // namespace trade_pilot
