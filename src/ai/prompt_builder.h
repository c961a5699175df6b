#pragma once

#include <string>

#include "core/json_utils.h"

namespace trade_pilot {

/// 一次模型调用的提示词。
struct AiPrompt {
  std::string system_prompt;
  std::string user_prompt;
};

/**
 * @brief 拼装交易计划提示词
 *
 * 四块输入按 2 空格缩进序列化后嵌入 user prompt；
 * system prompt 固定，描述输出 schema 与保守原则。
 */
AiPrompt BuildAiPrompt(const JsonValue& signal,
                       const JsonValue& market_snapshot,
                       const JsonValue& risk_profile,
                       const JsonValue& account_state);

/// 上一次输出无效时使用的严格 system prompt。
const std::string& RetrySystemPrompt();

}  // namespace trade_pilot
