#include "ai/prompt_builder.h"

namespace trade_pilot {

namespace {

constexpr char kSystemPrompt[] =
    R"(You are a professional cryptocurrency trading assistant. Your task is to analyze market signals and generate precise trade plans.

RULES:
1. Always respond with valid JSON matching the required schema
2. Be conservative - if uncertain, set action to "skip"
3. Never exceed the risk limits provided
4. Confidence should reflect your certainty (0.0 to 1.0)
5. Keep reason_summary concise but informative (max 500 chars)
6. Do not include any explanation outside the JSON

OUTPUT SCHEMA:
{
  "action": "open" | "close" | "skip",
  "symbol": "BTCUSDT",
  "side": "long" | "short",
  "entry": { "type": "market" | "limit", "price": number|null },
  "position_size": { "mode": "notional"|"qty", "value": number },
  "leverage": number (1-125),
  "tp": { "mode": "percent"|"price", "value": number },
  "sl": { "mode": "percent"|"price", "value": number },
  "time_in_force": "GTC"|"IOC"|null,
  "confidence": number (0-1),
  "reason_summary": "string",
  "evidence": { "signals": [], "indicators": {}, "key_levels": {} }
}

If action is "skip", only action, confidence, reason_summary, and evidence are required.)";

constexpr char kRetrySystemPrompt[] =
    R"(You MUST respond with ONLY valid JSON. No explanations, no markdown, no text outside the JSON object.

The previous response was invalid. Please try again with strict JSON format matching this schema:
{
  "action": "open" | "close" | "skip",
  "symbol": "BTCUSDT",
  "side": "long" | "short",
  "entry": { "type": "market" | "limit", "price": number|null },
  "position_size": { "mode": "notional"|"qty", "value": number },
  "leverage": number,
  "tp": { "mode": "percent"|"price", "value": number },
  "sl": { "mode": "percent"|"price", "value": number },
  "time_in_force": "GTC"|"IOC"|null,
  "confidence": number,
  "reason_summary": "string",
  "evidence": { "signals": [], "indicators": {}, "key_levels": {} }
})";

}  // namespace

AiPrompt BuildAiPrompt(const JsonValue& signal,
                       const JsonValue& market_snapshot,
                       const JsonValue& risk_profile,
                       const JsonValue& account_state) {
  AiPrompt prompt;
  prompt.system_prompt = kSystemPrompt;
  prompt.user_prompt =
      "Analyze this trading signal and generate a trade plan:\n\n"
      "SIGNAL:\n" + SerializeJson(signal, 2) +
      "\n\nMARKET SNAPSHOT:\n" + SerializeJson(market_snapshot, 2) +
      "\n\nRISK PROFILE:\n" + SerializeJson(risk_profile, 2) +
      "\n\nACCOUNT STATE:\n" + SerializeJson(account_state, 2) +
      "\n\nGenerate a trade plan following the schema. Respond with JSON only.";
  return prompt;
}

const std::string& RetrySystemPrompt() {
  static const std::string prompt = kRetrySystemPrompt;
  return prompt;
}

}  // namespace trade_pilot
