#pragma once

#include <memory>
#include <string>

#include "model/model_adapter.h"

namespace trade_pilot {

/**
 * @brief Anthropic messages 适配器
 *
 * 接口没有结构化输出参数，提供 schema 时在 system prompt 末尾追加 JSON 约束。
 */
class AnthropicAdapter final : public HttpModelAdapter {
 public:
  static constexpr const char* kDefaultBaseUrl = "https://api.anthropic.com/v1";

  AnthropicAdapter(std::string api_key,
                   std::string model,
                   std::string base_url,
                   std::unique_ptr<HttpTransport> transport,
                   RetryPolicy retry_policy);

  std::string Provider() const override { return "anthropic"; }

 protected:
  ModelHttpRequest BuildRequest(const std::string& system_prompt,
                                const std::string& user_prompt,
                                const JsonValue* json_schema) const override;
  bool ExtractContent(const JsonValue& root,
                      std::string* out_content,
                      std::optional<ModelUsage>* out_usage) const override;
};

}  // namespace trade_pilot
