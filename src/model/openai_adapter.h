#pragma once

#include <memory>
#include <string>

#include "model/model_adapter.h"

namespace trade_pilot {

/**
 * @brief OpenAI chat-completions 适配器
 *
 * 提供 schema 时使用 `response_format.json_schema`（strict），
 * 否则使用 `json_object`。
 */
class OpenAiAdapter final : public HttpModelAdapter {
 public:
  static constexpr const char* kDefaultBaseUrl = "https://api.openai.com/v1";

  OpenAiAdapter(std::string api_key,
                std::string model,
                std::string base_url,
                std::unique_ptr<HttpTransport> transport,
                RetryPolicy retry_policy);

  std::string Provider() const override { return "openai"; }

 protected:
  ModelHttpRequest BuildRequest(const std::string& system_prompt,
                                const std::string& user_prompt,
                                const JsonValue* json_schema) const override;
  bool ExtractContent(const JsonValue& root,
                      std::string* out_content,
                      std::optional<ModelUsage>* out_usage) const override;
};

}  // namespace trade_pilot
