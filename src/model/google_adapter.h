#pragma once

#include <memory>
#include <string>

#include "model/model_adapter.h"

namespace trade_pilot {

/// Google Gemini `generateContent` 适配器（API key 走 query 参数）。
class GoogleAdapter final : public HttpModelAdapter {
 public:
  static constexpr const char* kDefaultBaseUrl =
      "https://generativelanguage.googleapis.com/v1beta";

  GoogleAdapter(std::string api_key,
                std::string model,
                std::string base_url,
                std::unique_ptr<HttpTransport> transport,
                RetryPolicy retry_policy);

  std::string Provider() const override { return "google"; }

 protected:
  ModelHttpRequest BuildRequest(const std::string& system_prompt,
                                const std::string& user_prompt,
                                const JsonValue* json_schema) const override;
  bool ExtractContent(const JsonValue& root,
                      std::string* out_content,
                      std::optional<ModelUsage>* out_usage) const override;
};

}  // namespace trade_pilot
