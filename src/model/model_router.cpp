#include "model/model_router.h"

#include <utility>

#include "core/log.h"
#include "core/text.h"
#include "model/anthropic_adapter.h"
#include "model/google_adapter.h"
#include "model/openai_adapter.h"

namespace trade_pilot {

namespace {

constexpr std::int64_t kRateLimitWindowMs = 60000;

}  // namespace

bool IsSupportedProvider(const std::string& provider) {
  const std::string id = ToLowerAscii(provider);
  return id == "openai" || id == "anthropic" || id == "google";
}

ModelRouter::ModelRouter(ModelRouterOptions options)
    : options_(std::move(options)),
      rate_limiter_(options_.rate_limit_per_minute,
                    kRateLimitWindowMs,
                    options_.clock) {}

std::unique_ptr<ModelAdapter> ModelRouter::CreateAdapter(
    const ModelEndpoint& endpoint,
    std::string* out_error) const {
  const std::string id = ToLowerAscii(endpoint.provider);
  if (!IsSupportedProvider(id)) {
    if (out_error != nullptr) {
      *out_error = "Unknown provider: " + endpoint.provider;
    }
    return nullptr;
  }

  std::unique_ptr<HttpTransport> transport =
      options_.transport_factory ? options_.transport_factory(options_.timeout_ms)
                                 : MakeCurlHttpTransport(options_.timeout_ms);
  RetryPolicy retry(options_.max_attempts, &RetryPolicy::ModelBackoffMs,
                    options_.sleeper);
  if (id == "openai") {
    return std::make_unique<OpenAiAdapter>(endpoint.api_key, endpoint.model,
                                           endpoint.base_url,
                                           std::move(transport), std::move(retry));
  }
  if (id == "anthropic") {
    return std::make_unique<AnthropicAdapter>(
        endpoint.api_key, endpoint.model, endpoint.base_url,
        std::move(transport), std::move(retry));
  }
  return std::make_unique<GoogleAdapter>(endpoint.api_key, endpoint.model,
                                         endpoint.base_url, std::move(transport),
                                         std::move(retry));
}

ModelResponse ModelRouter::Generate(const ModelEndpoint& endpoint,
                                    const std::string& system_prompt,
                                    const std::string& user_prompt,
                                    const JsonValue* json_schema,
                                    const std::string& trader_id) {
  std::string error;
  std::unique_ptr<ModelAdapter> adapter = CreateAdapter(endpoint, &error);
  if (adapter == nullptr) {
    return ModelFailure(ModelErrorType::kUnknown, error);
  }
  if (!rate_limiter_.TryAcquire(trader_id)) {
    LogWarn("模型请求被限流: trader_id=" + trader_id);
    return ModelFailure(ModelErrorType::kRateLimit, "Trader rate limit exceeded");
  }
  return adapter->GenerateWithRetry(system_prompt, user_prompt, json_schema);
}

}  // namespace trade_pilot
