#include "model/model_adapter.h"

#include <exception>
#include <functional>

#include "core/text.h"

namespace trade_pilot {

ModelErrorType ClassifyModelError(int status_code, const std::string& body) {
  const std::string lowered = ToLowerAscii(body);
  if (status_code == 401) {
    return ModelErrorType::kAuth;
  }
  if (status_code == 429) {
    if (lowered.find("quota") != std::string::npos) {
      return ModelErrorType::kQuota;
    }
    return ModelErrorType::kRateLimit;
  }
  if (status_code == 408 || lowered.find("timeout") != std::string::npos) {
    return ModelErrorType::kTimeout;
  }
  return ModelErrorType::kUnknown;
}

ModelResponse ModelFailure(ModelErrorType type, const std::string& message) {
  ModelResponse response;
  response.success = false;
  response.error_type = type;
  response.error_message = TruncateUtf8(message, kModelErrorMessageMax);
  return response;
}

bool IsRetryableModelError(ModelErrorType type) {
  return type != ModelErrorType::kAuth && type != ModelErrorType::kQuota;
}

ModelAdapter::ModelAdapter(RetryPolicy retry_policy)
    : retry_policy_(std::move(retry_policy)) {}

ModelResponse ModelAdapter::GenerateWithRetry(const std::string& system_prompt,
                                              const std::string& user_prompt,
                                              const JsonValue* json_schema) {
  const std::function<ModelResponse(int)> call = [&](int) {
    try {
      return Generate(system_prompt, user_prompt, json_schema);
    } catch (const std::exception& e) {
      return ModelFailure(ModelErrorType::kNetwork, e.what());
    }
  };
  const std::function<bool(const ModelResponse&)> should_retry =
      [](const ModelResponse& response) {
        if (response.success) {
          return false;
        }
        return !response.error_type.has_value() ||
               IsRetryableModelError(*response.error_type);
      };
  return retry_policy_.Run<ModelResponse>(call, should_retry);
}

HttpModelAdapter::HttpModelAdapter(std::string api_key,
                                   std::string model,
                                   std::string base_url,
                                   std::unique_ptr<HttpTransport> transport,
                                   RetryPolicy retry_policy)
    : ModelAdapter(std::move(retry_policy)),
      api_key_(std::move(api_key)),
      model_(std::move(model)),
      base_url_(std::move(base_url)),
      transport_(std::move(transport)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
  if (transport_ == nullptr) {
    transport_ = MakeCurlHttpTransport(60000);
  }
}

ModelResponse HttpModelAdapter::Generate(const std::string& system_prompt,
                                         const std::string& user_prompt,
                                         const JsonValue* json_schema) {
  const ModelHttpRequest request =
      BuildRequest(system_prompt, user_prompt, json_schema);
  const HttpResponse http = transport_->Send("POST", request.url,
                                             request.headers,
                                             SerializeJson(request.body));
  if (http.status_code == 0) {
    if (http.timed_out) {
      return ModelFailure(ModelErrorType::kTimeout, "Request timed out");
    }
    return ModelFailure(ModelErrorType::kNetwork, http.error);
  }
  if (http.status_code != 200) {
    return ModelFailure(ClassifyModelError(http.status_code, http.body),
                        http.body);
  }

  JsonValue root;
  std::string parse_error;
  if (!ParseJson(http.body, &root, &parse_error)) {
    return ModelFailure(ModelErrorType::kInvalidOutput,
                        "Invalid provider response: " + parse_error);
  }
  ModelResponse response;
  if (!ExtractContent(root, &response.content, &response.usage)) {
    return ModelFailure(ModelErrorType::kInvalidOutput,
                        "Provider response missing content");
  }
  response.success = true;
  return response;
}

}  // namespace trade_pilot
