#include "model/anthropic_adapter.h"

namespace trade_pilot {

namespace {

constexpr char kJsonInstruction[] =
    "\n\nYou MUST respond with valid JSON matching this schema. "
    "No other text allowed.";

}  // namespace

AnthropicAdapter::AnthropicAdapter(std::string api_key,
                                   std::string model,
                                   std::string base_url,
                                   std::unique_ptr<HttpTransport> transport,
                                   RetryPolicy retry_policy)
    : HttpModelAdapter(std::move(api_key),
                       std::move(model),
                       base_url.empty() ? kDefaultBaseUrl : std::move(base_url),
                       std::move(transport),
                       std::move(retry_policy)) {}

ModelHttpRequest AnthropicAdapter::BuildRequest(
    const std::string& system_prompt,
    const std::string& user_prompt,
    const JsonValue* json_schema) const {
  JsonValue user_message = MakeJsonObject();
  JsonSet(&user_message, "role", MakeJsonString("user"));
  JsonSet(&user_message, "content", MakeJsonString(user_prompt));
  JsonValue messages = MakeJsonArray();
  JsonPush(&messages, std::move(user_message));

  ModelHttpRequest request;
  request.url = base_url() + "/messages";
  request.headers = {{"x-api-key", api_key()},
                     {"anthropic-version", "2023-06-01"},
                     {"Content-Type", "application/json"}};
  request.body = MakeJsonObject();
  JsonSet(&request.body, "model", MakeJsonString(model()));
  JsonSet(&request.body, "max_tokens", MakeJsonInt(4096));
  JsonSet(&request.body, "system",
          MakeJsonString(json_schema != nullptr
                             ? system_prompt + kJsonInstruction
                             : system_prompt));
  JsonSet(&request.body, "messages", std::move(messages));
  return request;
}

bool AnthropicAdapter::ExtractContent(const JsonValue& root,
                                      std::string* out_content,
                                      std::optional<ModelUsage>* out_usage) const {
  const JsonValue* block = JsonArrayAt(JsonObjectField(&root, "content"), 0);
  const auto text = JsonAsString(JsonObjectField(block, "text"));
  if (!text.has_value()) {
    return false;
  }
  *out_content = *text;
  if (const JsonValue* usage = JsonObjectField(&root, "usage");
      usage != nullptr && usage->type == JsonType::kObject) {
    *out_usage = ModelUsage{
        .input_tokens =
            JsonAsInt64(JsonObjectField(usage, "input_tokens")).value_or(0),
        .output_tokens =
            JsonAsInt64(JsonObjectField(usage, "output_tokens")).value_or(0),
    };
  }
  return true;
}

}  // namespace trade_pilot
