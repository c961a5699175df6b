#include "model/openai_adapter.h"

namespace trade_pilot {

namespace {

JsonValue Message(const std::string& role, const std::string& content) {
  JsonValue message = MakeJsonObject();
  JsonSet(&message, "role", MakeJsonString(role));
  JsonSet(&message, "content", MakeJsonString(content));
  return message;
}

}  // namespace

OpenAiAdapter::OpenAiAdapter(std::string api_key,
                             std::string model,
                             std::string base_url,
                             std::unique_ptr<HttpTransport> transport,
                             RetryPolicy retry_policy)
    : HttpModelAdapter(std::move(api_key),
                       std::move(model),
                       base_url.empty() ? kDefaultBaseUrl : std::move(base_url),
                       std::move(transport),
                       std::move(retry_policy)) {}

ModelHttpRequest OpenAiAdapter::BuildRequest(const std::string& system_prompt,
                                             const std::string& user_prompt,
                                             const JsonValue* json_schema) const {
  JsonValue messages = MakeJsonArray();
  JsonPush(&messages, Message("system", system_prompt));
  JsonPush(&messages, Message("user", user_prompt));

  JsonValue response_format = MakeJsonObject();
  if (json_schema != nullptr) {
    JsonValue schema_spec = MakeJsonObject();
    JsonSet(&schema_spec, "name", MakeJsonString("trade_plan"));
    JsonSet(&schema_spec, "strict", MakeJsonBool(true));
    JsonSet(&schema_spec, "schema", *json_schema);
    JsonSet(&response_format, "type", MakeJsonString("json_schema"));
    JsonSet(&response_format, "json_schema", std::move(schema_spec));
  } else {
    JsonSet(&response_format, "type", MakeJsonString("json_object"));
  }

  ModelHttpRequest request;
  request.url = base_url() + "/chat/completions";
  request.headers = {{"Authorization", "Bearer " + api_key()},
                     {"Content-Type", "application/json"}};
  request.body = MakeJsonObject();
  JsonSet(&request.body, "model", MakeJsonString(model()));
  JsonSet(&request.body, "messages", std::move(messages));
  JsonSet(&request.body, "temperature", MakeJsonNumberText("0.1"));
  JsonSet(&request.body, "response_format", std::move(response_format));
  return request;
}

bool OpenAiAdapter::ExtractContent(const JsonValue& root,
                                   std::string* out_content,
                                   std::optional<ModelUsage>* out_usage) const {
  const JsonValue* choice = JsonArrayAt(JsonObjectField(&root, "choices"), 0);
  const auto content = JsonAsString(JsonFindPath(choice, {"message", "content"}));
  if (!content.has_value()) {
    return false;
  }
  *out_content = *content;
  if (const JsonValue* usage = JsonObjectField(&root, "usage");
      usage != nullptr && usage->type == JsonType::kObject) {
    *out_usage = ModelUsage{
        .input_tokens =
            JsonAsInt64(JsonObjectField(usage, "prompt_tokens")).value_or(0),
        .output_tokens =
            JsonAsInt64(JsonObjectField(usage, "completion_tokens")).value_or(0),
    };
  }
  return true;
}

}  // namespace trade_pilot
