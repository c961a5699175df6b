#include "model/google_adapter.h"

namespace trade_pilot {

namespace {

JsonValue TextParts(const std::string& text) {
  JsonValue part = MakeJsonObject();
  JsonSet(&part, "text", MakeJsonString(text));
  JsonValue parts = MakeJsonArray();
  JsonPush(&parts, std::move(part));
  return parts;
}

}  // namespace

GoogleAdapter::GoogleAdapter(std::string api_key,
                             std::string model,
                             std::string base_url,
                             std::unique_ptr<HttpTransport> transport,
                             RetryPolicy retry_policy)
    : HttpModelAdapter(std::move(api_key),
                       std::move(model),
                       base_url.empty() ? kDefaultBaseUrl : std::move(base_url),
                       std::move(transport),
                       std::move(retry_policy)) {}

ModelHttpRequest GoogleAdapter::BuildRequest(const std::string& system_prompt,
                                             const std::string& user_prompt,
                                             const JsonValue* json_schema) const {
  JsonValue user_content = MakeJsonObject();
  JsonSet(&user_content, "role", MakeJsonString("user"));
  JsonSet(&user_content, "parts", TextParts(user_prompt));
  JsonValue contents = MakeJsonArray();
  JsonPush(&contents, std::move(user_content));

  JsonValue system_instruction = MakeJsonObject();
  JsonSet(&system_instruction, "parts", TextParts(system_prompt));

  JsonValue generation_config = MakeJsonObject();
  JsonSet(&generation_config, "temperature", MakeJsonNumberText("0.1"));
  JsonSet(&generation_config, "responseMimeType",
          MakeJsonString("application/json"));
  if (json_schema != nullptr) {
    JsonSet(&generation_config, "responseSchema", *json_schema);
  }

  ModelHttpRequest request;
  request.url = base_url() + "/models/" + model() +
                ":generateContent?key=" + UrlEncode(api_key());
  request.headers = {{"Content-Type", "application/json"}};
  request.body = MakeJsonObject();
  JsonSet(&request.body, "contents", std::move(contents));
  JsonSet(&request.body, "systemInstruction", std::move(system_instruction));
  JsonSet(&request.body, "generationConfig", std::move(generation_config));
  return request;
}

bool GoogleAdapter::ExtractContent(const JsonValue& root,
                                   std::string* out_content,
                                   std::optional<ModelUsage>* out_usage) const {
  const JsonValue* candidate =
      JsonArrayAt(JsonObjectField(&root, "candidates"), 0);
  const JsonValue* part =
      JsonArrayAt(JsonFindPath(candidate, {"content", "parts"}), 0);
  const auto text = JsonAsString(JsonObjectField(part, "text"));
  if (!text.has_value()) {
    return false;
  }
  *out_content = *text;
  if (const JsonValue* usage = JsonObjectField(&root, "usageMetadata");
      usage != nullptr && usage->type == JsonType::kObject) {
    *out_usage = ModelUsage{
        .input_tokens =
            JsonAsInt64(JsonObjectField(usage, "promptTokenCount")).value_or(0),
        .output_tokens = JsonAsInt64(JsonObjectField(usage, "candidatesTokenCount"))
                             .value_or(0),
    };
  }
  return true;
}

}  // namespace trade_pilot
