#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "core/json_utils.h"
#include "core/retry_policy.h"
#include "net/http_transport.h"

namespace trade_pilot {

/// 模型调用错误分类（跨供应商统一）。
enum class ModelErrorType {
  kAuth,
  kQuota,
  kRateLimit,
  kInvalidOutput,
  kTimeout,
  kNetwork,
  kUnknown,
};

inline const char* ToString(ModelErrorType type) {
  switch (type) {
    case ModelErrorType::kAuth:
      return "auth";
    case ModelErrorType::kQuota:
      return "quota";
    case ModelErrorType::kRateLimit:
      return "rate_limit";
    case ModelErrorType::kInvalidOutput:
      return "invalid_output";
    case ModelErrorType::kTimeout:
      return "timeout";
    case ModelErrorType::kNetwork:
      return "network";
    case ModelErrorType::kUnknown:
      return "unknown";
  }
  return "unknown";
}

/// token 用量。
struct ModelUsage {
  std::int64_t input_tokens{0};
  std::int64_t output_tokens{0};
};

/// 统一模型响应：成功时 content 为模型原始文本。
struct ModelResponse {
  bool success{false};
  std::string content;
  std::optional<ModelErrorType> error_type;
  std::string error_message;  ///< 最多 200 字节。
  std::optional<ModelUsage> usage;
};

/// 错误正文截断上限。
constexpr std::size_t kModelErrorMessageMax = 200;

/**
 * @brief 按 HTTP 状态码与响应正文分类错误
 *
 * 401->AUTH；429 且正文含 quota->QUOTA；429 其余->RATE_LIMIT；
 * 408 或正文含 timeout->TIMEOUT；其余 UNKNOWN。大小写不敏感。
 */
ModelErrorType ClassifyModelError(int status_code, const std::string& body);

/// 构造失败响应（正文自动截断）。
ModelResponse ModelFailure(ModelErrorType type, const std::string& message);

/// AUTH/QUOTA 重试无意义，直接返回。
bool IsRetryableModelError(ModelErrorType type);

/**
 * @brief 模型供应商适配器
 *
 * Generate 不抛异常，所有失败都折叠为带类型的 ModelResponse。
 * 适配器持有自己的 HTTP transport，析构即释放连接。
 */
class ModelAdapter {
 public:
  explicit ModelAdapter(RetryPolicy retry_policy);
  virtual ~ModelAdapter() = default;

  /// 供应商标识（openai/anthropic/google）。
  virtual std::string Provider() const = 0;

  /**
   * @brief 单次生成
   *
   * @param json_schema 可选输出 schema；为空时只要求 JSON 输出
   */
  virtual ModelResponse Generate(const std::string& system_prompt,
                                 const std::string& user_prompt,
                                 const JsonValue* json_schema) = 0;

  /**
   * @brief 带重试的生成
   *
   * 最多 max_attempts 次，退避 `2^attempt + 0.1*attempt` 秒；
   * AUTH/QUOTA 立即返回；耗尽后返回最后一次失败响应。
   */
  ModelResponse GenerateWithRetry(const std::string& system_prompt,
                                  const std::string& user_prompt,
                                  const JsonValue* json_schema);

 private:
  RetryPolicy retry_policy_;
};

/// HTTP 请求描述（由具体供应商构造）。
struct ModelHttpRequest {
  std::string url;
  HttpHeaders headers;
  JsonValue body;
};

/**
 * @brief 基于 HTTP JSON 接口的供应商适配器骨架
 *
 * 子类只负责请求构造与响应抽取；发送、错误分类、超时与
 * 截断规则在这里统一处理。
 */
class HttpModelAdapter : public ModelAdapter {
 public:
  HttpModelAdapter(std::string api_key,
                   std::string model,
                   std::string base_url,
                   std::unique_ptr<HttpTransport> transport,
                   RetryPolicy retry_policy);

  ModelResponse Generate(const std::string& system_prompt,
                         const std::string& user_prompt,
                         const JsonValue* json_schema) override;

  const std::string& model() const { return model_; }

 protected:
  virtual ModelHttpRequest BuildRequest(const std::string& system_prompt,
                                        const std::string& user_prompt,
                                        const JsonValue* json_schema) const = 0;
  /// 从 200 响应中抽取文本与用量；结构不符返回 false。
  virtual bool ExtractContent(const JsonValue& root,
                              std::string* out_content,
                              std::optional<ModelUsage>* out_usage) const = 0;

  const std::string& api_key() const { return api_key_; }
  const std::string& base_url() const { return base_url_; }

 private:
  std::string api_key_;
  std::string model_;
  std::string base_url_;  ///< 已去掉结尾 `/`。
  std::unique_ptr<HttpTransport> transport_;
};

}  // namespace trade_pilot
