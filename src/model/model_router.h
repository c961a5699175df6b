#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "core/clock.h"
#include "core/json_utils.h"
#include "model/model_adapter.h"
#include "model/rate_limiter.h"
#include "net/http_transport.h"

namespace trade_pilot {

/// 一次调用使用的模型配置（api_key 为解密后的明文）。
struct ModelEndpoint {
  std::string provider;  ///< openai / anthropic / google（大小写不敏感）。
  std::string api_key;
  std::string model;
  std::string base_url;  ///< 为空使用供应商默认地址。
};

/// 每次创建适配器时生成新的 transport（适配器独占并在调用结束时释放）。
using HttpTransportFactory =
    std::function<std::unique_ptr<HttpTransport>(long timeout_ms)>;

struct ModelRouterOptions {
  int max_attempts{3};
  int rate_limit_per_minute{10};
  long timeout_ms{60000};
  const Clock* clock{nullptr};
  const Sleeper* sleeper{nullptr};  ///< 重试退避；为空时不等待。
  HttpTransportFactory transport_factory;  ///< 为空时使用 libcurl。
};

/// 供应商标识是否受支持。
bool IsSupportedProvider(const std::string& provider);

/**
 * @brief 模型路由
 *
 * 显式构造、注入到编排器，不使用进程级单例。
 * Generate 流程：按 trader 限流 -> 创建适配器 -> 记录请求 ->
 * 带重试生成 -> 适配器析构（释放 HTTP 连接）。
 */
class ModelRouter {
 public:
  explicit ModelRouter(ModelRouterOptions options);
  virtual ~ModelRouter() = default;

  /**
   * @brief 创建供应商适配器
   *
   * @return 未知供应商返回 nullptr，并写入 `Unknown provider: X`
   */
  std::unique_ptr<ModelAdapter> CreateAdapter(const ModelEndpoint& endpoint,
                                              std::string* out_error) const;

  /**
   * @brief 带限流与重试的生成
   *
   * 超出限流时返回 RATE_LIMIT 且不发起任何网络请求；
   * 未知供应商折叠为 UNKNOWN 错误响应。
   */
  virtual ModelResponse Generate(const ModelEndpoint& endpoint,
                                 const std::string& system_prompt,
                                 const std::string& user_prompt,
                                 const JsonValue* json_schema,
                                 const std::string& trader_id);

 private:
  ModelRouterOptions options_;
  SlidingWindowRateLimiter rate_limiter_;
};

}  // namespace trade_pilot
