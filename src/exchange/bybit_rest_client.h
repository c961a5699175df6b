#pragma once

#include <memory>
#include <string>

#include "core/json_utils.h"
#include "exchange/exchange_support.h"
#include "net/http_transport.h"

namespace trade_pilot {

/**
 * @brief Bybit V5 REST 客户端
 *
 * 负责：
 * 1. 请求签名与鉴权头构造；
 * 2. HTTP 请求发送与状态码校验；
 * 3. retCode 业务码统一校验；
 * 4. GET 请求按只读重试策略重试，POST 不重试。
 */
class BybitRestClient {
 public:
  BybitRestClient(ExchangeCredentials credentials,
                  ExchangeAdapterOptions options,
                  std::unique_ptr<HttpTransport> transport);

  /// 公共接口 GET 请求（无需鉴权）。
  bool GetPublic(const std::string& path,
                 const std::string& query,
                 JsonValue* out_root,
                 std::string* out_error) const;
  /// 私有接口 GET 请求（带 V5 鉴权）。
  bool GetPrivate(const std::string& path,
                  const std::string& query,
                  JsonValue* out_root,
                  std::string* out_error) const;
  /**
   * @brief 私有接口 POST 请求（带 V5 鉴权）
   *
   * @param out_error_code 失败时写 HTTP 状态码或 retCode（可选）
   */
  bool PostPrivate(const std::string& path,
                   const JsonValue& body,
                   JsonValue* out_root,
                   std::string* out_error_code,
                   std::string* out_error) const;

  /// 构造 Bybit V5 签名（timestamp+apiKey+recvWindow+payload）。
  static bool BuildV5Signature(const std::string& api_secret,
                               const std::string& timestamp_ms,
                               const std::string& api_key,
                               const std::string& recv_window,
                               const std::string& payload,
                               std::string* out_signature,
                               std::string* out_error);

 private:
  /// 统一请求发送入口（含鉴权、状态码与 retCode 校验）。
  bool SendRequest(const std::string& method,
                   const std::string& path,
                   const std::string& query,
                   const std::string& body,
                   bool private_auth,
                   JsonValue* out_root,
                   std::string* out_error_code,
                   std::string* out_error) const;
  HttpResponse SendOnce(const std::string& method,
                        const std::string& url,
                        const std::string& query,
                        const std::string& body,
                        bool private_auth) const;

  std::string BaseUrl() const;

  ExchangeCredentials credentials_;  ///< API Key / Secret。
  ExchangeAdapterOptions options_;
  std::unique_ptr<HttpTransport> transport_;  ///< HTTP 传输实现。
  RetryPolicy read_retry_;
};

}  // namespace trade_pilot
