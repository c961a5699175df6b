#include "exchange/bybit_rest_client.h"

#include <functional>

#include "core/crypto.h"

namespace trade_pilot {

namespace {

constexpr char kRecvWindow[] = "5000";

}  // namespace

BybitRestClient::BybitRestClient(ExchangeCredentials credentials,
                                 ExchangeAdapterOptions options,
                                 std::unique_ptr<HttpTransport> transport)
    : credentials_(std::move(credentials)),
      options_(std::move(options)),
      transport_(std::move(transport)),
      read_retry_(MakeReadRetryPolicy(options_)) {
  if (transport_ == nullptr) {
    transport_ = MakeCurlHttpTransport(30000);
  }
}

bool BybitRestClient::GetPublic(const std::string& path,
                                const std::string& query,
                                JsonValue* out_root,
                                std::string* out_error) const {
  return SendRequest("GET", path, query, "", /*private_auth=*/false, out_root,
                     nullptr, out_error);
}

bool BybitRestClient::GetPrivate(const std::string& path,
                                 const std::string& query,
                                 JsonValue* out_root,
                                 std::string* out_error) const {
  return SendRequest("GET", path, query, "", /*private_auth=*/true, out_root,
                     nullptr, out_error);
}

bool BybitRestClient::PostPrivate(const std::string& path,
                                  const JsonValue& body,
                                  JsonValue* out_root,
                                  std::string* out_error_code,
                                  std::string* out_error) const {
  return SendRequest("POST", path, "", SerializeJson(body),
                     /*private_auth=*/true, out_root, out_error_code,
                     out_error);
}

HttpResponse BybitRestClient::SendOnce(const std::string& method,
                                       const std::string& url,
                                       const std::string& query,
                                       const std::string& body,
                                       bool private_auth) const {
  HttpHeaders headers;
  headers.emplace_back("Content-Type", "application/json");
  if (private_auth) {
    // V5 签名：timestamp + apiKey + recvWindow + payload。
    const std::string ts_ms = std::to_string(AdapterNowMs(options_));
    const std::string payload = (method == "GET") ? query : body;
    std::string signature;
    std::string sign_error;
    if (!BuildV5Signature(credentials_.api_secret, ts_ms, credentials_.api_key,
                          kRecvWindow, payload, &signature, &sign_error)) {
      HttpResponse failed;
      failed.error = "Bybit V5 签名失败: " + sign_error;
      return failed;
    }
    headers.emplace_back("X-BAPI-API-KEY", credentials_.api_key);
    headers.emplace_back("X-BAPI-SIGN", signature);
    headers.emplace_back("X-BAPI-TIMESTAMP", ts_ms);
    headers.emplace_back("X-BAPI-RECV-WINDOW", kRecvWindow);
  }
  return transport_->Send(method, url, headers, body);
}

bool BybitRestClient::SendRequest(const std::string& method,
                                  const std::string& path,
                                  const std::string& query,
                                  const std::string& body,
                                  bool private_auth,
                                  JsonValue* out_root,
                                  std::string* out_error_code,
                                  std::string* out_error) const {
  if (out_root == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_root 为空";
    }
    return false;
  }

  const std::string url =
      BaseUrl() + path + (query.empty() ? std::string() : ("?" + query));
  const std::function<HttpResponse(int)> attempt = [&](int) {
    return SendOnce(method, url, query, body, private_auth);
  };
  const HttpResponse response =
      method == "GET"
          ? read_retry_.Run<HttpResponse>(
                attempt,
                [](const HttpResponse& r) { return IsRetryableHttpResponse(r); })
          : attempt(0);

  if (!IsHttpSuccess(response)) {
    if (out_error_code != nullptr) {
      *out_error_code = response.status_code == 0
                            ? std::string("NETWORK")
                            : std::to_string(response.status_code);
    }
    if (out_error != nullptr) {
      *out_error = DescribeHttpFailure("Bybit", response);
    }
    return false;
  }

  std::string parse_error;
  if (!ParseJson(response.body, out_root, &parse_error)) {
    if (out_error_code != nullptr) {
      *out_error_code = "INVALID_RESPONSE";
    }
    if (out_error != nullptr) {
      *out_error = "Bybit 响应 JSON 解析失败: " + parse_error;
    }
    return false;
  }

  // HTTP 成功后继续检查业务 retCode，确保语义成功。
  const int ret_code = JsonIntOr(out_root, "retCode", 0);
  if (ret_code != 0) {
    if (out_error_code != nullptr) {
      *out_error_code = std::to_string(ret_code);
    }
    if (out_error != nullptr) {
      *out_error = "Bybit retCode 异常: " + std::to_string(ret_code) +
                   ", retMsg=" + JsonStringOr(out_root, "retMsg", "");
    }
    return false;
  }
  return true;
}

bool BybitRestClient::BuildV5Signature(const std::string& api_secret,
                                       const std::string& timestamp_ms,
                                       const std::string& api_key,
                                       const std::string& recv_window,
                                       const std::string& payload,
                                       std::string* out_signature,
                                       std::string* out_error) {
  const std::string prehash = timestamp_ms + api_key + recv_window + payload;
  return HmacSha256Hex(api_secret, prehash, out_signature, out_error);
}

std::string BybitRestClient::BaseUrl() const {
  if (!options_.base_url_override.empty()) {
    return options_.base_url_override;
  }
  return options_.testnet ? "https://api-testnet.bybit.com"
                          : "https://api.bybit.com";
}

}  // namespace trade_pilot
