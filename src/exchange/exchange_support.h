#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "core/clock.h"
#include "core/decimal.h"
#include "core/json_utils.h"
#include "core/retry_policy.h"
#include "core/types.h"
#include "net/http_transport.h"

namespace trade_pilot {

/// 交易所 API 凭证（明文，只在一轮周期内存活）。
struct ExchangeCredentials {
  std::string api_key;
  std::string api_secret;
};

class SymbolInfoCache;

/// 适配器构造参数。
struct ExchangeAdapterOptions {
  bool testnet{false};
  std::string base_url_override;  ///< 非空时覆盖默认 endpoint（测试/代理）。
  const Clock* clock{nullptr};  ///< 签名时间戳来源；为空用系统时钟。
  const Sleeper* sleeper{nullptr};  ///< 只读请求重试退避；为空不等待。
  int read_max_attempts{3};  ///< 只读 GET 最大尝试次数；下单请求从不重试。
  SymbolInfoCache* symbol_cache{nullptr};  ///< 跨实例共享缓存；为空时用实例内缓存。
};

/**
 * @brief symbol 精度缓存
 *
 * 精度规则很少变化，按 `交易所:网络:symbol` 在进程内缓存。
 * 适配器每轮重建，缓存由上层持有并注入以跨轮复用。
 */
class SymbolInfoCache {
 public:
  bool Find(const std::string& key, SymbolInfo* out_info) const;
  void Put(const std::string& key, const SymbolInfo& info);

 private:
  mutable std::mutex mutex_;
  std::map<std::string, SymbolInfo> entries_;
};

/// 交易所只读 GET 的重试判定：传输失败、429、5xx 重试，其余不重试。
bool IsRetryableHttpResponse(const HttpResponse& response);

/// HTTP 响应是否 2xx 且传输层成功。
bool IsHttpSuccess(const HttpResponse& response);

/// 把失败的 HTTP 响应转成 OrderResult（error_code=状态码，error_message=响应体或传输错误）。
OrderResult OrderResultFromHttpFailure(const HttpResponse& response);

/// 仅带错误信息的失败 OrderResult。
OrderResult FailedOrderResult(const std::string& error_code,
                              const std::string& error_message);

/// 把失败的 HTTP 响应描述成一行错误文本。
std::string DescribeHttpFailure(const std::string& exchange,
                                const HttpResponse& response);

/// 按精度格式化数量（先向零截断）。
std::string FormatQuantity(const Decimal& quantity, int precision);

/// 按精度格式化价格（先四舍五入）。
std::string FormatPrice(const Decimal& price, int precision);

/// 读取 JSON 字段并转十进制；缺失或非法时返回 fallback。
Decimal JsonDecimalOr(const JsonValue* object,
                      const std::string& key,
                      const Decimal& fallback);

/// 读取 JSON 字段并转整数（接受数字或数字字符串，小数部分截断）。
int JsonIntOr(const JsonValue* object, const std::string& key, int fallback);

/// 只读请求的重试策略（按 options 构造）。
RetryPolicy MakeReadRetryPolicy(const ExchangeAdapterOptions& options);

/// 当前毫秒时间戳（options.clock 为空时用默认时钟）。
std::int64_t AdapterNowMs(const ExchangeAdapterOptions& options);

/// 读取 JSON 字段并转字符串；缺失时返回 fallback。
std::string JsonStringOr(const JsonValue* object,
                         const std::string& key,
                         const std::string& fallback);

}  // namespace trade_pilot
