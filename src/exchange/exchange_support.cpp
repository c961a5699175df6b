#include "exchange/exchange_support.h"

namespace trade_pilot {

bool SymbolInfoCache::Find(const std::string& key, SymbolInfo* out_info) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }
  if (out_info != nullptr) {
    *out_info = it->second;
  }
  return true;
}

void SymbolInfoCache::Put(const std::string& key, const SymbolInfo& info) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = info;
}

bool IsRetryableHttpResponse(const HttpResponse& response) {
  if (response.status_code == 0) {
    return true;
  }
  return response.status_code == 429 || response.status_code >= 500;
}

bool IsHttpSuccess(const HttpResponse& response) {
  return response.status_code >= 200 && response.status_code < 300;
}

OrderResult OrderResultFromHttpFailure(const HttpResponse& response) {
  if (response.status_code == 0) {
    return FailedOrderResult("NETWORK", response.error);
  }
  return FailedOrderResult(std::to_string(response.status_code),
                           response.body.empty() ? response.error
                                                 : response.body);
}

OrderResult FailedOrderResult(const std::string& error_code,
                              const std::string& error_message) {
  OrderResult result;
  result.success = false;
  result.error_code = error_code;
  result.error_message = error_message;
  return result;
}

std::string DescribeHttpFailure(const std::string& exchange,
                                const HttpResponse& response) {
  if (response.status_code == 0) {
    return exchange + " 请求失败: " + response.error;
  }
  return exchange + " HTTP 状态异常: " + std::to_string(response.status_code) +
         ", body=" + response.body;
}

std::string FormatQuantity(const Decimal& quantity, int precision) {
  return FormatDecimal(RoundQuantity(quantity, precision), precision);
}

std::string FormatPrice(const Decimal& price, int precision) {
  return FormatDecimal(RoundPrice(price, precision), precision);
}

Decimal JsonDecimalOr(const JsonValue* object,
                      const std::string& key,
                      const Decimal& fallback) {
  const auto parsed = JsonAsDecimal(JsonObjectField(object, key));
  return parsed.has_value() ? *parsed : fallback;
}

int JsonIntOr(const JsonValue* object, const std::string& key, int fallback) {
  const auto parsed = JsonAsDecimal(JsonObjectField(object, key));
  if (!parsed.has_value()) {
    return fallback;
  }
  const Decimal truncated = boost::multiprecision::trunc(*parsed);
  return truncated.convert_to<int>();
}

RetryPolicy MakeReadRetryPolicy(const ExchangeAdapterOptions& options) {
  return RetryPolicy(options.read_max_attempts,
                     &RetryPolicy::ExchangeReadBackoffMs, options.sleeper);
}

std::int64_t AdapterNowMs(const ExchangeAdapterOptions& options) {
  return options.clock != nullptr ? options.clock->NowMs()
                                  : DefaultClock().NowMs();
}

std::string JsonStringOr(const JsonValue* object,
                         const std::string& key,
                         const std::string& fallback) {
  const auto text = JsonAsString(JsonObjectField(object, key));
  return text.has_value() ? *text : fallback;
}

}  // namespace trade_pilot
