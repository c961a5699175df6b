#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "exchange/exchange_adapter.h"
#include "exchange/exchange_support.h"
#include "net/http_transport.h"

namespace trade_pilot {

/**
 * @brief Binance USDT 本位永续适配器
 *
 * - 私有接口：query 串 HMAC-SHA256 签名，`X-MBX-APIKEY` 头；
 * - 下单/撤单参数全部放在 query 上（与官方 SDK 一致）；
 * - 订单状态词表 NEW/PARTIALLY_FILLED/FILLED/CANCELED/REJECTED/EXPIRED。
 */
class BinanceFuturesAdapter final : public ExchangeAdapter {
 public:
  BinanceFuturesAdapter(ExchangeCredentials credentials,
                        ExchangeAdapterOptions options,
                        std::unique_ptr<HttpTransport> transport);

  std::string Name() const override { return "binance"; }

  bool GetSymbolInfo(const std::string& symbol,
                     SymbolInfo* out_info,
                     std::string* out_error) override;
  bool GetBalance(const std::string& asset,
                  Decimal* out_balance,
                  std::string* out_error) override;
  bool GetPositions(std::vector<PositionInfo>* out_positions,
                    std::string* out_error) override;
  bool GetPosition(const std::string& symbol,
                   std::optional<PositionInfo>* out_position,
                   std::string* out_error) override;
  bool GetOpenOrders(const std::string& symbol,
                     std::vector<OrderResult>* out_orders,
                     std::string* out_error) override;
  bool GetTicker(const std::string& symbol,
                 Decimal* out_price,
                 std::string* out_error) override;
  bool SetLeverage(const std::string& symbol, int leverage) override;
  OrderResult PlaceMarketOrder(const std::string& symbol,
                               OrderSide side,
                               const Decimal& quantity,
                               const std::string& client_order_id) override;
  OrderResult PlaceTakeProfit(const std::string& symbol,
                              OrderSide side,
                              const Decimal& quantity,
                              const Decimal& stop_price,
                              const std::string& client_order_id) override;
  OrderResult PlaceStopLoss(const std::string& symbol,
                            OrderSide side,
                            const Decimal& quantity,
                            const Decimal& stop_price,
                            const std::string& client_order_id) override;
  OrderResult CancelOrder(const OrderRef& ref) override;
  OrderResult GetOrder(const OrderRef& ref) override;

  /// 交易所状态文本映射；未知状态按 NEW 处理。
  static OrderStatus MapStatus(const std::string& exchange_status);

 private:
  using Params = std::vector<std::pair<std::string, std::string>>;

  /// 发送请求；signed=true 时追加 timestamp 与 signature。GET 按重试策略重试。
  HttpResponse Send(const std::string& method,
                    const std::string& path,
                    const Params& params,
                    bool signed_request);
  /// 发送并解析 JSON；失败写 out_error。
  bool SendForJson(const std::string& method,
                   const std::string& path,
                   const Params& params,
                   bool signed_request,
                   JsonValue* out_root,
                   std::string* out_error);
  /// 下单/撤单/查单公共路径：HTTP 失败折叠为 OrderResult。
  OrderResult SendOrderRequest(const std::string& method, const Params& params);
  OrderResult PlaceConditional(const std::string& type,
                               const std::string& symbol,
                               OrderSide side,
                               const Decimal& quantity,
                               const Decimal& stop_price,
                               const std::string& client_order_id);
  /// 订单查询/撤单的定位参数；两者都为空时返回 false。
  static bool AppendOrderRef(const OrderRef& ref, Params* params);
  static OrderResult ParseOrder(const JsonValue& data);
  static bool ParsePosition(const JsonValue& row, PositionInfo* out_position);
  /// 下单前按精度格式化数量；取不到精度时用规范化文本。
  std::string QuantityText(const std::string& symbol, const Decimal& quantity);
  std::string PriceText(const std::string& symbol, const Decimal& price);
  std::string BaseUrl() const;
  std::string CacheKey(const std::string& symbol) const;

  ExchangeCredentials credentials_;
  ExchangeAdapterOptions options_;
  std::unique_ptr<HttpTransport> transport_;
  RetryPolicy read_retry_;
  SymbolInfoCache own_cache_;  ///< 未注入共享缓存时使用。
};

}  // namespace trade_pilot
