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
 * @brief Gate.io USDT 永续适配器
 *
 * - 签名串 `METHOD\npath\nquery\nsha512(body)\ntimestamp`，HMAC-SHA512；
 * - 合约名使用下划线形式（BTCUSDT -> BTC_USDT）；
 * - 数量单位为整数张，方向由 size 正负表示；
 * - TP/SL 走 price_orders 条件单，trigger.rule 1 表示 >=，2 表示 <=。
 */
class GateFuturesAdapter final : public ExchangeAdapter {
 public:
  GateFuturesAdapter(ExchangeCredentials credentials,
                     ExchangeAdapterOptions options,
                     std::unique_ptr<HttpTransport> transport);

  std::string Name() const override { return "gate"; }

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

  /// BTCUSDT -> BTC_USDT；已含下划线的原样返回。
  static std::string ToGateContract(const std::string& symbol);
  /// open->NEW，finished->FILLED，cancelled/liquidated->CANCELED，其余 NEW。
  static OrderStatus MapStatus(const std::string& exchange_status);
  /// 构造签名串并做 HMAC-SHA512。
  static bool BuildSignature(const std::string& api_secret,
                             const std::string& method,
                             const std::string& path,
                             const std::string& query,
                             const std::string& body,
                             const std::string& timestamp_s,
                             std::string* out_signature,
                             std::string* out_error);

 private:
  HttpResponse Send(const std::string& method,
                    const std::string& path,
                    const std::string& query,
                    const JsonValue* body,
                    bool signed_request);
  bool SendForJson(const std::string& method,
                   const std::string& path,
                   const std::string& query,
                   const JsonValue* body,
                   bool signed_request,
                   JsonValue* out_root,
                   std::string* out_error);
  OrderResult PlacePriceOrder(const std::string& symbol,
                              OrderSide side,
                              const Decimal& quantity,
                              const Decimal& stop_price,
                              const std::string& client_order_id,
                              int rule);
  static OrderResult ParseOrder(const JsonValue& data);
  static bool ParsePosition(const JsonValue& row, PositionInfo* out_position);
  /// 张数：向零截断为整数，卖出取负。
  static std::int64_t SignedContracts(OrderSide side, const Decimal& quantity);
  std::string BaseUrl() const;

  ExchangeCredentials credentials_;
  ExchangeAdapterOptions options_;
  std::unique_ptr<HttpTransport> transport_;
  RetryPolicy read_retry_;
  SymbolInfoCache own_cache_;
};

}  // namespace trade_pilot
