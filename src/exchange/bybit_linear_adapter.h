#pragma once

#include <memory>
#include <string>
#include <vector>

#include "exchange/bybit_rest_client.h"
#include "exchange/exchange_adapter.h"
#include "exchange/exchange_support.h"

namespace trade_pilot {

/**
 * @brief Bybit V5 USDT 线性永续适配器
 *
 * 单向持仓模式；TP/SL 以 reduceOnly 条件市价单实现，
 * triggerDirection 1 表示价格上穿触发，2 表示下穿触发。
 */
class BybitLinearAdapter final : public ExchangeAdapter {
 public:
  BybitLinearAdapter(ExchangeCredentials credentials,
                     ExchangeAdapterOptions options,
                     std::unique_ptr<HttpTransport> transport);

  std::string Name() const override { return "bybit"; }

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

  /// Bybit orderStatus 映射；未知状态按 NEW 处理。
  static OrderStatus MapStatus(const std::string& exchange_status);

 private:
  OrderResult PlaceOrder(const std::string& symbol,
                         OrderSide side,
                         const Decimal& quantity,
                         const std::optional<Decimal>& trigger_price,
                         int trigger_direction,
                         const std::string& client_order_id);
  bool ListOrders(const std::string& path,
                  const std::string& query,
                  std::vector<OrderResult>* out_orders,
                  std::string* out_error);
  static OrderResult ParseOrder(const JsonValue& row);
  static bool ParsePosition(const JsonValue& row, PositionInfo* out_position);

  BybitRestClient client_;
  ExchangeAdapterOptions options_;
  SymbolInfoCache own_cache_;
};

}  // namespace trade_pilot
