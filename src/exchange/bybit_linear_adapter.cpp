#include "exchange/bybit_linear_adapter.h"

#include "core/log.h"

namespace trade_pilot {

namespace {

constexpr char kCategory[] = "linear";

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

int StepPrecision(const std::string& step, int fallback) {
  const std::size_t dot = step.find('.');
  if (step.empty()) {
    return fallback;
  }
  if (dot == std::string::npos) {
    return 0;
  }
  std::size_t end = step.size();
  while (end > dot + 1 && step[end - 1] == '0') {
    --end;
  }
  return static_cast<int>(end - dot - 1);
}

const JsonValue* ResultList(const JsonValue& root) {
  const JsonValue* list = JsonFindPath(&root, {"result", "list"});
  if (list == nullptr || list->type != JsonType::kArray) {
    return nullptr;
  }
  return list;
}

const char* BybitSide(OrderSide side) {
  return side == OrderSide::kBuy ? "Buy" : "Sell";
}

}  // namespace

BybitLinearAdapter::BybitLinearAdapter(ExchangeCredentials credentials,
                                       ExchangeAdapterOptions options,
                                       std::unique_ptr<HttpTransport> transport)
    : client_(std::move(credentials), options, std::move(transport)),
      options_(std::move(options)) {}

OrderStatus BybitLinearAdapter::MapStatus(const std::string& exchange_status) {
  if (exchange_status == "PartiallyFilled") {
    return OrderStatus::kPartiallyFilled;
  }
  if (exchange_status == "Filled") {
    return OrderStatus::kFilled;
  }
  if (exchange_status == "Cancelled" || exchange_status == "Deactivated" ||
      exchange_status == "PartiallyFilledCanceled") {
    return OrderStatus::kCanceled;
  }
  if (exchange_status == "Rejected") {
    return OrderStatus::kRejected;
  }
  return OrderStatus::kNew;
}

bool BybitLinearAdapter::GetSymbolInfo(const std::string& symbol,
                                       SymbolInfo* out_info,
                                       std::string* out_error) {
  SymbolInfoCache& cache =
      options_.symbol_cache != nullptr ? *options_.symbol_cache : own_cache_;
  const std::string cache_key = std::string("bybit:") +
                                (options_.testnet ? "testnet:" : "mainnet:") +
                                symbol;
  if (cache.Find(cache_key, out_info)) {
    return true;
  }

  JsonValue root;
  if (!client_.GetPublic("/v5/market/instruments-info",
                         std::string("category=") + kCategory +
                             "&symbol=" + symbol,
                         &root, out_error)) {
    return false;
  }
  const JsonValue* list = ResultList(root);
  if (list != nullptr) {
    for (const auto& row : list->array_value) {
      if (JsonStringOr(&row, "symbol", "") != symbol) {
        continue;
      }
      const JsonValue* lot = JsonObjectField(&row, "lotSizeFilter");
      const JsonValue* price = JsonObjectField(&row, "priceFilter");
      SymbolInfo info;
      info.symbol = symbol;
      info.price_precision =
          StepPrecision(JsonStringOr(price, "tickSize", ""), 2);
      info.qty_precision = StepPrecision(JsonStringOr(lot, "qtyStep", ""), 3);
      info.min_qty = JsonDecimalOr(lot, "minOrderQty", info.min_qty);
      info.max_qty = JsonDecimalOr(
          lot, "maxMktOrderQty", JsonDecimalOr(lot, "maxOrderQty", info.max_qty));
      info.min_notional =
          JsonDecimalOr(lot, "minNotionalValue", info.min_notional);
      cache.Put(cache_key, info);
      if (out_info != nullptr) {
        *out_info = info;
      }
      return true;
    }
  }
  return Fail("NotFound: Symbol " + symbol + " not found", out_error);
}

bool BybitLinearAdapter::GetBalance(const std::string& asset,
                                    Decimal* out_balance,
                                    std::string* out_error) {
  if (out_balance == nullptr) {
    return Fail("out_balance 为空", out_error);
  }
  JsonValue root;
  if (!client_.GetPrivate("/v5/account/wallet-balance",
                          "accountType=UNIFIED&coin=" + asset, &root,
                          out_error)) {
    return false;
  }
  *out_balance = Decimal(0);
  const JsonValue* list = ResultList(root);
  const JsonValue* coins = JsonObjectField(JsonArrayAt(list, 0), "coin");
  if (coins == nullptr || coins->type != JsonType::kArray) {
    return true;
  }
  for (const auto& coin : coins->array_value) {
    if (JsonStringOr(&coin, "coin", "") != asset) {
      continue;
    }
    // UTA 账户的 availableToWithdraw 可能为空串，退回 walletBalance。
    const auto available =
        JsonAsDecimal(JsonObjectField(&coin, "availableToWithdraw"));
    *out_balance = available.has_value()
                       ? *available
                       : JsonDecimalOr(&coin, "walletBalance", Decimal(0));
    break;
  }
  return true;
}

bool BybitLinearAdapter::ParsePosition(const JsonValue& row,
                                       PositionInfo* out_position) {
  const Decimal size = JsonDecimalOr(&row, "size", Decimal(0));
  if (size == 0) {
    return false;
  }
  PositionInfo position;
  position.symbol = JsonStringOr(&row, "symbol", "");
  position.side = JsonStringOr(&row, "side", "Buy") == "Sell"
                      ? PositionSide::kShort
                      : PositionSide::kLong;
  position.quantity = boost::multiprecision::abs(size);
  position.entry_price = JsonDecimalOr(&row, "avgPrice", Decimal(0));
  position.unrealized_pnl = JsonDecimalOr(&row, "unrealisedPnl", Decimal(0));
  position.leverage = JsonIntOr(&row, "leverage", 1);
  position.margin_type =
      JsonIntOr(&row, "tradeMode", 0) == 1 ? "ISOLATED" : "CROSS";
  *out_position = position;
  return true;
}

bool BybitLinearAdapter::GetPositions(std::vector<PositionInfo>* out_positions,
                                      std::string* out_error) {
  if (out_positions == nullptr) {
    return Fail("out_positions 为空", out_error);
  }
  JsonValue root;
  if (!client_.GetPrivate("/v5/position/list",
                          std::string("category=") + kCategory +
                              "&settleCoin=USDT",
                          &root, out_error)) {
    return false;
  }
  out_positions->clear();
  if (const JsonValue* list = ResultList(root); list != nullptr) {
    for (const auto& row : list->array_value) {
      PositionInfo position;
      if (ParsePosition(row, &position)) {
        out_positions->push_back(position);
      }
    }
  }
  return true;
}

bool BybitLinearAdapter::GetPosition(const std::string& symbol,
                                     std::optional<PositionInfo>* out_position,
                                     std::string* out_error) {
  if (out_position == nullptr) {
    return Fail("out_position 为空", out_error);
  }
  JsonValue root;
  if (!client_.GetPrivate("/v5/position/list",
                          std::string("category=") + kCategory +
                              "&symbol=" + symbol,
                          &root, out_error)) {
    return false;
  }
  out_position->reset();
  if (const JsonValue* list = ResultList(root); list != nullptr) {
    for (const auto& row : list->array_value) {
      PositionInfo position;
      if (ParsePosition(row, &position)) {
        *out_position = position;
        break;
      }
    }
  }
  return true;
}

OrderResult BybitLinearAdapter::ParseOrder(const JsonValue& row) {
  OrderResult result;
  result.success = true;
  result.order_id = JsonStringOr(&row, "orderId", "");
  result.client_order_id = JsonStringOr(&row, "orderLinkId", "");
  result.exchange_status = JsonStringOr(&row, "orderStatus", "");
  result.status = MapStatus(result.exchange_status);
  const auto filled = JsonAsDecimal(JsonObjectField(&row, "cumExecQty"));
  if (filled.has_value()) {
    result.filled_qty = filled;
  }
  const auto avg_price = JsonAsDecimal(JsonObjectField(&row, "avgPrice"));
  if (avg_price.has_value() && *avg_price != 0) {
    result.filled_price = avg_price;
  }
  result.raw = row;
  return result;
}

bool BybitLinearAdapter::ListOrders(const std::string& path,
                                    const std::string& query,
                                    std::vector<OrderResult>* out_orders,
                                    std::string* out_error) {
  JsonValue root;
  if (!client_.GetPrivate(path, query, &root, out_error)) {
    return false;
  }
  out_orders->clear();
  if (const JsonValue* list = ResultList(root); list != nullptr) {
    for (const auto& row : list->array_value) {
      out_orders->push_back(ParseOrder(row));
    }
  }
  return true;
}

bool BybitLinearAdapter::GetOpenOrders(const std::string& symbol,
                                       std::vector<OrderResult>* out_orders,
                                       std::string* out_error) {
  if (out_orders == nullptr) {
    return Fail("out_orders 为空", out_error);
  }
  std::string query = std::string("category=") + kCategory;
  query += symbol.empty() ? "&settleCoin=USDT" : "&symbol=" + symbol;
  return ListOrders("/v5/order/realtime", query, out_orders, out_error);
}

bool BybitLinearAdapter::GetTicker(const std::string& symbol,
                                   Decimal* out_price,
                                   std::string* out_error) {
  if (out_price == nullptr) {
    return Fail("out_price 为空", out_error);
  }
  JsonValue root;
  if (!client_.GetPublic("/v5/market/tickers",
                         std::string("category=") + kCategory +
                             "&symbol=" + symbol,
                         &root, out_error)) {
    return false;
  }
  const auto price =
      JsonAsDecimal(JsonObjectField(JsonArrayAt(ResultList(root), 0), "lastPrice"));
  if (!price.has_value()) {
    return Fail("Bybit ticker 缺少 lastPrice", out_error);
  }
  *out_price = *price;
  return true;
}

bool BybitLinearAdapter::SetLeverage(const std::string& symbol, int leverage) {
  JsonValue body = MakeJsonObject();
  JsonSet(&body, "category", MakeJsonString(kCategory));
  JsonSet(&body, "symbol", MakeJsonString(symbol));
  JsonSet(&body, "buyLeverage", MakeJsonString(std::to_string(leverage)));
  JsonSet(&body, "sellLeverage", MakeJsonString(std::to_string(leverage)));
  JsonValue root;
  std::string error_code;
  std::string error;
  if (!client_.PostPrivate("/v5/position/set-leverage", body, &root,
                           &error_code, &error)) {
    // 110043: leverage not modified，目标杠杆已生效。
    if (error_code == "110043") {
      return true;
    }
    LogWarn("Bybit 设置杠杆失败: symbol=" + symbol +
            ", leverage=" + std::to_string(leverage) + ", error=" + error);
    return false;
  }
  return true;
}

OrderResult BybitLinearAdapter::PlaceOrder(
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const std::optional<Decimal>& trigger_price,
    int trigger_direction,
    const std::string& client_order_id) {
  SymbolInfo info;
  std::string info_error;
  const bool has_info = GetSymbolInfo(symbol, &info, &info_error);

  JsonValue body = MakeJsonObject();
  JsonSet(&body, "category", MakeJsonString(kCategory));
  JsonSet(&body, "symbol", MakeJsonString(symbol));
  JsonSet(&body, "side", MakeJsonString(BybitSide(side)));
  JsonSet(&body, "orderType", MakeJsonString("Market"));
  JsonSet(&body, "qty",
          MakeJsonString(has_info ? FormatQuantity(quantity, info.qty_precision)
                                  : DecimalToString(quantity)));
  JsonSet(&body, "orderLinkId", MakeJsonString(client_order_id));
  if (trigger_price.has_value()) {
    JsonSet(&body, "triggerPrice",
            MakeJsonString(has_info
                               ? FormatPrice(*trigger_price, info.price_precision)
                               : DecimalToString(*trigger_price)));
    JsonSet(&body, "triggerDirection", MakeJsonInt(trigger_direction));
    JsonSet(&body, "reduceOnly", MakeJsonBool(true));
  }

  JsonValue root;
  std::string error_code;
  std::string error;
  if (!client_.PostPrivate("/v5/order/create", body, &root, &error_code,
                           &error)) {
    return FailedOrderResult(error_code, error);
  }
  const JsonValue* result_node = JsonObjectField(&root, "result");
  OrderResult result;
  result.success = true;
  result.order_id = JsonStringOr(result_node, "orderId", "");
  result.client_order_id =
      JsonStringOr(result_node, "orderLinkId", client_order_id);
  result.status = OrderStatus::kNew;
  result.raw = root;
  return result;
}

OrderResult BybitLinearAdapter::PlaceMarketOrder(
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const std::string& client_order_id) {
  return PlaceOrder(symbol, side, quantity, std::nullopt, 0, client_order_id);
}

OrderResult BybitLinearAdapter::PlaceTakeProfit(
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const Decimal& stop_price,
    const std::string& client_order_id) {
  return PlaceOrder(symbol, side, quantity, stop_price,
                    side == OrderSide::kSell ? 1 : 2, client_order_id);
}

OrderResult BybitLinearAdapter::PlaceStopLoss(
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const Decimal& stop_price,
    const std::string& client_order_id) {
  return PlaceOrder(symbol, side, quantity, stop_price,
                    side == OrderSide::kSell ? 2 : 1, client_order_id);
}

OrderResult BybitLinearAdapter::CancelOrder(const OrderRef& ref) {
  JsonValue body = MakeJsonObject();
  JsonSet(&body, "category", MakeJsonString(kCategory));
  JsonSet(&body, "symbol", MakeJsonString(ref.symbol));
  if (!ref.order_id.empty()) {
    JsonSet(&body, "orderId", MakeJsonString(ref.order_id));
  } else if (!ref.client_order_id.empty()) {
    JsonSet(&body, "orderLinkId", MakeJsonString(ref.client_order_id));
  } else {
    return FailedOrderResult("INVALID_ARGUMENT",
                             "order_id 与 client_order_id 均为空");
  }
  JsonValue root;
  std::string error_code;
  std::string error;
  if (!client_.PostPrivate("/v5/order/cancel", body, &root, &error_code,
                           &error)) {
    return FailedOrderResult(error_code, error);
  }
  const JsonValue* result_node = JsonObjectField(&root, "result");
  OrderResult result;
  result.success = true;
  result.order_id = JsonStringOr(result_node, "orderId", ref.order_id);
  result.client_order_id =
      JsonStringOr(result_node, "orderLinkId", ref.client_order_id);
  result.status = OrderStatus::kCanceled;
  result.raw = root;
  return result;
}

OrderResult BybitLinearAdapter::GetOrder(const OrderRef& ref) {
  std::string query = std::string("category=") + kCategory +
                      "&symbol=" + ref.symbol;
  if (!ref.order_id.empty()) {
    query += "&orderId=" + UrlEncode(ref.order_id);
  } else if (!ref.client_order_id.empty()) {
    query += "&orderLinkId=" + UrlEncode(ref.client_order_id);
  } else {
    return FailedOrderResult("INVALID_ARGUMENT",
                             "order_id 与 client_order_id 均为空");
  }

  // 活跃单在 realtime，已终结的单在 history。
  std::vector<OrderResult> orders;
  std::string error;
  if (ListOrders("/v5/order/realtime", query, &orders, &error) &&
      !orders.empty()) {
    return orders.front();
  }
  if (ListOrders("/v5/order/history", query, &orders, &error) &&
      !orders.empty()) {
    return orders.front();
  }
  if (error.empty()) {
    error = "Bybit 未找到订单";
  }
  return FailedOrderResult("NOT_FOUND", error);
}

}  // namespace trade_pilot
