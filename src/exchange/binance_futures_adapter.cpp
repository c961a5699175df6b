#include "exchange/binance_futures_adapter.h"

#include <cctype>
#include <functional>

#include "core/crypto.h"
#include "core/log.h"

namespace trade_pilot {

namespace {

constexpr char kMainnetBase[] = "https://fapi.binance.com";
constexpr char kTestnetBase[] = "https://testnet.binancefuture.com";
constexpr char kOrderPath[] = "/fapi/v1/order";

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

}  // namespace

BinanceFuturesAdapter::BinanceFuturesAdapter(
    ExchangeCredentials credentials,
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

OrderStatus BinanceFuturesAdapter::MapStatus(const std::string& exchange_status) {
  if (exchange_status == "PARTIALLY_FILLED") {
    return OrderStatus::kPartiallyFilled;
  }
  if (exchange_status == "FILLED") {
    return OrderStatus::kFilled;
  }
  if (exchange_status == "CANCELED") {
    return OrderStatus::kCanceled;
  }
  if (exchange_status == "REJECTED") {
    return OrderStatus::kRejected;
  }
  if (exchange_status == "EXPIRED") {
    return OrderStatus::kExpired;
  }
  return OrderStatus::kNew;
}

std::string BinanceFuturesAdapter::BaseUrl() const {
  if (!options_.base_url_override.empty()) {
    return options_.base_url_override;
  }
  return options_.testnet ? kTestnetBase : kMainnetBase;
}

std::string BinanceFuturesAdapter::CacheKey(const std::string& symbol) const {
  return std::string("binance:") + (options_.testnet ? "testnet:" : "mainnet:") +
         symbol;
}

HttpResponse BinanceFuturesAdapter::Send(const std::string& method,
                                         const std::string& path,
                                         const Params& params,
                                         bool signed_request) {
  HttpHeaders headers;
  headers.emplace_back("X-MBX-APIKEY", credentials_.api_key);

  // 每次尝试都重新取时间戳并签名，避免重试时 recvWindow 过期。
  const std::function<HttpResponse(int)> attempt = [&](int) {
    Params full = params;
    if (signed_request) {
      full.emplace_back("timestamp", std::to_string(AdapterNowMs(options_)));
    }
    std::string query = BuildQueryString(full);
    if (signed_request) {
      std::string signature;
      std::string sign_error;
      if (!HmacSha256Hex(credentials_.api_secret, query, &signature,
                         &sign_error)) {
        HttpResponse failed;
        failed.error = "Binance 签名失败: " + sign_error;
        return failed;
      }
      query += "&signature=" + signature;
    }
    const std::string url =
        BaseUrl() + path + (query.empty() ? std::string() : "?" + query);
    return transport_->Send(method, url, headers, "");
  };

  if (method != "GET") {
    return attempt(0);
  }
  return read_retry_.Run<HttpResponse>(
      attempt, [](const HttpResponse& r) { return IsRetryableHttpResponse(r); });
}

bool BinanceFuturesAdapter::SendForJson(const std::string& method,
                                        const std::string& path,
                                        const Params& params,
                                        bool signed_request,
                                        JsonValue* out_root,
                                        std::string* out_error) {
  const HttpResponse response = Send(method, path, params, signed_request);
  if (!IsHttpSuccess(response)) {
    return Fail(DescribeHttpFailure("Binance", response), out_error);
  }
  std::string parse_error;
  if (!ParseJson(response.body, out_root, &parse_error)) {
    return Fail("Binance 响应 JSON 解析失败: " + parse_error, out_error);
  }
  return true;
}

bool BinanceFuturesAdapter::GetSymbolInfo(const std::string& symbol,
                                          SymbolInfo* out_info,
                                          std::string* out_error) {
  SymbolInfoCache& cache =
      options_.symbol_cache != nullptr ? *options_.symbol_cache : own_cache_;
  if (cache.Find(CacheKey(symbol), out_info)) {
    return true;
  }

  JsonValue root;
  if (!SendForJson("GET", "/fapi/v1/exchangeInfo", {}, false, &root,
                   out_error)) {
    return false;
  }
  const JsonValue* symbols = JsonObjectField(&root, "symbols");
  if (symbols == nullptr || symbols->type != JsonType::kArray) {
    return Fail("Binance exchangeInfo 缺少 symbols", out_error);
  }
  for (const auto& row : symbols->array_value) {
    if (JsonStringOr(&row, "symbol", "") != symbol) {
      continue;
    }
    SymbolInfo info;
    info.symbol = symbol;
    info.price_precision = JsonIntOr(&row, "pricePrecision", 2);
    info.qty_precision = JsonIntOr(&row, "quantityPrecision", 3);
    const JsonValue* filters = JsonObjectField(&row, "filters");
    if (filters != nullptr && filters->type == JsonType::kArray) {
      for (const auto& filter : filters->array_value) {
        const std::string type = JsonStringOr(&filter, "filterType", "");
        if (type == "LOT_SIZE") {
          info.min_qty = JsonDecimalOr(&filter, "minQty", info.min_qty);
          info.max_qty = JsonDecimalOr(&filter, "maxQty", info.max_qty);
        } else if (type == "MIN_NOTIONAL") {
          info.min_notional =
              JsonDecimalOr(&filter, "notional", info.min_notional);
        }
      }
    }
    cache.Put(CacheKey(symbol), info);
    if (out_info != nullptr) {
      *out_info = info;
    }
    return true;
  }
  return Fail("NotFound: Symbol " + symbol + " not found", out_error);
}

bool BinanceFuturesAdapter::GetBalance(const std::string& asset,
                                       Decimal* out_balance,
                                       std::string* out_error) {
  if (out_balance == nullptr) {
    return Fail("out_balance 为空", out_error);
  }
  JsonValue root;
  if (!SendForJson("GET", "/fapi/v2/balance", {}, true, &root, out_error)) {
    return false;
  }
  *out_balance = Decimal(0);
  if (root.type != JsonType::kArray) {
    return Fail("Binance balance 响应不是数组", out_error);
  }
  for (const auto& row : root.array_value) {
    if (JsonStringOr(&row, "asset", "") == asset) {
      *out_balance = JsonDecimalOr(&row, "availableBalance", Decimal(0));
      break;
    }
  }
  return true;
}

bool BinanceFuturesAdapter::ParsePosition(const JsonValue& row,
                                          PositionInfo* out_position) {
  const Decimal amount = JsonDecimalOr(&row, "positionAmt", Decimal(0));
  if (amount == 0) {
    return false;
  }
  PositionInfo position;
  position.symbol = JsonStringOr(&row, "symbol", "");
  position.side = amount > 0 ? PositionSide::kLong : PositionSide::kShort;
  position.quantity = boost::multiprecision::abs(amount);
  position.entry_price = JsonDecimalOr(&row, "entryPrice", Decimal(0));
  position.unrealized_pnl = JsonDecimalOr(&row, "unRealizedProfit", Decimal(0));
  position.leverage = JsonIntOr(&row, "leverage", 1);
  std::string margin_type = JsonStringOr(&row, "marginType", "");
  for (char& ch : margin_type) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  position.margin_type = margin_type;
  *out_position = position;
  return true;
}

bool BinanceFuturesAdapter::GetPositions(std::vector<PositionInfo>* out_positions,
                                         std::string* out_error) {
  if (out_positions == nullptr) {
    return Fail("out_positions 为空", out_error);
  }
  JsonValue root;
  if (!SendForJson("GET", "/fapi/v2/positionRisk", {}, true, &root,
                   out_error)) {
    return false;
  }
  out_positions->clear();
  for (const auto& row : root.array_value) {
    PositionInfo position;
    if (ParsePosition(row, &position)) {
      out_positions->push_back(position);
    }
  }
  return true;
}

bool BinanceFuturesAdapter::GetPosition(const std::string& symbol,
                                        std::optional<PositionInfo>* out_position,
                                        std::string* out_error) {
  if (out_position == nullptr) {
    return Fail("out_position 为空", out_error);
  }
  JsonValue root;
  if (!SendForJson("GET", "/fapi/v2/positionRisk", {{"symbol", symbol}}, true,
                   &root, out_error)) {
    return false;
  }
  out_position->reset();
  for (const auto& row : root.array_value) {
    PositionInfo position;
    if (ParsePosition(row, &position)) {
      *out_position = position;
      break;
    }
  }
  return true;
}

bool BinanceFuturesAdapter::GetOpenOrders(const std::string& symbol,
                                          std::vector<OrderResult>* out_orders,
                                          std::string* out_error) {
  if (out_orders == nullptr) {
    return Fail("out_orders 为空", out_error);
  }
  Params params;
  if (!symbol.empty()) {
    params.emplace_back("symbol", symbol);
  }
  JsonValue root;
  if (!SendForJson("GET", "/fapi/v1/openOrders", params, true, &root,
                   out_error)) {
    return false;
  }
  out_orders->clear();
  for (const auto& row : root.array_value) {
    out_orders->push_back(ParseOrder(row));
  }
  return true;
}

bool BinanceFuturesAdapter::GetTicker(const std::string& symbol,
                                      Decimal* out_price,
                                      std::string* out_error) {
  if (out_price == nullptr) {
    return Fail("out_price 为空", out_error);
  }
  JsonValue root;
  if (!SendForJson("GET", "/fapi/v1/ticker/price", {{"symbol", symbol}}, false,
                   &root, out_error)) {
    return false;
  }
  const auto price = JsonAsDecimal(JsonObjectField(&root, "price"));
  if (!price.has_value()) {
    return Fail("Binance ticker 缺少 price", out_error);
  }
  *out_price = *price;
  return true;
}

bool BinanceFuturesAdapter::SetLeverage(const std::string& symbol, int leverage) {
  const HttpResponse response =
      Send("POST", "/fapi/v1/leverage",
           {{"symbol", symbol}, {"leverage", std::to_string(leverage)}}, true);
  if (!IsHttpSuccess(response)) {
    LogWarn("Binance 设置杠杆失败: symbol=" + symbol +
            ", leverage=" + std::to_string(leverage) + ", " +
            DescribeHttpFailure("Binance", response));
    return false;
  }
  return true;
}

OrderResult BinanceFuturesAdapter::ParseOrder(const JsonValue& data) {
  OrderResult result;
  result.success = true;
  result.order_id = JsonStringOr(&data, "orderId", "");
  result.client_order_id = JsonStringOr(&data, "clientOrderId", "");
  result.exchange_status = JsonStringOr(&data, "status", "");
  result.status = MapStatus(result.exchange_status);
  const std::string executed = JsonStringOr(&data, "executedQty", "");
  if (!executed.empty()) {
    result.filled_qty = JsonAsDecimal(JsonObjectField(&data, "executedQty"));
  }
  const std::string avg_price = JsonStringOr(&data, "avgPrice", "");
  if (!avg_price.empty() && avg_price != "0") {
    const auto parsed = JsonAsDecimal(JsonObjectField(&data, "avgPrice"));
    if (parsed.has_value() && *parsed != 0) {
      result.filled_price = parsed;
    }
  }
  result.raw = data;
  return result;
}

OrderResult BinanceFuturesAdapter::SendOrderRequest(const std::string& method,
                                                    const Params& params) {
  const HttpResponse response = Send(method, kOrderPath, params, true);
  if (!IsHttpSuccess(response)) {
    return OrderResultFromHttpFailure(response);
  }
  JsonValue root;
  std::string parse_error;
  if (!ParseJson(response.body, &root, &parse_error)) {
    return FailedOrderResult("INVALID_RESPONSE",
                             "Binance 订单响应解析失败: " + parse_error);
  }
  return ParseOrder(root);
}

std::string BinanceFuturesAdapter::QuantityText(const std::string& symbol,
                                                const Decimal& quantity) {
  SymbolInfo info;
  std::string error;
  if (GetSymbolInfo(symbol, &info, &error)) {
    return FormatQuantity(quantity, info.qty_precision);
  }
  return DecimalToString(quantity);
}

std::string BinanceFuturesAdapter::PriceText(const std::string& symbol,
                                             const Decimal& price) {
  SymbolInfo info;
  std::string error;
  if (GetSymbolInfo(symbol, &info, &error)) {
    return FormatPrice(price, info.price_precision);
  }
  return DecimalToString(price);
}

OrderResult BinanceFuturesAdapter::PlaceMarketOrder(
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const std::string& client_order_id) {
  return SendOrderRequest("POST", {
                                      {"symbol", symbol},
                                      {"side", ToString(side)},
                                      {"type", "MARKET"},
                                      {"quantity", QuantityText(symbol, quantity)},
                                      {"newClientOrderId", client_order_id},
                                  });
}

OrderResult BinanceFuturesAdapter::PlaceConditional(
    const std::string& type,
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const Decimal& stop_price,
    const std::string& client_order_id) {
  return SendOrderRequest("POST", {
                                      {"symbol", symbol},
                                      {"side", ToString(side)},
                                      {"type", type},
                                      {"stopPrice", PriceText(symbol, stop_price)},
                                      {"quantity", QuantityText(symbol, quantity)},
                                      {"newClientOrderId", client_order_id},
                                      {"closePosition", "false"},
                                  });
}

OrderResult BinanceFuturesAdapter::PlaceTakeProfit(
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const Decimal& stop_price,
    const std::string& client_order_id) {
  return PlaceConditional("TAKE_PROFIT_MARKET", symbol, side, quantity,
                          stop_price, client_order_id);
}

OrderResult BinanceFuturesAdapter::PlaceStopLoss(
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const Decimal& stop_price,
    const std::string& client_order_id) {
  return PlaceConditional("STOP_MARKET", symbol, side, quantity, stop_price,
                          client_order_id);
}

bool BinanceFuturesAdapter::AppendOrderRef(const OrderRef& ref, Params* params) {
  if (!ref.order_id.empty()) {
    params->emplace_back("orderId", ref.order_id);
    return true;
  }
  if (!ref.client_order_id.empty()) {
    params->emplace_back("origClientOrderId", ref.client_order_id);
    return true;
  }
  return false;
}

OrderResult BinanceFuturesAdapter::CancelOrder(const OrderRef& ref) {
  Params params{{"symbol", ref.symbol}};
  if (!AppendOrderRef(ref, &params)) {
    return FailedOrderResult("INVALID_ARGUMENT",
                             "order_id 与 client_order_id 均为空");
  }
  return SendOrderRequest("DELETE", params);
}

OrderResult BinanceFuturesAdapter::GetOrder(const OrderRef& ref) {
  Params params{{"symbol", ref.symbol}};
  if (!AppendOrderRef(ref, &params)) {
    return FailedOrderResult("INVALID_ARGUMENT",
                             "order_id 与 client_order_id 均为空");
  }
  return SendOrderRequest("GET", params);
}

}  // namespace trade_pilot
