#include "exchange/gate_futures_adapter.h"

#include <functional>

#include "core/crypto.h"
#include "core/log.h"

namespace trade_pilot {

namespace {

constexpr char kMainnetBase[] = "https://api.gateio.ws";
constexpr char kTestnetBase[] = "https://fx-api-testnet.gateio.ws";
constexpr char kPrefix[] = "/api/v4/futures/usdt";

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

// "0.01" -> 2，"1" -> 0；无法识别时返回 fallback。
int DecimalPlaces(const std::string& step, int fallback) {
  if (step.empty()) {
    return fallback;
  }
  const std::size_t dot = step.find('.');
  if (dot == std::string::npos) {
    return 0;
  }
  std::size_t end = step.size();
  while (end > dot + 1 && step[end - 1] == '0') {
    --end;
  }
  return static_cast<int>(end - dot - 1);
}

}  // namespace

GateFuturesAdapter::GateFuturesAdapter(ExchangeCredentials credentials,
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

std::string GateFuturesAdapter::ToGateContract(const std::string& symbol) {
  if (symbol.find('_') != std::string::npos) {
    return symbol;
  }
  const std::string quote = "USDT";
  if (symbol.size() > quote.size() &&
      symbol.compare(symbol.size() - quote.size(), quote.size(), quote) == 0) {
    return symbol.substr(0, symbol.size() - quote.size()) + "_USDT";
  }
  return symbol;
}

OrderStatus GateFuturesAdapter::MapStatus(const std::string& exchange_status) {
  if (exchange_status == "finished") {
    return OrderStatus::kFilled;
  }
  if (exchange_status == "cancelled" || exchange_status == "liquidated") {
    return OrderStatus::kCanceled;
  }
  return OrderStatus::kNew;
}

bool GateFuturesAdapter::BuildSignature(const std::string& api_secret,
                                        const std::string& method,
                                        const std::string& path,
                                        const std::string& query,
                                        const std::string& body,
                                        const std::string& timestamp_s,
                                        std::string* out_signature,
                                        std::string* out_error) {
  std::string body_hash;
  if (!Sha512Hex(body, &body_hash, out_error)) {
    return false;
  }
  const std::string prehash = method + "\n" + path + "\n" + query + "\n" +
                              body_hash + "\n" + timestamp_s;
  return HmacSha512Hex(api_secret, prehash, out_signature, out_error);
}

std::string GateFuturesAdapter::BaseUrl() const {
  if (!options_.base_url_override.empty()) {
    return options_.base_url_override;
  }
  return options_.testnet ? kTestnetBase : kMainnetBase;
}

HttpResponse GateFuturesAdapter::Send(const std::string& method,
                                      const std::string& path,
                                      const std::string& query,
                                      const JsonValue* body,
                                      bool signed_request) {
  const std::string body_text = body != nullptr ? SerializeJson(*body) : "";
  const std::string full_path = std::string(kPrefix) + path;
  const std::string url =
      BaseUrl() + full_path + (query.empty() ? std::string() : "?" + query);

  const std::function<HttpResponse(int)> attempt = [&](int) {
    HttpHeaders headers;
    headers.emplace_back("Content-Type", "application/json");
    headers.emplace_back("Accept", "application/json");
    if (signed_request) {
      const std::string ts = std::to_string(AdapterNowMs(options_) / 1000);
      std::string signature;
      std::string sign_error;
      if (!BuildSignature(credentials_.api_secret, method, full_path, query,
                          body_text, ts, &signature, &sign_error)) {
        HttpResponse failed;
        failed.error = "Gate 签名失败: " + sign_error;
        return failed;
      }
      headers.emplace_back("KEY", credentials_.api_key);
      headers.emplace_back("Timestamp", ts);
      headers.emplace_back("SIGN", signature);
    }
    return transport_->Send(method, url, headers, body_text);
  };

  if (method != "GET") {
    return attempt(0);
  }
  return read_retry_.Run<HttpResponse>(
      attempt, [](const HttpResponse& r) { return IsRetryableHttpResponse(r); });
}

bool GateFuturesAdapter::SendForJson(const std::string& method,
                                     const std::string& path,
                                     const std::string& query,
                                     const JsonValue* body,
                                     bool signed_request,
                                     JsonValue* out_root,
                                     std::string* out_error) {
  const HttpResponse response = Send(method, path, query, body, signed_request);
  if (!IsHttpSuccess(response)) {
    return Fail(DescribeHttpFailure("Gate", response), out_error);
  }
  std::string parse_error;
  if (!ParseJson(response.body, out_root, &parse_error)) {
    return Fail("Gate 响应 JSON 解析失败: " + parse_error, out_error);
  }
  return true;
}

bool GateFuturesAdapter::GetSymbolInfo(const std::string& symbol,
                                       SymbolInfo* out_info,
                                       std::string* out_error) {
  const std::string contract = ToGateContract(symbol);
  SymbolInfoCache& cache =
      options_.symbol_cache != nullptr ? *options_.symbol_cache : own_cache_;
  const std::string cache_key = std::string("gate:") +
                                (options_.testnet ? "testnet:" : "mainnet:") +
                                contract;
  if (cache.Find(cache_key, out_info)) {
    return true;
  }

  JsonValue root;
  if (!SendForJson("GET", "/contracts", "", nullptr, false, &root,
                   out_error)) {
    return false;
  }
  for (const auto& row : root.array_value) {
    if (JsonStringOr(&row, "name", "") != contract) {
      continue;
    }
    const Decimal multiplier =
        JsonDecimalOr(&row, "quanto_multiplier", Decimal(1));
    const Decimal size_min = JsonDecimalOr(&row, "order_size_min", Decimal(1));
    const Decimal size_max =
        JsonDecimalOr(&row, "order_size_max", Decimal(1000000));

    SymbolInfo info;
    info.symbol = contract;
    info.price_precision =
        DecimalPlaces(JsonStringOr(&row, "mark_price_round", "0.01"), 2);
    info.qty_precision = 0;
    info.min_qty = size_min * multiplier;
    info.max_qty = size_max * multiplier;
    info.min_notional = Decimal(1);
    cache.Put(cache_key, info);
    if (out_info != nullptr) {
      *out_info = info;
    }
    return true;
  }
  return Fail("NotFound: Symbol " + contract + " not found", out_error);
}

bool GateFuturesAdapter::GetBalance(const std::string& asset,
                                    Decimal* out_balance,
                                    std::string* out_error) {
  (void)asset;  // USDT 结算账户只有一种资产。
  if (out_balance == nullptr) {
    return Fail("out_balance 为空", out_error);
  }
  JsonValue root;
  if (!SendForJson("GET", "/accounts", "", nullptr, true, &root, out_error)) {
    return false;
  }
  *out_balance = JsonDecimalOr(&root, "available", Decimal(0));
  return true;
}

bool GateFuturesAdapter::ParsePosition(const JsonValue& row,
                                       PositionInfo* out_position) {
  const Decimal size = JsonDecimalOr(&row, "size", Decimal(0));
  if (size == 0) {
    return false;
  }
  PositionInfo position;
  position.symbol = JsonStringOr(&row, "contract", "");
  position.side = size > 0 ? PositionSide::kLong : PositionSide::kShort;
  position.quantity = boost::multiprecision::abs(size);
  position.entry_price = JsonDecimalOr(&row, "entry_price", Decimal(0));
  position.unrealized_pnl = JsonDecimalOr(&row, "unrealised_pnl", Decimal(0));
  position.leverage = JsonIntOr(&row, "leverage", 1);
  position.margin_type =
      JsonStringOr(&row, "mode", "") == "single" ? "CROSS" : "ISOLATED";
  *out_position = position;
  return true;
}

bool GateFuturesAdapter::GetPositions(std::vector<PositionInfo>* out_positions,
                                      std::string* out_error) {
  if (out_positions == nullptr) {
    return Fail("out_positions 为空", out_error);
  }
  JsonValue root;
  if (!SendForJson("GET", "/positions", "", nullptr, true, &root, out_error)) {
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

bool GateFuturesAdapter::GetPosition(const std::string& symbol,
                                     std::optional<PositionInfo>* out_position,
                                     std::string* out_error) {
  if (out_position == nullptr) {
    return Fail("out_position 为空", out_error);
  }
  out_position->reset();
  const HttpResponse response = Send(
      "GET", "/positions/" + ToGateContract(symbol), "", nullptr, true);
  if (response.status_code == 404) {
    return true;  // 从未开过仓的合约返回 404。
  }
  if (!IsHttpSuccess(response)) {
    return Fail(DescribeHttpFailure("Gate", response), out_error);
  }
  JsonValue root;
  std::string parse_error;
  if (!ParseJson(response.body, &root, &parse_error)) {
    return Fail("Gate 响应 JSON 解析失败: " + parse_error, out_error);
  }
  PositionInfo position;
  if (ParsePosition(root, &position)) {
    *out_position = position;
  }
  return true;
}

bool GateFuturesAdapter::GetOpenOrders(const std::string& symbol,
                                       std::vector<OrderResult>* out_orders,
                                       std::string* out_error) {
  if (out_orders == nullptr) {
    return Fail("out_orders 为空", out_error);
  }
  std::string query = "status=open";
  if (!symbol.empty()) {
    query += "&contract=" + ToGateContract(symbol);
  }
  JsonValue root;
  if (!SendForJson("GET", "/orders", query, nullptr, true, &root, out_error)) {
    return false;
  }
  out_orders->clear();
  for (const auto& row : root.array_value) {
    out_orders->push_back(ParseOrder(row));
  }
  return true;
}

bool GateFuturesAdapter::GetTicker(const std::string& symbol,
                                   Decimal* out_price,
                                   std::string* out_error) {
  if (out_price == nullptr) {
    return Fail("out_price 为空", out_error);
  }
  JsonValue root;
  if (!SendForJson("GET", "/tickers", "contract=" + ToGateContract(symbol),
                   nullptr, false, &root, out_error)) {
    return false;
  }
  const auto price = JsonAsDecimal(JsonObjectField(JsonArrayAt(&root, 0), "last"));
  if (!price.has_value()) {
    return Fail("Gate ticker 缺少 last", out_error);
  }
  *out_price = *price;
  return true;
}

bool GateFuturesAdapter::SetLeverage(const std::string& symbol, int leverage) {
  JsonValue body = MakeJsonObject();
  JsonSet(&body, "leverage", MakeJsonString(std::to_string(leverage)));
  const HttpResponse response =
      Send("POST", "/positions/" + ToGateContract(symbol) + "/leverage", "",
           &body, true);
  if (!IsHttpSuccess(response)) {
    LogWarn("Gate 设置杠杆失败: symbol=" + symbol +
            ", leverage=" + std::to_string(leverage) + ", " +
            DescribeHttpFailure("Gate", response));
    return false;
  }
  return true;
}

std::int64_t GateFuturesAdapter::SignedContracts(OrderSide side,
                                                 const Decimal& quantity) {
  const Decimal contracts = RoundQuantity(quantity, 0);
  const std::int64_t size = contracts.convert_to<std::int64_t>();
  return side == OrderSide::kBuy ? size : -size;
}

OrderResult GateFuturesAdapter::ParseOrder(const JsonValue& data) {
  OrderResult result;
  result.success = true;
  result.order_id = JsonStringOr(&data, "id", "");
  result.client_order_id = JsonStringOr(&data, "text", "");
  result.exchange_status = JsonStringOr(&data, "status", "open");
  result.status = MapStatus(result.exchange_status);
  const Decimal size = JsonDecimalOr(&data, "size", Decimal(0));
  const Decimal left = JsonDecimalOr(&data, "left", Decimal(0));
  const Decimal filled = boost::multiprecision::abs(Decimal(size - left));
  if (filled != 0) {
    result.filled_qty = filled;
  }
  const auto fill_price = JsonAsDecimal(JsonObjectField(&data, "fill_price"));
  if (fill_price.has_value() && *fill_price != 0) {
    result.filled_price = fill_price;
  }
  result.raw = data;
  return result;
}

OrderResult GateFuturesAdapter::PlaceMarketOrder(
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const std::string& client_order_id) {
  JsonValue body = MakeJsonObject();
  JsonSet(&body, "contract", MakeJsonString(ToGateContract(symbol)));
  JsonSet(&body, "size", MakeJsonInt(SignedContracts(side, quantity)));
  JsonSet(&body, "price", MakeJsonString("0"));
  JsonSet(&body, "tif", MakeJsonString("ioc"));
  JsonSet(&body, "text", MakeJsonString(client_order_id));

  const HttpResponse response = Send("POST", "/orders", "", &body, true);
  if (!IsHttpSuccess(response)) {
    return OrderResultFromHttpFailure(response);
  }
  JsonValue root;
  std::string parse_error;
  if (!ParseJson(response.body, &root, &parse_error)) {
    return FailedOrderResult("INVALID_RESPONSE",
                             "Gate 订单响应解析失败: " + parse_error);
  }
  return ParseOrder(root);
}

OrderResult GateFuturesAdapter::PlacePriceOrder(
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const Decimal& stop_price,
    const std::string& client_order_id,
    int rule) {
  SymbolInfo info;
  std::string info_error;
  const std::string price_text =
      GetSymbolInfo(symbol, &info, &info_error)
          ? FormatPrice(stop_price, info.price_precision)
          : DecimalToString(stop_price);

  JsonValue initial = MakeJsonObject();
  JsonSet(&initial, "contract", MakeJsonString(ToGateContract(symbol)));
  JsonSet(&initial, "size", MakeJsonInt(SignedContracts(side, quantity)));
  JsonSet(&initial, "price", MakeJsonString("0"));
  JsonSet(&initial, "tif", MakeJsonString("ioc"));
  JsonSet(&initial, "text", MakeJsonString(client_order_id));

  JsonValue trigger = MakeJsonObject();
  JsonSet(&trigger, "strategy_type", MakeJsonInt(0));
  JsonSet(&trigger, "price_type", MakeJsonInt(0));
  JsonSet(&trigger, "price", MakeJsonString(price_text));
  JsonSet(&trigger, "rule", MakeJsonInt(rule));

  JsonValue body = MakeJsonObject();
  JsonSet(&body, "initial", std::move(initial));
  JsonSet(&body, "trigger", std::move(trigger));

  const HttpResponse response = Send("POST", "/price_orders", "", &body, true);
  if (!IsHttpSuccess(response)) {
    return OrderResultFromHttpFailure(response);
  }
  JsonValue root;
  std::string parse_error;
  if (!ParseJson(response.body, &root, &parse_error)) {
    return FailedOrderResult("INVALID_RESPONSE",
                             "Gate 条件单响应解析失败: " + parse_error);
  }
  OrderResult result;
  result.success = true;
  result.order_id = JsonStringOr(&root, "id", "");
  result.client_order_id = client_order_id;
  result.status = OrderStatus::kNew;
  result.raw = root;
  return result;
}

OrderResult GateFuturesAdapter::PlaceTakeProfit(
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const Decimal& stop_price,
    const std::string& client_order_id) {
  // 平多（卖出）止盈在价格上穿时触发，平空则相反。
  const int rule = side == OrderSide::kSell ? 1 : 2;
  return PlacePriceOrder(symbol, side, quantity, stop_price, client_order_id,
                         rule);
}

OrderResult GateFuturesAdapter::PlaceStopLoss(
    const std::string& symbol,
    OrderSide side,
    const Decimal& quantity,
    const Decimal& stop_price,
    const std::string& client_order_id) {
  const int rule = side == OrderSide::kSell ? 2 : 1;
  return PlacePriceOrder(symbol, side, quantity, stop_price, client_order_id,
                         rule);
}

OrderResult GateFuturesAdapter::CancelOrder(const OrderRef& ref) {
  const std::string id = !ref.order_id.empty() ? ref.order_id
                                               : ref.client_order_id;
  if (id.empty()) {
    return FailedOrderResult("INVALID_ARGUMENT",
                             "order_id 与 client_order_id 均为空");
  }
  const HttpResponse response =
      Send("DELETE", "/orders/" + UrlEncode(id), "", nullptr, true);
  if (!IsHttpSuccess(response)) {
    return OrderResultFromHttpFailure(response);
  }
  JsonValue root;
  std::string parse_error;
  if (!ParseJson(response.body, &root, &parse_error)) {
    return FailedOrderResult("INVALID_RESPONSE",
                             "Gate 撤单响应解析失败: " + parse_error);
  }
  return ParseOrder(root);
}

OrderResult GateFuturesAdapter::GetOrder(const OrderRef& ref) {
  // Gate 的订单路径同时接受订单号与自定义 text。
  const std::string id = !ref.order_id.empty() ? ref.order_id
                                               : ref.client_order_id;
  if (id.empty()) {
    return FailedOrderResult("INVALID_ARGUMENT",
                             "order_id 与 client_order_id 均为空");
  }
  const HttpResponse response =
      Send("GET", "/orders/" + UrlEncode(id), "", nullptr, true);
  if (!IsHttpSuccess(response)) {
    return OrderResultFromHttpFailure(response);
  }
  JsonValue root;
  std::string parse_error;
  if (!ParseJson(response.body, &root, &parse_error)) {
    return FailedOrderResult("INVALID_RESPONSE",
                             "Gate 订单响应解析失败: " + parse_error);
  }
  return ParseOrder(root);
}

}  // namespace trade_pilot
