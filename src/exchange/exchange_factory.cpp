#include "exchange/exchange_factory.h"

#include <utility>

#include "core/text.h"
#include "exchange/binance_futures_adapter.h"
#include "exchange/bybit_linear_adapter.h"
#include "exchange/gate_futures_adapter.h"

namespace trade_pilot {

bool IsSupportedExchange(const std::string& exchange_id) {
  const std::string id = ToLowerAscii(exchange_id);
  return id == "binance" || id == "gate" || id == "bybit";
}

std::unique_ptr<ExchangeAdapter> CreateExchangeAdapter(
    const std::string& exchange_id,
    ExchangeCredentials credentials,
    ExchangeAdapterOptions options,
    std::unique_ptr<HttpTransport> transport,
    std::string* out_error) {
  const std::string id = ToLowerAscii(exchange_id);
  if (id == "binance") {
    return std::make_unique<BinanceFuturesAdapter>(
        std::move(credentials), std::move(options), std::move(transport));
  }
  if (id == "gate") {
    return std::make_unique<GateFuturesAdapter>(
        std::move(credentials), std::move(options), std::move(transport));
  }
  if (id == "bybit") {
    return std::make_unique<BybitLinearAdapter>(
        std::move(credentials), std::move(options), std::move(transport));
  }
  if (out_error != nullptr) {
    *out_error = "Unsupported exchange: " + exchange_id;
  }
  return nullptr;
}

ExchangeAdapterFactory MakeExchangeAdapterFactory(
    ExchangeAdapterOptions base_options) {
  return [base_options](const ExchangeAccountRecord& account,
                        const ExchangeCredentials& credentials,
                        std::string* out_error) {
    ExchangeAdapterOptions options = base_options;
    options.testnet = account.is_testnet;
    return CreateExchangeAdapter(account.exchange, credentials,
                                 std::move(options), nullptr, out_error);
  };
}

}  // namespace trade_pilot
