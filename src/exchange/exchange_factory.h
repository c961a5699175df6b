#pragma once

#include <functional>
#include <memory>
#include <string>

#include "exchange/exchange_adapter.h"
#include "exchange/exchange_support.h"
#include "net/http_transport.h"
#include "storage/records.h"

namespace trade_pilot {

/// 是否为已知交易所标识（binance / gate / bybit，大小写不敏感）。
bool IsSupportedExchange(const std::string& exchange_id);

/**
 * @brief 按交易所标识创建适配器
 *
 * transport 为空时使用 libcurl 实现。未知交易所属于启动期配置错误：
 * 返回 nullptr 并写 out_error，由调用方决定是否终止进程。
 */
std::unique_ptr<ExchangeAdapter> CreateExchangeAdapter(
    const std::string& exchange_id,
    ExchangeCredentials credentials,
    ExchangeAdapterOptions options,
    std::unique_ptr<HttpTransport> transport,
    std::string* out_error);

/// 按账户与解密后的凭证创建交易所适配器；失败返回 nullptr 并写 out_error。
using ExchangeAdapterFactory = std::function<std::unique_ptr<ExchangeAdapter>(
    const ExchangeAccountRecord& account,
    const ExchangeCredentials& credentials,
    std::string* out_error)>;

/**
 * @brief 以账户配置为准的默认工厂
 *
 * 按 `account.exchange` 与 `account.is_testnet` 选择实现，
 * 每次调用新建 libcurl transport；symbol_cache 跨调用共享。
 */
ExchangeAdapterFactory MakeExchangeAdapterFactory(ExchangeAdapterOptions base_options);

}  // namespace trade_pilot
