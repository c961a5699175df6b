#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/decimal.h"
#include "core/types.h"

namespace trade_pilot {

/**
 * @brief 交易所适配层统一接口
 *
 * 每个交易所一个实现，由工厂按账户配置选择；业务层只依赖这组语义，
 * 不允许在适配器之外按交易所名称分支。
 *
 * 约定：
 * - 查询类接口返回 bool，失败原因写入 out_error；
 * - 下单/撤单/查单统一返回 OrderResult，HTTP 与业务错误都折叠为
 *   `success=false`，不抛异常；
 * - 跨越边界的数量一律向零截断到 symbol 数量精度，价格四舍五入到价格精度；
 * - 适配器持有自己的 HTTP 连接，实例析构即释放（每轮周期用完即销毁）。
 */
class ExchangeAdapter {
 public:
  virtual ~ExchangeAdapter() = default;

  /// @brief 适配器名称（binance/gate/bybit，用于日志）。
  virtual std::string Name() const = 0;

  /**
   * @brief 获取 symbol 精度与下单限制
   *
   * 结果按进程缓存；交易所不存在该 symbol 时返回 false，
   * out_error 以 `NotFound:` 开头。
   */
  virtual bool GetSymbolInfo(const std::string& symbol,
                             SymbolInfo* out_info,
                             std::string* out_error) = 0;

  /// @brief 可用余额；账户中没有该资产时返回 0。
  virtual bool GetBalance(const std::string& asset,
                          Decimal* out_balance,
                          std::string* out_error) = 0;

  /// @brief 全部非零持仓。
  virtual bool GetPositions(std::vector<PositionInfo>* out_positions,
                            std::string* out_error) = 0;

  /// @brief 单个 symbol 的持仓；无持仓时 `*out_position` 为空。
  virtual bool GetPosition(const std::string& symbol,
                           std::optional<PositionInfo>* out_position,
                           std::string* out_error) = 0;

  /// @brief 当前挂单；symbol 为空表示全部。
  virtual bool GetOpenOrders(const std::string& symbol,
                             std::vector<OrderResult>* out_orders,
                             std::string* out_error) = 0;

  /// @brief 最新成交价。
  virtual bool GetTicker(const std::string& symbol,
                         Decimal* out_price,
                         std::string* out_error) = 0;

  /// @brief 设置杠杆（尽力而为）；业务拒绝返回 false，不抛异常。
  virtual bool SetLeverage(const std::string& symbol, int leverage) = 0;

  /// @brief 市价单。client_order_id 为调用方提供的幂等键。
  virtual OrderResult PlaceMarketOrder(const std::string& symbol,
                                       OrderSide side,
                                       const Decimal& quantity,
                                       const std::string& client_order_id) = 0;

  /// @brief 止盈条件单（触发后市价）。
  virtual OrderResult PlaceTakeProfit(const std::string& symbol,
                                      OrderSide side,
                                      const Decimal& quantity,
                                      const Decimal& stop_price,
                                      const std::string& client_order_id) = 0;

  /// @brief 止损条件单（触发后市价）。
  virtual OrderResult PlaceStopLoss(const std::string& symbol,
                                    OrderSide side,
                                    const Decimal& quantity,
                                    const Decimal& stop_price,
                                    const std::string& client_order_id) = 0;

  /// @brief 撤单；按订单号或幂等键定位（优先订单号）。
  virtual OrderResult CancelOrder(const OrderRef& ref) = 0;

  /// @brief 查单；按订单号或幂等键定位（优先订单号）。
  virtual OrderResult GetOrder(const OrderRef& ref) = 0;
};

}  // namespace trade_pilot
