#pragma once

#include <optional>
#include <string>

#include <boost/multiprecision/cpp_dec_float.hpp>

#include "core/json_utils.h"

namespace trade_pilot {

/**
 * @brief 十进制定点/任意精度数
 *
 * 价格、数量、名义金额、余额一律使用该类型，禁止经过 double。
 * 注意：Boost.Multiprecision 默认启用表达式模板，中间结果不要用 `auto` 承接。
 */
using Decimal = boost::multiprecision::cpp_dec_float_50;

/// 解析十进制文本（如 "0.00123"、"-5"、"1e-3"）；非法输入返回 false。
bool ParseDecimal(const std::string& text, Decimal* out_value);

/// 10 的 `exponent` 次方（支持负指数）。
Decimal Pow10(int exponent);

/**
 * @brief 数量取整：向零截断到 `precision` 位小数
 *
 * 保证 `|RoundQuantity(x, p)| <= |x|`，永不放大仓位。
 * 例：RoundQuantity(0.12345, 3) == 0.123。
 */
Decimal RoundQuantity(const Decimal& value, int precision);

/// 价格取整：四舍五入（half away from zero）到 `precision` 位小数。
Decimal RoundPrice(const Decimal& value, int precision);

/// 固定小数位格式化（不做额外舍入以外的处理），如 FormatDecimal(1.5, 2) == "1.50"。
std::string FormatDecimal(const Decimal& value, int places);

/// 规范化文本：去掉多余尾零与小数点，如 "0.12300" -> "0.123"，"-0" -> "0"。
std::string DecimalToString(const Decimal& value);

/// 可选值格式化；空值返回空串。
std::string OptionalDecimalToString(const std::optional<Decimal>& value);

/// JSON 节点转十进制：优先使用数字原文，也接受字符串形式的数字。
std::optional<Decimal> JsonAsDecimal(const JsonValue* value);

/// 十进制转 JSON 数字节点（保留规范化原文）。
JsonValue MakeJsonDecimal(const Decimal& value);

/// 可选十进制转 JSON（空值为 null）。
JsonValue MakeJsonOptionalDecimal(const std::optional<Decimal>& value);

}  // namespace trade_pilot
