#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trade_pilot {

/// 轻量 JSON AST 节点类型。
enum class JsonType {
  kNull,
  kBool,
  kNumber,
  kString,
  kArray,
  kObject,
};

/**
 * @brief 轻量 JSON 值表示（对象/数组为递归结构）
 *
 * 数字同时保留原始文本 `number_text`，价格/数量等字段据此无损转成十进制，
 * 不经过 double。对象使用有序 map，序列化结果稳定（WAL 与 prompt 依赖这一点）。
 */
struct JsonValue {
  JsonType type{JsonType::kNull};
  bool bool_value{false};
  double number_value{0.0};
  std::string number_text;  ///< 数字原文；为空时按 number_value 输出。
  std::string string_value;
  std::vector<JsonValue> array_value;
  std::map<std::string, JsonValue> object_value;
};

/**
 * @brief JSON 解析入口
 *
 * @param text 原始 JSON 文本
 * @param out_value 解析结果
 * @param out_error 失败原因（可选输出）
 * @return true 解析成功
 * @return false 解析失败
 */
bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error);

/**
 * @brief 序列化 JSON
 *
 * @param indent 0 表示紧凑单行输出；大于 0 时按该空格数缩进。
 */
std::string SerializeJson(const JsonValue& value, int indent = 0);

/// 对字符串做 JSON 转义（不含两侧引号）。
std::string EscapeJsonString(const std::string& text);

/// 构造函数族：便于拼装请求体与审计快照。
JsonValue MakeJsonNull();
JsonValue MakeJsonBool(bool value);
JsonValue MakeJsonNumber(double value);
JsonValue MakeJsonInt(std::int64_t value);
/// 以原始数字文本构造（调用方保证文本是合法 JSON 数字）。
JsonValue MakeJsonNumberText(const std::string& text);
JsonValue MakeJsonString(const std::string& value);
JsonValue MakeJsonArray();
JsonValue MakeJsonObject();

/// 对象写字段；`object` 非对象时先转成空对象。
void JsonSet(JsonValue* object, const std::string& key, JsonValue value);
/// 数组追加元素；`array` 非数组时先转成空数组。
void JsonPush(JsonValue* array, JsonValue value);

/**
 * @brief 获取对象字段
 *
 * 仅做类型与边界检查，不抛异常；字段不存在返回 `nullptr`。
 */
const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key);

/**
 * @brief 获取数组元素
 *
 * 仅做类型与边界检查，不抛异常；越界返回 `nullptr`。
 */
const JsonValue* JsonArrayAt(const JsonValue* value, std::size_t index);

/**
 * @brief 按对象路径查找子节点
 *
 * `object_path` 中每一段都按对象字段访问；任意一段缺失返回 `nullptr`。
 */
const JsonValue* JsonFindPath(const JsonValue* value,
                              const std::vector<std::string>& object_path);

/// 尝试将节点解释为字符串（数字返回原文）；失败返回 `std::nullopt`。
std::optional<std::string> JsonAsString(const JsonValue* value);
/// 尝试将节点解释为数值；失败返回 `std::nullopt`。
std::optional<double> JsonAsNumber(const JsonValue* value);
/// 尝试将节点解释为整数（仅接受整数值）；失败返回 `std::nullopt`。
std::optional<std::int64_t> JsonAsInt64(const JsonValue* value);
/// 尝试将节点解释为布尔值；失败返回 `std::nullopt`。
std::optional<bool> JsonAsBool(const JsonValue* value);

/// 节点是否为 null 或缺失。
inline bool JsonIsNull(const JsonValue* value) {
  return value == nullptr || value->type == JsonType::kNull;
}

}  // namespace trade_pilot
