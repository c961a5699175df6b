#pragma once

#include <cstddef>
#include <string>

namespace trade_pilot {

/**
 * @brief 按字节上限截断文本，不切断 UTF-8 多字节字符
 *
 * 用于对外暴露的错误信息与模型错误正文。
 */
std::string TruncateUtf8(const std::string& text, std::size_t max_bytes);

/// UTF-8 字符（码点）个数。
std::size_t Utf8Length(const std::string& text);

/// 按字符数截断（对外展示的字段按字符计数）。
std::string TruncateCodePoints(const std::string& text, std::size_t max_chars);

/// ASCII 小写副本。
std::string ToLowerAscii(const std::string& text);

/// 去掉首尾空白。
std::string TrimAscii(const std::string& text);

}  // namespace trade_pilot
