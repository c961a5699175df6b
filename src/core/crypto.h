#pragma once

#include <cstddef>
#include <string>

namespace trade_pilot {

/// 字节串转小写十六进制。
std::string BytesToHex(const unsigned char* bytes, std::size_t size);

/// SHA-256 摘要（小写十六进制）。
bool Sha256Hex(const std::string& payload,
               std::string* out_hex,
               std::string* out_error);

/// SHA-512 摘要（小写十六进制）。
bool Sha512Hex(const std::string& payload,
               std::string* out_hex,
               std::string* out_error);

/// HMAC-SHA256 签名（小写十六进制）。
bool HmacSha256Hex(const std::string& secret,
                   const std::string& payload,
                   std::string* out_signature,
                   std::string* out_error);

/// HMAC-SHA512 签名（小写十六进制）。
bool HmacSha512Hex(const std::string& secret,
                   const std::string& payload,
                   std::string* out_signature,
                   std::string* out_error);

/// 密码学安全随机字节（OpenSSL RAND_bytes）。
bool RandomBytes(std::size_t size, std::string* out_bytes, std::string* out_error);

/// 128 bit 随机十六进制串；随机源失败时返回空串。
std::string RandomHexToken();

/// 随机 UUIDv4 文本（记录主键使用）；随机源失败时返回空串。
std::string GenerateUuid();

/// URL-safe Base64 编码（带 `=` 填充）。
std::string Base64UrlEncode(const std::string& bytes);

/// URL-safe Base64 解码，容忍缺失填充；非法输入返回 false。
bool Base64UrlDecode(const std::string& text, std::string* out_bytes);

}  // namespace trade_pilot
