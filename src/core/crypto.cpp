#include "core/crypto.h"

#include <limits>
#include <utility>
#include <vector>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace trade_pilot {

namespace {

bool DigestHex(const EVP_MD* md,
               const std::string& payload,
               std::string* out_hex,
               std::string* out_error) {
  if (out_hex == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_hex 为空";
    }
    return false;
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(payload.data(), payload.size(), digest, &digest_len, md,
                 nullptr) != 1) {
    if (out_error != nullptr) {
      *out_error = "OpenSSL 摘要计算失败";
    }
    return false;
  }
  *out_hex = BytesToHex(digest, digest_len);
  return true;
}

bool HmacHex(const EVP_MD* md,
             const char* name,
             const std::string& secret,
             const std::string& payload,
             std::string* out_signature,
             std::string* out_error) {
  if (out_signature == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_signature 为空";
    }
    return false;
  }
  if (secret.size() >
      static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    if (out_error != nullptr) {
      *out_error = "secret 长度超出 OpenSSL HMAC 限制";
    }
    return false;
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  unsigned char* result = HMAC(md,
                               secret.data(),
                               static_cast<int>(secret.size()),
                               reinterpret_cast<const unsigned char*>(payload.data()),
                               payload.size(),
                               digest,
                               &digest_len);
  if (result == nullptr || digest_len == 0U) {
    if (out_error != nullptr) {
      *out_error = std::string("OpenSSL ") + name + " 计算失败";
    }
    return false;
  }
  *out_signature = BytesToHex(digest, digest_len);
  return true;
}

}  // namespace

std::string BytesToHex(const unsigned char* bytes, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.resize(size * 2U);
  for (std::size_t i = 0; i < size; ++i) {
    const unsigned char v = bytes[i];
    out[i * 2U] = kHex[(v >> 4U) & 0x0FU];
    out[i * 2U + 1U] = kHex[v & 0x0FU];
  }
  return out;
}

bool Sha256Hex(const std::string& payload,
               std::string* out_hex,
               std::string* out_error) {
  return DigestHex(EVP_sha256(), payload, out_hex, out_error);
}

bool Sha512Hex(const std::string& payload,
               std::string* out_hex,
               std::string* out_error) {
  return DigestHex(EVP_sha512(), payload, out_hex, out_error);
}

bool HmacSha256Hex(const std::string& secret,
                   const std::string& payload,
                   std::string* out_signature,
                   std::string* out_error) {
  return HmacHex(EVP_sha256(), "HMAC-SHA256", secret, payload, out_signature,
                 out_error);
}

bool HmacSha512Hex(const std::string& secret,
                   const std::string& payload,
                   std::string* out_signature,
                   std::string* out_error) {
  return HmacHex(EVP_sha512(), "HMAC-SHA512", secret, payload, out_signature,
                 out_error);
}

bool RandomBytes(std::size_t size, std::string* out_bytes, std::string* out_error) {
  if (out_bytes == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_bytes 为空";
    }
    return false;
  }
  std::vector<unsigned char> buffer(size);
  if (size > 0 &&
      RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    if (out_error != nullptr) {
      *out_error = "RAND_bytes 失败";
    }
    return false;
  }
  out_bytes->assign(reinterpret_cast<const char*>(buffer.data()), buffer.size());
  return true;
}

std::string RandomHexToken() {
  std::string bytes;
  if (!RandomBytes(16, &bytes, nullptr)) {
    return {};
  }
  return BytesToHex(reinterpret_cast<const unsigned char*>(bytes.data()),
                    bytes.size());
}

std::string GenerateUuid() {
  std::string bytes;
  if (!RandomBytes(16, &bytes, nullptr)) {
    return {};
  }
  bytes[6] = static_cast<char>((static_cast<unsigned char>(bytes[6]) & 0x0FU) | 0x40U);
  bytes[8] = static_cast<char>((static_cast<unsigned char>(bytes[8]) & 0x3FU) | 0x80U);
  const std::string hex = BytesToHex(
      reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
         "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string Base64UrlEncode(const std::string& bytes) {
  std::string out;
  out.resize(4 * ((bytes.size() + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(
      reinterpret_cast<unsigned char*>(out.data()),
      reinterpret_cast<const unsigned char*>(bytes.data()),
      static_cast<int>(bytes.size()));
  out.resize(written > 0 ? static_cast<std::size_t>(written) : 0U);
  for (char& ch : out) {
    if (ch == '+') {
      ch = '-';
    } else if (ch == '/') {
      ch = '_';
    }
  }
  return out;
}

bool Base64UrlDecode(const std::string& text, std::string* out_bytes) {
  if (out_bytes == nullptr) {
    return false;
  }
  std::string standard = text;
  for (char& ch : standard) {
    if (ch == '-') {
      ch = '+';
    } else if (ch == '_') {
      ch = '/';
    } else if (ch == '+' || ch == '/') {
      return false;
    }
  }
  while (standard.size() % 4 != 0) {
    standard.push_back('=');
  }
  std::size_t padding = 0;
  for (auto it = standard.rbegin(); it != standard.rend() && *it == '='; ++it) {
    ++padding;
  }
  if (padding > 2) {
    return false;
  }

  std::string decoded;
  decoded.resize(standard.size() / 4 * 3);
  const int written = EVP_DecodeBlock(
      reinterpret_cast<unsigned char*>(decoded.data()),
      reinterpret_cast<const unsigned char*>(standard.data()),
      static_cast<int>(standard.size()));
  if (written < 0 || static_cast<std::size_t>(written) < padding) {
    return false;
  }
  // EVP_DecodeBlock 会把填充位也算作输出字节。
  decoded.resize(static_cast<std::size_t>(written) - padding);
  *out_bytes = std::move(decoded);
  return true;
}

}  // namespace trade_pilot
