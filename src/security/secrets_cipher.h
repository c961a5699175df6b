#pragma once

#include <string>

namespace trade_pilot {

/**
 * @brief 凭证加解密（AES-256-GCM）
 *
 * 数据密钥由主密钥经 HKDF-SHA256 派生（info=`trade-pilot-secrets-v1`）。
 * 密文格式：`v1:<base64url(nonce12 || ciphertext || tag16)>`。
 * 明文只在调用期间驻留内存，不落盘。
 */
class SecretsCipher {
 public:
  SecretsCipher() = default;

  /**
   * @brief 初始化派生密钥
   *
   * @param master_key 主密钥，长度至少 32 字节
   * @return false 主密钥过短或派生失败
   */
  bool Initialize(const std::string& master_key, std::string* out_error);

  bool initialized() const { return initialized_; }

  /// 加密（供运维工具与测试使用）。
  bool Encrypt(const std::string& plaintext,
               std::string* out_blob,
               std::string* out_error) const;

  /// 解密；版本前缀、编码或认证标签不合法时返回 false。
  bool Decrypt(const std::string& blob,
               std::string* out_plaintext,
               std::string* out_error) const;

 private:
  std::string key_;  ///< 32 字节派生密钥。
  bool initialized_{false};
};

}  // namespace trade_pilot
