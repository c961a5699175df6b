#include "security/secrets_cipher.h"

#include <memory>
#include <vector>

#include <openssl/evp.h>
#include <openssl/kdf.h>

#include "core/crypto.h"

namespace trade_pilot {

namespace {

constexpr std::size_t kMinMasterKeyBytes = 32;
constexpr std::size_t kKeyBytes = 32;
constexpr std::size_t kNonceBytes = 12;
constexpr std::size_t kTagBytes = 16;
constexpr char kBlobPrefix[] = "v1:";
constexpr char kHkdfInfo[] = "trade-pilot-secrets-v1";

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

const unsigned char* Bytes(const std::string& text) {
  return reinterpret_cast<const unsigned char*>(text.data());
}

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

bool DeriveKey(const std::string& master_key,
               std::string* out_key,
               std::string* out_error) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  if (!ctx) {
    return Fail("HKDF 上下文创建失败", out_error);
  }
  std::vector<unsigned char> key(kKeyBytes);
  std::size_t key_len = key.size();
  if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
      EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), Bytes(master_key),
                                 static_cast<int>(master_key.size())) <= 0 ||
      EVP_PKEY_CTX_add1_hkdf_info(
          ctx.get(), reinterpret_cast<const unsigned char*>(kHkdfInfo),
          static_cast<int>(sizeof(kHkdfInfo) - 1)) <= 0 ||
      EVP_PKEY_derive(ctx.get(), key.data(), &key_len) <= 0 ||
      key_len != kKeyBytes) {
    return Fail("HKDF 密钥派生失败", out_error);
  }
  out_key->assign(reinterpret_cast<const char*>(key.data()), key_len);
  return true;
}

}  // namespace

bool SecretsCipher::Initialize(const std::string& master_key,
                               std::string* out_error) {
  initialized_ = false;
  if (master_key.size() < kMinMasterKeyBytes) {
    return Fail("主密钥长度不足 32 字节", out_error);
  }
  if (!DeriveKey(master_key, &key_, out_error)) {
    return false;
  }
  initialized_ = true;
  return true;
}

bool SecretsCipher::Encrypt(const std::string& plaintext,
                            std::string* out_blob,
                            std::string* out_error) const {
  if (!initialized_) {
    return Fail("SecretsCipher 未初始化", out_error);
  }
  if (out_blob == nullptr) {
    return Fail("out_blob 为空", out_error);
  }
  std::string nonce;
  if (!RandomBytes(kNonceBytes, &nonce, out_error)) {
    return false;
  }

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return Fail("加密上下文创建失败", out_error);
  }
  std::vector<unsigned char> ciphertext(plaintext.size() + kTagBytes);
  int out_len = 0;
  int final_len = 0;
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kNonceBytes), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, Bytes(key_),
                         Bytes(nonce)) != 1 ||
      EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &out_len,
                        Bytes(plaintext),
                        static_cast<int>(plaintext.size())) != 1 ||
      EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + out_len,
                          &final_len) != 1) {
    return Fail("AES-GCM 加密失败", out_error);
  }
  const std::size_t body_len = static_cast<std::size_t>(out_len + final_len);
  unsigned char tag[kTagBytes];
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(kTagBytes), tag) != 1) {
    return Fail("AES-GCM 获取认证标签失败", out_error);
  }

  std::string packed = nonce;
  packed.append(reinterpret_cast<const char*>(ciphertext.data()), body_len);
  packed.append(reinterpret_cast<const char*>(tag), kTagBytes);
  *out_blob = std::string(kBlobPrefix) + Base64UrlEncode(packed);
  return true;
}

bool SecretsCipher::Decrypt(const std::string& blob,
                            std::string* out_plaintext,
                            std::string* out_error) const {
  if (!initialized_) {
    return Fail("SecretsCipher 未初始化", out_error);
  }
  if (out_plaintext == nullptr) {
    return Fail("out_plaintext 为空", out_error);
  }
  const std::string prefix(kBlobPrefix);
  if (blob.compare(0, prefix.size(), prefix) != 0) {
    return Fail("密文版本前缀不支持", out_error);
  }
  std::string packed;
  if (!Base64UrlDecode(blob.substr(prefix.size()), &packed)) {
    return Fail("密文编码非法", out_error);
  }
  if (packed.size() < kNonceBytes + kTagBytes) {
    return Fail("密文长度非法", out_error);
  }
  const std::string nonce = packed.substr(0, kNonceBytes);
  const std::string tag = packed.substr(packed.size() - kTagBytes);
  const std::string body =
      packed.substr(kNonceBytes, packed.size() - kNonceBytes - kTagBytes);

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return Fail("解密上下文创建失败", out_error);
  }
  std::vector<unsigned char> plaintext(body.size() + 1);
  int out_len = 0;
  int final_len = 0;
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kNonceBytes), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, Bytes(key_),
                         Bytes(nonce)) != 1 ||
      EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, Bytes(body),
                        static_cast<int>(body.size())) != 1) {
    return Fail("AES-GCM 解密失败", out_error);
  }
  std::string tag_copy = tag;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(kTagBytes), tag_copy.data()) != 1 ||
      EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + out_len,
                          &final_len) != 1) {
    return Fail("密文认证失败", out_error);
  }
  out_plaintext->assign(reinterpret_cast<const char*>(plaintext.data()),
                        static_cast<std::size_t>(out_len + final_len));
  return true;
}

}  // namespace trade_pilot
