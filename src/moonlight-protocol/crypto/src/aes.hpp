#pragma once

#include <crypto/utils.hpp>
#include <cstdint>
#include <memory>
#include <openssl/aes.h>
#include <openssl/evp.h>
#include <string_view>

namespace aes {
using CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&::EVP_CIPHER_CTX_free)>;

inline CIPHER_CTX_ptr init(const EVP_CIPHER *cipher,
                           std::string_view key_data,
                           std::string_view iv,
                           bool is_encryption,
                           bool padding) {
  CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new(), ::EVP_CIPHER_CTX_free);
  auto iv_data = iv.empty() ? nullptr : (const std::uint8_t *)iv.data();

  if (is_encryption) {
    if (EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, (const std::uint8_t *)key_data.data(), iv_data) != 1)
      handle_openssl_error("EVP_EncryptInit_ex failed");
  } else {
    if (EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, (const std::uint8_t *)key_data.data(), iv_data) != 1)
      handle_openssl_error("EVP_DecryptInit_ex failed");
  }

  if (EVP_CIPHER_CTX_set_padding(ctx.get(), padding) != 1)
    handle_openssl_error("EVP_CIPHER_CTX_set_padding failed");

  return ctx;
}

inline std::string encrypt_symmetric(EVP_CIPHER_CTX *ctx, std::string_view plaintext) {
  /* max ciphertext len for a n bytes of plaintext is n + AES_BLOCK_SIZE -1 bytes */
  auto len = (int)plaintext.size();
  int c_len = 0;
  int f_len = 0;
  std::string ciphertext(len + AES_BLOCK_SIZE, '\0');
  auto out = reinterpret_cast<unsigned char *>(ciphertext.data());

  if (EVP_EncryptUpdate(ctx, out, &c_len, (const std::uint8_t *)plaintext.data(), len) != 1)
    handle_openssl_error("EVP_EncryptUpdate failed");

  if (EVP_EncryptFinal_ex(ctx, out + c_len, &f_len) != 1)
    handle_openssl_error("EVP_EncryptFinal_ex failed");

  ciphertext.resize(c_len + f_len);
  return ciphertext;
}

inline std::string decrypt_symmetric(EVP_CIPHER_CTX *ctx, std::string_view ciphertext) {
  auto cipher_length = (int)ciphertext.length();
  int len = 0;
  int f_len = 0;
  /* plaintext will always be lesser than length of ciphertext + one block */
  std::string plaintext(cipher_length + AES_BLOCK_SIZE, '\0');
  auto out = reinterpret_cast<unsigned char *>(plaintext.data());

  if (EVP_DecryptUpdate(ctx, out, &len, (const std::uint8_t *)ciphertext.data(), cipher_length) != 1)
    handle_openssl_error("EVP_DecryptUpdate failed");

  if (EVP_DecryptFinal_ex(ctx, out + len, &f_len) != 1)
    handle_openssl_error("EVP_DecryptFinal_ex failed");

  plaintext.resize(len + f_len);
  return plaintext;
}

} // namespace aes
