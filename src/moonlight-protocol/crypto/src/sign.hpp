#pragma once

#include <crypto/utils.hpp>
#include <memory>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <string_view>

namespace signature {
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)>;
using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;
using BIO_ptr = std::unique_ptr<BIO, decltype(&::BIO_free)>;

inline std::string sign(std::string_view msg, EVP_PKEY *key_data, const EVP_MD *digest_type) {
  EVP_MD_CTX_ptr ctx(EVP_MD_CTX_create(), ::EVP_MD_CTX_free);

  if (EVP_DigestSignInit(ctx.get(), nullptr, digest_type, nullptr, key_data) != 1)
    handle_openssl_error("EVP_DigestSignInit failed");

  if (EVP_DigestSignUpdate(ctx.get(), msg.data(), msg.size()) != 1)
    handle_openssl_error("EVP_DigestSignUpdate failed");

  std::size_t digest_size = 0;
  if (EVP_DigestSignFinal(ctx.get(), nullptr, &digest_size) != 1)
    handle_openssl_error("EVP_DigestSignFinal failed");

  std::string digest(digest_size, '\0');
  if (EVP_DigestSignFinal(ctx.get(), reinterpret_cast<unsigned char *>(digest.data()), &digest_size) != 1)
    handle_openssl_error("EVP_DigestSignFinal failed");

  digest.resize(digest_size);
  return digest;
}

inline bool verify(std::string_view msg, std::string_view signature, EVP_PKEY *key_data, const EVP_MD *digest_type) {
  EVP_MD_CTX_ptr ctx(EVP_MD_CTX_create(), ::EVP_MD_CTX_free);

  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest_type, nullptr, key_data) != 1)
    handle_openssl_error("EVP_DigestVerifyInit failed");

  if (EVP_DigestVerifyUpdate(ctx.get(), msg.data(), msg.size()) != 1)
    handle_openssl_error("EVP_DigestVerifyUpdate failed");

  return EVP_DigestVerifyFinal(ctx.get(), (const std::uint8_t *)signature.data(), signature.size()) == 1;
}

inline EVP_PKEY_ptr create_key(std::string_view k, bool is_private) {
  BIO_ptr bio(BIO_new_mem_buf(k.data(), (int)k.size()), ::BIO_free);
  if (!bio)
    handle_openssl_error("BIO_new_mem_buf failed");

  EVP_PKEY *p_key = nullptr;
  if (is_private)
    PEM_read_bio_PrivateKey(bio.get(), &p_key, nullptr, nullptr);
  else
    PEM_read_bio_PUBKEY(bio.get(), &p_key, nullptr, nullptr);
  if (p_key == nullptr)
    handle_openssl_error(is_private ? "PEM_read_bio_PrivateKey failed" : "PEM_read_bio_PUBKEY failed");

  return {p_key, ::EVP_PKEY_free};
}
} // namespace signature
