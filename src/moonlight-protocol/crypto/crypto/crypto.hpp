#pragma once

#include <memory>
#include <openssl/aes.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <string>
#include <string_view>

namespace crypto {

/**
 * @return the SHA-256 digest of the input, as an hex encoded (lowercase) string
 */
std::string sha256(std::string_view str);

/**
 * @return an uppercase hex representation of the input bytes
 */
std::string str_to_hex(std::string_view input);

/**
 * @brief decodes an hex string back to raw bytes, non hex characters are skipped
 *
 * @param reverse: when true (the default) the result keeps the same byte order as the input
 */
std::string hex_to_str(std::string_view hex, bool reverse = true);

/**
 * @return `length` cryptographically secure random bytes
 */
std::string random(int length);

/**
 * @brief appends trailing zero bytes until the input is a multiple of AES_BLOCK_SIZE
 *
 * An empty input stays empty.
 */
std::string pad_to_block(std::string_view msg);

/**
 * @brief AES-128 ECB
 *
 * With `padding = false` the input must already be block aligned (see `pad_to_block`),
 * a misaligned input will throw.
 */
std::string aes_encrypt_ecb(std::string_view msg, std::string_view enc_key, std::string_view iv = {}, bool padding = false);

std::string aes_decrypt_ecb(std::string_view msg, std::string_view enc_key, std::string_view iv = {}, bool padding = false);

/**
 * @brief RSA SHA-256 (PKCS#1 v1.5) signature
 *
 * @param private_key: PEM encoded private key
 * @return the raw signature bytes
 */
std::string sign(std::string_view msg, std::string_view private_key);

/**
 * @param public_key: PEM encoded public key
 * @return true if `signature` is a valid signature of `msg`
 */
bool verify(std::string_view msg, std::string_view signature, std::string_view public_key);

} // namespace crypto

namespace x509 {

using x509_ptr = std::shared_ptr<X509>;
using pkey_ptr = std::shared_ptr<EVP_PKEY>;

constexpr int DEFAULT_KEY_BITS = 2048;
constexpr int DEFAULT_VALID_YEARS = 20;

/**
 * @brief Generates a new RSA private key of the given size
 */
pkey_ptr generate_key(int key_bits = DEFAULT_KEY_BITS);

/**
 * @brief Generates a self signed x509 certificate for the given key
 */
x509_ptr generate_x509(const pkey_ptr &pkey, int valid_years = DEFAULT_VALID_YEARS);

/**
 * @brief parses a PEM certificate, throws std::runtime_error if it's not a valid certificate
 */
x509_ptr cert_from_string(std::string_view cert);

/**
 * @brief parses a PEM private key, throws std::runtime_error if it's not a valid key
 */
pkey_ptr pkey_from_string(std::string_view pkey);

std::string get_cert_signature(const x509_ptr &cert);

std::string get_cert_pem(const x509_ptr &cert);

std::string get_pkey_content(const pkey_ptr &pkey);

std::string get_cert_public_key(const x509_ptr &cert);

} // namespace x509
