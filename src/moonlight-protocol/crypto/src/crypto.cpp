#include "aes.hpp"
#include "sign.hpp"
#include <algorithm>
#include <cctype>
#include <crypto/crypto.hpp>
#include <iomanip>
#include <iterator>
#include <openssl/rand.h>
#include <sstream>

namespace crypto {

std::string sha256(std::string_view str) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_Digest(str.data(), str.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1)
    handle_openssl_error("EVP_Digest failed");

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
  }
  return ss.str();
}

std::string str_to_hex(std::string_view input) {
  static const char hex_digits[] = "0123456789ABCDEF";

  std::string output;
  output.reserve(input.length() * 2);
  for (unsigned char c : input) {
    output.push_back(hex_digits[c >> 4]);
    output.push_back(hex_digits[c & 15]);
  }
  return output;
}

std::string hex_to_str(std::string_view hex, bool reverse) {
  auto is_hex = [](char ch) -> bool { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; };
  auto convert = [](char ch) -> std::uint8_t {
    if (ch >= '0' && ch <= '9') {
      return (std::uint8_t)ch - '0';
    }
    return (std::uint8_t)(ch | (char)32) - 'a' + (char)10;
  };

  std::string digits;
  digits.reserve(hex.size());
  std::copy_if(hex.begin(), hex.end(), std::back_inserter(digits), is_hex);

  /* an odd trailing digit can't make a full byte, drop it */
  std::string buf(digits.size() / 2, '\0');
  for (std::size_t i = 0; i < buf.size(); i++) {
    buf[i] = (char)((convert(digits[2 * i]) << 4) | convert(digits[2 * i + 1]));
  }

  if (!reverse) {
    std::reverse(std::begin(buf), std::end(buf));
  }

  return buf;
}

std::string random(int length) {
  std::string rnd;
  rnd.resize(length);
  if (length > 0 && RAND_bytes((uint8_t *)rnd.data(), length) != 1)
    handle_openssl_error("RAND_bytes failed");
  return rnd;
}

std::string pad_to_block(std::string_view msg) {
  std::string padded(msg);
  auto remainder = padded.size() % AES_BLOCK_SIZE;
  if (remainder != 0) {
    padded.append(AES_BLOCK_SIZE - remainder, '\0');
  }
  return padded;
}

std::string aes_encrypt_ecb(std::string_view msg, std::string_view enc_key, std::string_view iv, bool padding) {
  auto ctx = aes::init(EVP_aes_128_ecb(), enc_key, iv, true, padding);
  return aes::encrypt_symmetric(ctx.get(), msg);
}

std::string aes_decrypt_ecb(std::string_view msg, std::string_view enc_key, std::string_view iv, bool padding) {
  auto ctx = aes::init(EVP_aes_128_ecb(), enc_key, iv, false, padding);
  return aes::decrypt_symmetric(ctx.get(), msg);
}

std::string sign(std::string_view msg, std::string_view private_key) {
  auto p_key = signature::create_key(private_key, true);
  return signature::sign(msg, p_key.get(), EVP_sha256());
}

bool verify(std::string_view msg, std::string_view signature, std::string_view public_key) {
  auto p_key = signature::create_key(public_key, false);
  return signature::verify(msg, signature, p_key.get(), EVP_sha256());
}

} // namespace crypto
