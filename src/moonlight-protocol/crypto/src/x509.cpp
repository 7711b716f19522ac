#include <crypto/crypto.hpp>
#include <crypto/utils.hpp>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <stdexcept>

namespace x509 {

using BIO_ptr = std::unique_ptr<BIO, decltype(&::BIO_free)>;
using PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;

pkey_ptr generate_key(int key_bits) {
  PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), ::EVP_PKEY_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Unable to create EVP_PKEY_CTX structure.");
  }
  if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
    throw std::runtime_error("Unable to initialise RSA key generation.");
  }
  if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), key_bits) <= 0) {
    throw std::runtime_error("Unable to set RSA key size to " + std::to_string(key_bits) + " bits.");
  }

  EVP_PKEY *pkey = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &pkey) <= 0) {
    throw std::runtime_error("Unable to generate " + std::to_string(key_bits) + "-bit RSA key.");
  }

  return pkey_ptr(pkey, EVP_PKEY_free);
}

x509_ptr generate_x509(const pkey_ptr &pkey, int valid_years) {
  auto x509 = x509_ptr(X509_new(), X509_free);
  if (!x509) {
    throw std::runtime_error("Unable to create X509 structure.");
  }

  ASN1_INTEGER_set(X509_get_serialNumber(x509.get()), 1);
  X509_set_version(x509.get(), 2);

  long valid_secs = 60L * 60 * 24 * 365 * valid_years;
  X509_gmtime_adj(X509_get_notBefore(x509.get()), 0);
  X509_gmtime_adj(X509_get_notAfter(x509.get()), valid_secs);

  X509_set_pubkey(x509.get(), pkey.get());

  /* Self signed: subject and issuer are the same */
  X509_NAME *name = X509_get_subject_name(x509.get());
  X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, (unsigned char *)"NVIDIA GameStream Client", -1, -1, 0);
  X509_set_issuer_name(x509.get(), name);

  if (!X509_sign(x509.get(), pkey.get(), EVP_sha256())) {
    handle_openssl_error("Error signing certificate.");
  }

  return x509;
}

x509_ptr cert_from_string(std::string_view cert) {
  BIO_ptr bio(BIO_new_mem_buf(cert.data(), (int)cert.size()), ::BIO_free);
  X509 *certificate = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
  if (!certificate) {
    throw std::runtime_error("Unable to parse PEM certificate");
  }
  return x509_ptr(certificate, X509_free);
}

pkey_ptr pkey_from_string(std::string_view pkey) {
  BIO_ptr bio(BIO_new_mem_buf(pkey.data(), (int)pkey.size()), ::BIO_free);
  EVP_PKEY *key = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (!key) {
    throw std::runtime_error("Unable to parse PEM private key");
  }
  return pkey_ptr(key, EVP_PKEY_free);
}

std::string get_cert_signature(const x509_ptr &cert) {
  const ASN1_BIT_STRING *asn1 = nullptr;
  X509_get0_signature(&asn1, nullptr, cert.get());

  return {(const char *)asn1->data, (std::size_t)asn1->length};
}

static std::string bio_to_string(BIO *bio) {
  BUF_MEM *bio_buf = nullptr;
  BIO_get_mem_ptr(bio, &bio_buf);
  return {bio_buf->data, bio_buf->length};
}

std::string get_cert_pem(const x509_ptr &cert) {
  BIO_ptr bio(BIO_new(BIO_s_mem()), ::BIO_free);
  if (!PEM_write_bio_X509(bio.get(), cert.get())) {
    handle_openssl_error("PEM_write_bio_X509 failed");
  }
  return bio_to_string(bio.get());
}

std::string get_pkey_content(const pkey_ptr &pkey) {
  BIO_ptr bio(BIO_new(BIO_s_mem()), ::BIO_free);
  if (!PEM_write_bio_PrivateKey(bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr)) {
    handle_openssl_error("PEM_write_bio_PrivateKey failed");
  }
  return bio_to_string(bio.get());
}

std::string get_cert_public_key(const x509_ptr &cert) {
  auto pkey = pkey_ptr(X509_get_pubkey(cert.get()), EVP_PKEY_free);
  if (!pkey) {
    handle_openssl_error("X509_get_pubkey failed");
  }

  BIO_ptr bio(BIO_new(BIO_s_mem()), ::BIO_free);
  if (!PEM_write_bio_PUBKEY(bio.get(), pkey.get())) {
    handle_openssl_error("PEM_write_bio_PUBKEY failed");
  }
  return bio_to_string(bio.get());
}

} // namespace x509
