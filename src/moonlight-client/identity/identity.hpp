#pragma once

#include <crypto/crypto.hpp>
#include <filesystem>
#include <immer/box.hpp>
#include <optional>
#include <string>

namespace lynx::identity {

constexpr auto CLIENT_CERT_FILE = "client.crt";
constexpr auto CLIENT_KEY_FILE = "client.key";
constexpr auto SERVER_CERT_FILE = "server.crt";

/**
 * The long lived identity that we present to hosts, it never changes once created
 */
struct ClientIdentity {
  std::string unique_id;
  std::string cert_pem;
  std::string key_pem;
  std::string cert_file;
  std::string key_file;
  x509::x509_ptr cert;
};

/**
 * Owns the client certificate, private key and the host certificate on disk.
 *
 * Everything is stored PEM encoded in a single folder, files are only readable by the current user.
 */
class IdentityStore {
public:
  /**
   * @param folder: where certificates will be stored, it'll be created on first use
   * @param unique_id: overrides the id derived from the client certificate
   */
  explicit IdentityStore(std::filesystem::path folder, std::optional<std::string> unique_id = {});

  /**
   * @throws lynx::NotFoundError if there's no identity saved yet
   * @throws lynx::Error if the saved files can't be read or parsed
   */
  immer::box<ClientIdentity> load() const;

  /**
   * @brief creates a new self signed certificate and saves it, overriding any existing one
   */
  immer::box<ClientIdentity> generate(int valid_years = x509::DEFAULT_VALID_YEARS,
                                      int key_bits = x509::DEFAULT_KEY_BITS) const;

  /**
   * @brief loads the identity, generating it only when no file is present at all.
   * A corrupted identity is never regenerated: that would silently break existing pairings.
   */
  immer::box<ClientIdentity> load_or_generate() const;

  /**
   * @brief persist the host certificate (PEM) alongside our identity
   */
  void save_server_certificate(std::string_view cert_pem) const;

  /**
   * @return the previously saved host certificate, if any
   */
  std::optional<std::string> load_server_certificate() const;

  const std::filesystem::path &folder() const {
    return folder_;
  }

private:
  std::filesystem::path folder_;
  std::optional<std::string> unique_id_;

  std::filesystem::path cert_path() const {
    return folder_ / CLIENT_CERT_FILE;
  }
  std::filesystem::path key_path() const {
    return folder_ / CLIENT_KEY_FILE;
  }
  std::filesystem::path server_cert_path() const {
    return folder_ / SERVER_CERT_FILE;
  }

  ClientIdentity make_identity(std::string cert_pem, std::string key_pem) const;
};

/**
 * @return the first 16 hex characters of the SHA-256 of the certificate, uppercase
 */
std::string unique_id_from_cert(std::string_view cert_pem);

} // namespace lynx::identity
