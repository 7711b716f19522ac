#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <exceptions/errors.hpp>
#include <fcntl.h>
#include <fstream>
#include <helpers/logger.hpp>
#include <identity/identity.hpp>
#include <sstream>
#include <unistd.h>

namespace lynx::identity {

namespace fs = std::filesystem;

static void ensure_folder(const fs::path &folder) {
  std::error_code ec;
  if (!fs::exists(folder, ec)) {
    logs::log(logs::debug, "[IDENTITY] creating folder {}", folder.string());
    fs::create_directories(folder, ec);
    if (ec) {
      throw Error(fmt::format("Unable to create {}: {}", folder.string(), ec.message()));
    }
    fs::permissions(folder, fs::perms::owner_all, fs::perm_options::replace, ec);
  }
}

/**
 * Writes the file making sure that only the current user will ever be able to read it
 */
static void write_private_file(const fs::path &path, std::string_view content) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (fd < 0) {
    throw Error(fmt::format("Unable to open {} for writing: {}", path.string(), std::strerror(errno)));
  }

  std::size_t written = 0;
  while (written < content.size()) {
    auto res = write(fd, content.data() + written, content.size() - written);
    if (res < 0) {
      if (errno == EINTR)
        continue;
      auto err = errno;
      close(fd);
      throw Error(fmt::format("Unable to write {}: {}", path.string(), std::strerror(err)));
    }
    written += res;
  }
  close(fd);

  /* open() doesn't change the mode of an already existing file */
  std::error_code ec;
  fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
  if (ec) {
    throw Error(fmt::format("Unable to set permissions on {}: {}", path.string(), ec.message()));
  }
}

static std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error(fmt::format("Unable to read {}", path.string()));
  }
  std::stringstream content;
  content << in.rdbuf();
  return content.str();
}

std::string unique_id_from_cert(std::string_view cert_pem) {
  auto hash = crypto::sha256(cert_pem).substr(0, 16);
  std::transform(hash.begin(), hash.end(), hash.begin(), [](unsigned char c) { return std::toupper(c); });
  return hash;
}

IdentityStore::IdentityStore(fs::path folder, std::optional<std::string> unique_id)
    : folder_(std::move(folder)), unique_id_(std::move(unique_id)) {}

ClientIdentity IdentityStore::make_identity(std::string cert_pem, std::string key_pem) const {
  x509::x509_ptr cert;
  try {
    cert = x509::cert_from_string(cert_pem);
    x509::pkey_from_string(key_pem);
  } catch (const std::runtime_error &e) {
    throw Error(fmt::format("Corrupted client identity in {}: {}", folder_.string(), e.what()));
  }

  auto id = unique_id_.value_or(unique_id_from_cert(cert_pem));
  return ClientIdentity{.unique_id = id,
                        .cert_pem = std::move(cert_pem),
                        .key_pem = std::move(key_pem),
                        .cert_file = cert_path().string(),
                        .key_file = key_path().string(),
                        .cert = cert};
}

immer::box<ClientIdentity> IdentityStore::load() const {
  if (!fs::exists(cert_path()) || !fs::exists(key_path())) {
    throw NotFoundError(fmt::format("No client identity found in {}", folder_.string()));
  }

  logs::log(logs::debug, "[IDENTITY] loading certificates from {}", folder_.string());
  return make_identity(read_file(cert_path()), read_file(key_path()));
}

immer::box<ClientIdentity> IdentityStore::generate(int valid_years, int key_bits) const {
  logs::log(logs::info, "[IDENTITY] generating a new {} bits client certificate in {}", key_bits, folder_.string());
  ensure_folder(folder_);

  auto pkey = x509::generate_key(key_bits);
  auto cert = x509::generate_x509(pkey, valid_years);
  auto cert_pem = x509::get_cert_pem(cert);
  auto key_pem = x509::get_pkey_content(pkey);

  write_private_file(key_path(), key_pem);
  write_private_file(cert_path(), cert_pem);

  return make_identity(std::move(cert_pem), std::move(key_pem));
}

immer::box<ClientIdentity> IdentityStore::load_or_generate() const {
  if (!fs::exists(cert_path()) && !fs::exists(key_path())) {
    return generate();
  }
  return load();
}

void IdentityStore::save_server_certificate(std::string_view cert_pem) const {
  try {
    x509::cert_from_string(cert_pem);
  } catch (const std::runtime_error &e) {
    throw Error(fmt::format("Refusing to save an invalid server certificate: {}", e.what()));
  }

  ensure_folder(folder_);
  write_private_file(server_cert_path(), cert_pem);
  logs::log(logs::debug, "[IDENTITY] saved server certificate to {}", server_cert_path().string());
}

std::optional<std::string> IdentityStore::load_server_certificate() const {
  if (!fs::exists(server_cert_path())) {
    return {};
  }
  return read_file(server_cert_path());
}

} // namespace lynx::identity
