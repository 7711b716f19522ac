#pragma once

#include <boost/asio/ssl.hpp>
#include <client_http.hpp>
#include <client_https.hpp>
#include <crypto/crypto.hpp>
#include <helpers/logger.hpp>
#include <identity/identity.hpp>
#include <moonlight/protocol.hpp>
#include <openssl/x509.h>

namespace lynx::rest {

using HttpClient = SimpleWeb::Client<SimpleWeb::HTTP>;
using HttpsClient = SimpleWeb::Client<SimpleWeb::HTTPS>;
using XML = moonlight::XML;

/**
 * Based on client_https.hpp with the following changes:
 *
 * - We always present our client certificate, hosts will refuse any HTTPS call otherwise
 * - Hosts use self signed certificates, there's no CA to check against.
 *   Instead, the leaf certificate must be exactly the one that we got (and verified) during pairing.
 */
class PinnedHttpsClient : public HttpsClient {
public:
  PinnedHttpsClient(const std::string &server_port,
                    const identity::ClientIdentity &identity,
                    const x509::x509_ptr &pinned_cert)
      : HttpsClient(server_port, false, identity.cert_file, identity.key_file) {
    context.set_verify_mode(boost::asio::ssl::verify_peer);
    context.set_verify_callback([pinned_cert](bool preverified, boost::asio::ssl::verify_context &ctx) {
      auto store = ctx.native_handle();
      if (X509_STORE_CTX_get_error_depth(store) != 0) {
        return true;
      }
      auto server_cert = X509_STORE_CTX_get_current_cert(store);
      if (server_cert == nullptr || X509_cmp(server_cert, pinned_cert.get()) != 0) {
        logs::log(logs::warning, "[HTTP] host certificate doesn't match the one we paired with");
        return false;
      }
      return true;
    });
  }
};

/**
 * Where a host can be reached, ports default to the standard GameStream ones
 */
struct HostAddress {
  std::string host;
  unsigned short http_port = moonlight::HTTP_PORT;
  unsigned short https_port = moonlight::HTTPS_PORT;

  std::string http_endpoint() const {
    return host + ":" + std::to_string(http_port);
  }

  std::string https_endpoint() const {
    return host + ":" + std::to_string(https_port);
  }
};

} // namespace lynx::rest
