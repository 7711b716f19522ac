#pragma once

#include <chrono>
#include <identity/identity.hpp>
#include <immer/atom.hpp>
#include <immer/box.hpp>
#include <immer/vector.hpp>
#include <map>
#include <memory>
#include <moonlight/protocol.hpp>
#include <optional>
#include <rest/rest.hpp>
#include <string>

namespace lynx::rest {

/**
 * The host certificate (PEM), shared between all the clients that talk to the same host
 */
using ServerCertAtom = std::shared_ptr<immer::atom<std::optional<std::string>>>;

/**
 * Client side of the host control protocol.
 *
 * Every call is a single GET request with a fresh connection.
 * Calls on the HTTPS port present our client certificate and only trust the pinned host certificate.
 *
 * @throws lynx::TransportError on connection errors and timeouts
 * @throws lynx::ProtocolError on a non 200 status code or a malformed XML body
 */
class ControlClient {
public:
  ControlClient(HostAddress address,
                immer::box<identity::ClientIdentity> identity,
                std::string device_name,
                ServerCertAtom server_cert = std::make_shared<immer::atom<std::optional<std::string>>>());

  /**
   * @brief GET /serverinfo
   *
   * Goes through HTTPS when we have a pinned certificate, plain HTTP otherwise
   * (hosts will always report us as not paired over HTTP)
   */
  moonlight::ServerInfo capability_info();

  /**
   * @brief GET /applist
   *
   * @throws lynx::NotPairedError if we don't have a host certificate yet
   */
  immer::vector<moonlight::App> application_list();

  /**
   * @brief GET /launch
   *
   * @return the RTSP session url
   * @throws lynx::StateError if capability_info() was never called
   * @throws lynx::NotPairedError if the last capability_info() reported us as not paired
   */
  std::string launch_application(const moonlight::LaunchRequest &req);

  /**
   * @brief GET /cancel
   */
  void quit_application();

  /**
   * @brief GET /pair over HTTP, `uniqueid`, `devicename` and `updateState` are always added
   *
   * @param timeout: 0 means wait forever (the host might be waiting for the user to type in the PIN)
   * @throws lynx::AuthenticationError if the host reports `paired != 1`
   */
  moonlight::pair::PairResponse pair_command(const std::map<std::string, std::string> &args,
                                             std::chrono::seconds timeout = std::chrono::seconds(0));

  /**
   * @brief GET /pair?phrase=pairchallenge over HTTPS
   *
   * @param candidate_cert: the certificate that the host sent us during this pairing attempt,
   *                        it's not trusted (nor saved) yet so it's pinned only for this request
   */
  moonlight::pair::PairResponse pair_challenge(const std::string &candidate_cert,
                                               std::chrono::seconds timeout = std::chrono::seconds(5));

  /**
   * @brief GET /unpair, clears any pairing state on the host side
   */
  void unpair();

  std::optional<std::string> server_certificate() const {
    return *server_cert_->load();
  }

  void set_server_certificate(std::optional<std::string> cert_pem) {
    server_cert_->store(std::move(cert_pem));
  }

  /**
   * @return the result of the last successful capability_info() call
   */
  std::optional<moonlight::ServerInfo> last_server_info() const {
    return *server_info_.load();
  }

  const HostAddress &address() const {
    return address_;
  }

  const identity::ClientIdentity &identity() const {
    return *identity_;
  }

  const std::string &device_name() const {
    return device_name_;
  }

private:
  HostAddress address_;
  immer::box<identity::ClientIdentity> identity_;
  std::string device_name_;
  ServerCertAtom server_cert_;
  immer::atom<std::optional<moonlight::ServerInfo>> server_info_;

  XML http_get(const std::string &path,
               const std::map<std::string, std::string> &query,
               std::chrono::seconds timeout = std::chrono::seconds(5));

  XML https_get(const std::string &path,
                const std::map<std::string, std::string> &query,
                const std::string &pinned_cert,
                std::chrono::seconds timeout = std::chrono::seconds(5));

  std::string pinned_certificate() const;
};

} // namespace lynx::rest
