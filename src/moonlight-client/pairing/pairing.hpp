#pragma once

#include <chrono>
#include <identity/identity.hpp>
#include <memory>
#include <rest/control-client.hpp>
#include <string>
#include <string_view>

namespace lynx::pairing {

enum class PairingOutcome {
  NotPaired,
  Paired,
  WrongPin,
  Failed,
  AlreadyInProgress
};

std::string_view to_string(PairingOutcome outcome);

/**
 * @brief turns a non successful outcome into the matching lynx error
 *
 * @throws lynx::WrongPinError, lynx::StateError (already in progress) or lynx::Error carrying the outcome
 */
void check_outcome(PairingOutcome outcome);

/**
 * Drives the Moonlight pairing handshake against a host.
 *
 * Every error that happens during the handshake is logged and collapsed into a PairingOutcome,
 * callers will never get an exception out of pair()
 */
class PairingManager {
public:
  static constexpr auto STEP_TIMEOUT = std::chrono::seconds(5);

  PairingManager(std::shared_ptr<rest::ControlClient> client, std::shared_ptr<identity::IdentityStore> store);

  /**
   * @brief blocks until the handshake is over; the host certificate is persisted only when Paired
   */
  PairingOutcome pair(const std::string &pin);

private:
  std::shared_ptr<rest::ControlClient> client;
  std::shared_ptr<identity::IdentityStore> store;

  PairingOutcome handshake(const std::string &pin, std::string &server_cert_pem);
};

} // namespace lynx::pairing
