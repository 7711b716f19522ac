#include <crypto/crypto.hpp>
#include <exceptions/errors.hpp>
#include <helpers/logger.hpp>
#include <moonlight/protocol.hpp>
#include <pairing/pairing.hpp>

namespace lynx::pairing {

using namespace moonlight::pair;

constexpr int SALT_SIZE = 16;
constexpr int CHALLENGE_SIZE = 16;
constexpr int SECRET_SIZE = 16;

std::string_view to_string(PairingOutcome outcome) {
  switch (outcome) {
  case PairingOutcome::NotPaired:
    return "NOT_PAIRED";
  case PairingOutcome::Paired:
    return "PAIRED";
  case PairingOutcome::WrongPin:
    return "WRONG_PIN";
  case PairingOutcome::Failed:
    return "FAILED";
  case PairingOutcome::AlreadyInProgress:
    return "ALREADY_IN_PROGRESS";
  }
  return "UNKNOWN";
}

void check_outcome(PairingOutcome outcome) {
  switch (outcome) {
  case PairingOutcome::Paired:
    return;
  case PairingOutcome::WrongPin:
    throw WrongPinError("Wrong PIN, try again");
  case PairingOutcome::AlreadyInProgress:
    throw StateError("The host is already pairing with another client");
  case PairingOutcome::NotPaired:
  case PairingOutcome::Failed:
    break;
  }
  throw Error(fmt::format("Pairing failed: {}", to_string(outcome)));
}

PairingManager::PairingManager(std::shared_ptr<rest::ControlClient> client,
                               std::shared_ptr<identity::IdentityStore> store)
    : client(std::move(client)), store(std::move(store)) {}

PairingOutcome PairingManager::handshake(const std::string &pin, std::string &server_cert_pem) {
  const auto &identity = client->identity();

  // PHASE 1: send our certificate, get back the host one
  auto salt = crypto::str_to_hex(crypto::random(SALT_SIZE));
  auto aes_key = gen_aes_key(salt, pin);

  logs::log(logs::debug, "[PAIR] waiting for the host to accept the PIN");
  auto resp = client->pair_command(
      {{"phrase", "getservercert"}, {"salt", salt}, {"clientcert", crypto::str_to_hex(identity.cert_pem)}});

  if (!resp.plaincert || resp.plaincert->empty()) {
    logs::log(logs::warning, "[PAIR] host is already pairing with another client");
    return PairingOutcome::AlreadyInProgress;
  }
  server_cert_pem = crypto::hex_to_str(*resp.plaincert, true);
  auto server_cert = x509::cert_from_string(server_cert_pem);

  // PHASE 2: our random challenge
  auto client_challenge = crypto::random(CHALLENGE_SIZE);
  resp = client->pair_command(
      {{"clientchallenge", crypto::str_to_hex(encrypt_client_challenge(aes_key, client_challenge))}},
      STEP_TIMEOUT);
  if (!resp.challengeresponse) {
    throw ProtocolError("Missing challengeresponse");
  }
  auto server_challenge = decrypt_server_challenge(aes_key, crypto::hex_to_str(*resp.challengeresponse, true));

  // PHASE 3: answer the host challenge
  auto client_secret = crypto::random(SECRET_SIZE);
  auto challenge_resp = client_challenge_response(aes_key,
                                                  server_challenge.challenge,
                                                  x509::get_cert_signature(identity.cert),
                                                  client_secret);
  resp = client->pair_command({{"serverchallengeresp", crypto::str_to_hex(challenge_resp)}}, STEP_TIMEOUT);
  if (!resp.pairingsecret) {
    throw ProtocolError("Missing pairingsecret");
  }
  auto server_secret = split_pairing_secret(crypto::hex_to_str(*resp.pairingsecret, true));

  if (!verify_server_secret(server_secret, x509::get_cert_public_key(server_cert))) {
    logs::log(logs::error, "[PAIR] the host secret isn't signed by the certificate it sent us");
    return PairingOutcome::Failed;
  }

  if (!check_server_response(server_challenge,
                             client_challenge,
                             x509::get_cert_signature(server_cert),
                             server_secret.secret)) {
    logs::log(logs::warning, "[PAIR] wrong PIN");
    return PairingOutcome::WrongPin;
  }

  // PHASE 4: our signed secret
  client->pair_command({{"clientpairingsecret", crypto::str_to_hex(client_pairing_secret(client_secret, identity.key_pem))}},
                       STEP_TIMEOUT);

  // PHASE 5: the host must accept our certificate over TLS
  client->pair_challenge(server_cert_pem, STEP_TIMEOUT);

  return PairingOutcome::Paired;
}

PairingOutcome PairingManager::pair(const std::string &pin) {
  logs::log(logs::info, "[PAIR] pairing with {}", client->address().host);

  std::string server_cert_pem;
  auto outcome = PairingOutcome::NotPaired;
  try {
    outcome = handshake(pin, server_cert_pem);
  } catch (const std::exception &e) {
    logs::log(logs::error, "[PAIR] pairing failed: {}", e.what());
    outcome = PairingOutcome::Failed;
  }

  try {
    client->unpair();
  } catch (const Error &e) {
    logs::log(logs::warning, "[PAIR] unable to reset the host pairing state: {}", e.what());
  }

  if (outcome == PairingOutcome::Paired) {
    try {
      store->save_server_certificate(server_cert_pem);
      client->set_server_certificate(server_cert_pem);
    } catch (const Error &e) {
      logs::log(logs::error, "[PAIR] unable to save the host certificate: {}", e.what());
      outcome = PairingOutcome::Failed;
    }
  }

  logs::log(logs::info, "[PAIR] pairing with {} ended: {}", client->address().host, to_string(outcome));
  return outcome;
}

} // namespace lynx::pairing
