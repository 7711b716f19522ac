#pragma once
#include "data-structures.hpp"
#include <boost/property_tree/ptree.hpp>
#include <immer/vector.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace moonlight {

namespace pt = boost::property_tree;
using XML = pt::ptree;

/**
 * @brief parses an host response body
 *
 * @throws pt::xml_parser_error if the body isn't a valid XML document
 */
XML parse_xml(std::string_view body);

/**
 * @return the `status_code` attribute of the root element, hosts that don't set it are treated as 200
 */
int status_code(const XML &xml);

/**
 * @brief GET /serverinfo, missing or malformed fields are left to their defaults
 */
ServerInfo parse_serverinfo(const XML &xml);

/**
 * @brief GET /applist, the list of `<App>` elements under `<root>`
 *
 * @throws pt::ptree_error if an app doesn't have a numeric ID
 */
immer::vector<App> parse_applist(const XML &xml);

/**
 * @return the first app with the given (case sensitive) title
 */
std::optional<App> find_app(const immer::vector<App> &apps, std::string_view title);

/**
 * @brief GET /launch
 *
 * @return the RTSP session url, empty if the host didn't start a game session (`gamesession != 1`)
 */
std::optional<std::string> parse_launch(const XML &xml);

/**
 * @brief GET /cancel
 *
 * @return true if the host reports the running app as cancelled
 */
bool parse_cancel(const XML &xml);

/**
 * Everything the host needs to start an app
 */
struct LaunchRequest {
  int app_id;
  int width;
  int height;
  int refresh_rate;
  bool hdr;
  bool play_local_audio;
  AudioConfiguration audio;
  GamepadMask gamepads;
  bool persist_gamepads;
  RemoteInputKey remote_input;
};

/**
 * @brief builds the query parameters for GET /launch (without `uniqueid`)
 */
std::map<std::string, std::string> launch_query(const LaunchRequest &req);

/**
 * @brief Client side of the Moonlight pairing protocol
 *
 * Every phase is an HTTP GET /pair with one of the following parameters,
 * the host answers each phase with `<paired>1</paired>` or with `0` if something went wrong.
 */
namespace pair {

struct PairResponse {
  int paired = 0;
  std::optional<std::string> plaincert;         // hex encoded PEM
  std::optional<std::string> challengeresponse; // hex encoded, AES encrypted
  std::optional<std::string> pairingsecret;     // hex encoded: server secret + signature
};

PairResponse parse_pair(const XML &xml);

/**
 * @brief will derive a common AES key given the salt and the user provided pin
 *
 * @param salt: hex encoded salt, as it's sent to the host
 * @return `SHA256(SALT + PIN)[0:16]`
 */
std::string gen_aes_key(const std::string &salt, const std::string &pin);

/**
 * @brief Pair, phase 2: AES encrypts (zero padded) our random challenge
 *
 * @return the raw encrypted bytes to be sent hex encoded as `clientchallenge`
 */
std::string encrypt_client_challenge(const std::string &aes_key, const std::string &client_challenge);

struct ServerChallenge {
  std::string response_hash; // what the host expects SHA256(client challenge + server cert sig + server secret) to be
  std::string challenge;     // the host's own 16 bytes challenge
};

/**
 * @brief decrypts the `challengeresponse`: the first 32 bytes are the host's hash, the next 16 its challenge
 *
 * @throws std::invalid_argument if the decrypted payload is too short
 */
ServerChallenge decrypt_server_challenge(const std::string &aes_key, const std::string &encrypted_response);

/**
 * @brief Pair, phase 3: SHA256(server challenge + client cert signature + client secret), AES encrypted
 *
 * @return the raw encrypted bytes to be sent hex encoded as `serverchallengeresp`
 */
std::string client_challenge_response(const std::string &aes_key,
                                      const std::string &server_challenge,
                                      const std::string &client_cert_signature,
                                      const std::string &client_secret);

struct ServerSecret {
  std::string secret;    // 16 bytes
  std::string signature; // RSA SHA256 of secret, signed by the host private key
};

/**
 * @throws std::invalid_argument if the payload is shorter than the 16 bytes secret
 */
ServerSecret split_pairing_secret(const std::string &pairing_secret);

/**
 * @brief the host must have signed its secret with the private key matching the certificate it sent us
 */
bool verify_server_secret(const ServerSecret &secret, const std::string &server_cert_public_key);

/**
 * @brief checks that the host was able to decrypt our challenge, that only happens when the PIN matches
 *
 * The comparison is done in constant time after a length check.
 */
bool check_server_response(const ServerChallenge &server_challenge,
                           const std::string &client_challenge,
                           const std::string &server_cert_signature,
                           const std::string &server_secret);

/**
 * @brief Pair, phase 4: our secret followed by its signature
 *
 * @return the raw bytes to be sent hex encoded as `clientpairingsecret`
 */
std::string client_pairing_secret(const std::string &client_secret, const std::string &client_private_key);

} // namespace pair

} // namespace moonlight
