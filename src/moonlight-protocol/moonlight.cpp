#include <boost/property_tree/xml_parser.hpp>
#include <crypto/crypto.hpp>
#include <immer/vector_transient.hpp>
#include <moonlight/protocol.hpp>
#include <openssl/crypto.h>
#include <sstream>
#include <stdexcept>

namespace moonlight {

XML parse_xml(std::string_view body) {
  XML xml;
  std::istringstream stream{std::string(body)};
  pt::read_xml(stream, xml);
  return xml;
}

int status_code(const XML &xml) {
  return xml.get<int>("root.<xmlattr>.status_code", 200);
}

ServerInfo parse_serverinfo(const XML &xml) {
  ServerInfo info;
  info.hostname = xml.get<std::string>("root.hostname", "");
  info.app_version = xml.get<std::string>("root.appversion", "");
  info.gfe_version = xml.get<std::string>("root.GfeVersion", "");
  info.unique_id = xml.get<std::string>("root.uniqueid", "");
  info.mac = xml.get<std::string>("root.mac", "");
  info.local_ip = xml.get<std::string>("root.LocalIP", "");
  info.state = xml.get<std::string>("root.state", "");
  info.https_port = xml.get<int>("root.HttpsPort", HTTPS_PORT);
  info.external_port = xml.get<int>("root.ExternalPort", HTTP_PORT);
  info.max_luma_pixels_hevc = xml.get<long>("root.MaxLumaPixelsHEVC", 0);
  info.server_codec_mode_support = xml.get<int>("root.ServerCodecModeSupport", 0);
  info.pair_status = xml.get<int>("root.PairStatus", 0);
  info.current_game = xml.get<int>("root.currentgame", 0);
  return info;
}

immer::vector<App> parse_applist(const XML &xml) {
  immer::vector_transient<App> apps;
  auto root = xml.get_child_optional("root");
  if (!root) {
    return apps.persistent();
  }

  for (const auto &[name, node] : *root) {
    if (name != "App") {
      continue;
    }
    apps.push_back(App{.title = node.get<std::string>("AppTitle", ""),
                       .id = node.get<int>("ID"),
                       .support_hdr = node.get<int>("IsHdrSupported", 0) == 1});
  }
  return apps.persistent();
}

std::optional<App> find_app(const immer::vector<App> &apps, std::string_view title) {
  for (const auto &app : apps) {
    if (app.title == title) {
      return app;
    }
  }
  return {};
}

std::optional<std::string> parse_launch(const XML &xml) {
  if (xml.get<int>("root.gamesession", 0) != 1) {
    return {};
  }
  return xml.get<std::string>("root.sessionUrl0");
}

bool parse_cancel(const XML &xml) {
  return xml.get<int>("root.cancel", 0) == 1;
}

std::map<std::string, std::string> launch_query(const LaunchRequest &req) {
  std::map<std::string, std::string> query = {
      {"appid", std::to_string(req.app_id)},
      {"mode", std::to_string(req.width) + "x" + std::to_string(req.height) + "x" + std::to_string(req.refresh_rate)},
      {"additionalStates", "1"},
      {"sops", "1"},
      {"rikey", crypto::str_to_hex(req.remote_input.key)},
      {"rikeyid", std::to_string(req.remote_input.key_id())},
      {"localAudioPlayMode", req.play_local_audio ? "1" : "0"},
      {"surroundAudioInfo", std::to_string(req.audio.surround_audio_info())},
      {"remoteControllersBitmap", std::to_string(req.gamepads.value())},
      {"gcmap", std::to_string(req.gamepads.value())},
      {"gcpersist", req.persist_gamepads ? "1" : "0"},
      {"corever", "1"}};

  if (req.hdr) {
    query["hdrMode"] = "1";
    query["clientHdrCapVersion"] = "0";
    query["clientHdrCapSupportedFlagsInUint32"] = "0";
    query["clientHdrCapMetaDataId"] = "NV_STATIC_METADATA_TYPE_1";
    query["clientHdrCapDisplayData"] = "0x0x0x0x0x0x0x0x0x0x0";
  }

  return query;
}

namespace pair {

constexpr std::size_t SHA256_SIZE = 32;
constexpr std::size_t CHALLENGE_SIZE = 16;
constexpr std::size_t SECRET_SIZE = 16;

static std::optional<std::string> get_opt(const XML &xml, const std::string &path) {
  if (auto value = xml.get_optional<std::string>(path)) {
    return *value;
  }
  return {};
}

PairResponse parse_pair(const XML &xml) {
  return {.paired = xml.get<int>("root.paired", 0),
          .plaincert = get_opt(xml, "root.plaincert"),
          .challengeresponse = get_opt(xml, "root.challengeresponse"),
          .pairingsecret = get_opt(xml, "root.pairingsecret")};
}

std::string gen_aes_key(const std::string &salt, const std::string &pin) {
  auto salt_parsed = crypto::hex_to_str(salt, true);
  auto aes_key = crypto::hex_to_str(crypto::sha256(salt_parsed + pin), true);
  aes_key.resize(16);
  return aes_key;
}

std::string encrypt_client_challenge(const std::string &aes_key, const std::string &client_challenge) {
  return crypto::aes_encrypt_ecb(crypto::pad_to_block(client_challenge), aes_key);
}

ServerChallenge decrypt_server_challenge(const std::string &aes_key, const std::string &encrypted_response) {
  auto decrypted = crypto::aes_decrypt_ecb(encrypted_response, aes_key);
  if (decrypted.size() < SHA256_SIZE + CHALLENGE_SIZE) {
    throw std::invalid_argument("Server challenge response is too short: " + std::to_string(decrypted.size()));
  }
  return {.response_hash = decrypted.substr(0, SHA256_SIZE),
          .challenge = decrypted.substr(SHA256_SIZE, CHALLENGE_SIZE)};
}

std::string client_challenge_response(const std::string &aes_key,
                                      const std::string &server_challenge,
                                      const std::string &client_cert_signature,
                                      const std::string &client_secret) {
  auto hash = crypto::hex_to_str(crypto::sha256(server_challenge + client_cert_signature + client_secret), true);
  return crypto::aes_encrypt_ecb(crypto::pad_to_block(hash), aes_key);
}

ServerSecret split_pairing_secret(const std::string &pairing_secret) {
  if (pairing_secret.size() <= SECRET_SIZE) {
    throw std::invalid_argument("Pairing secret is too short: " + std::to_string(pairing_secret.size()));
  }
  return {.secret = pairing_secret.substr(0, SECRET_SIZE), .signature = pairing_secret.substr(SECRET_SIZE)};
}

bool verify_server_secret(const ServerSecret &secret, const std::string &server_cert_public_key) {
  return crypto::verify(secret.secret, secret.signature, server_cert_public_key);
}

bool check_server_response(const ServerChallenge &server_challenge,
                           const std::string &client_challenge,
                           const std::string &server_cert_signature,
                           const std::string &server_secret) {
  auto expected = crypto::hex_to_str(crypto::sha256(client_challenge + server_cert_signature + server_secret), true);
  if (expected.size() != server_challenge.response_hash.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected.data(), server_challenge.response_hash.data(), expected.size()) == 0;
}

std::string client_pairing_secret(const std::string &client_secret, const std::string &client_private_key) {
  return client_secret + crypto::sign(client_secret, client_private_key);
}

} // namespace pair

} // namespace moonlight
