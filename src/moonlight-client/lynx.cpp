#include <exceptions/errors.hpp>
#include <exceptions/exceptions.h>
#include <helpers/logger.hpp>
#include <helpers/utils.hpp>
#include <identity/identity.hpp>
#include <immer/atom.hpp>
#include <memory>
#include <optional>
#include <pairing/pairing.hpp>
#include <rest/control-client.hpp>
#include <state/config.hpp>
#include <string>
#include <vector>

using namespace std::literals;
using namespace lynx;

static void print_usage(const char *program) {
  logs::log(logs::info, "Usage: {} <pair PIN | info | apps | quit>", program);
}

static std::string codec_names(int server_codec_mode_support) {
  std::vector<std::string> names;
  if (server_codec_mode_support & moonlight::SCM_H264) {
    names.emplace_back("H.264");
  }
  if (server_codec_mode_support & moonlight::SCM_HEVC) {
    names.emplace_back("HEVC");
  }
  if (server_codec_mode_support & moonlight::SCM_HEVC_MAIN10) {
    names.emplace_back("HEVC Main10");
  }
  if (server_codec_mode_support & moonlight::SCM_AV1_MAIN8) {
    names.emplace_back("AV1");
  }
  if (server_codec_mode_support & moonlight::SCM_AV1_MAIN10) {
    names.emplace_back("AV1 Main10");
  }
  return names.empty() ? "none" : utils::join(names, ", ");
}

static void print_server_info(const moonlight::ServerInfo &info) {
  logs::log(logs::info, "Host: {} ({})", info.hostname, info.unique_id);
  logs::log(logs::info, "  app version: {}, GFE version: {}", info.app_version, info.gfe_version);
  logs::log(logs::info, "  local IP: {}, MAC: {}", info.local_ip, info.mac);
  logs::log(logs::info, "  ports: HTTP {} HTTPS {}", info.external_port, info.https_port);
  logs::log(logs::info,
            "  codecs: {} ({:#x}), 4K: {}",
            codec_names(info.server_codec_mode_support),
            info.server_codec_mode_support,
            info.supports_4k());
  logs::log(logs::info, "  paired: {}, state: {}, current game: {}", info.is_paired(), info.state, info.current_game);
}

/**
 * Runs a single command against the configured host
 */
static int run(const std::string &command, const std::vector<std::string> &args) {
  auto cfg_folder = std::string(utils::get_env("LYNX_CFG_FOLDER", "."));
  auto cfg_file = std::string(utils::get_env("LYNX_CFG_FILE", (cfg_folder + "/config.toml").c_str()));
  auto cfg = state::load_or_default(cfg_file);
  if (cfg.host.host.empty()) {
    logs::log(logs::error, "No host configured, set LYNX_HOST or [host].address in {}", cfg_file);
    return EXIT_FAILURE;
  }

  auto store = std::make_shared<identity::IdentityStore>(cfg.client.certs_folder, cfg.client.unique_id);
  auto identity = store->load_or_generate();
  auto server_cert = std::make_shared<immer::atom<std::optional<std::string>>>(store->load_server_certificate());
  auto client = std::make_shared<rest::ControlClient>(cfg.host, identity, cfg.client.device_name, server_cert);

  switch (utils::hash(command)) {
  case (utils::hash("pair")): {
    if (args.empty()) {
      logs::log(logs::error, "Missing PIN");
      return EXIT_FAILURE;
    }
    pairing::PairingManager manager(client, store);
    pairing::check_outcome(manager.pair(args[0]));
    logs::log(logs::info, "Paired with {}", cfg.host.host);
    return EXIT_SUCCESS;
  }
  case (utils::hash("info")):
    print_server_info(client->capability_info());
    return EXIT_SUCCESS;
  case (utils::hash("apps")):
    for (const auto &app : client->application_list()) {
      logs::log(logs::info, "[{}] {}{}", app.id, app.title, app.support_hdr ? " (HDR)" : "");
    }
    return EXIT_SUCCESS;
  case (utils::hash("quit")):
    client->quit_application();
    return EXIT_SUCCESS;
  }

  logs::log(logs::error, "Unknown command: {}", command);
  return EXIT_FAILURE;
}

int main(int argc, char *argv[]) try {
  logs::init(logs::parse_level(utils::get_env("LYNX_LOG_LEVEL", "INFO")));
  crash::install_handlers();
  crash::report_previous_crash();

  if (argc < 2) {
    print_usage(argv[0]);
    return EXIT_FAILURE;
  }

  return run(argv[1], std::vector<std::string>(argv + 2, argv + argc));
} catch (const toml::exception &e) {
  logs::log(logs::error, "Invalid config file: {}", e.what());
  return EXIT_FAILURE;
} catch (...) {
  return crash::exit_code(std::current_exception());
}
