#include <boost/property_tree/ptree.hpp>
#include <boost/system/system_error.hpp>
#include <exceptions/errors.hpp>
#include <helpers/logger.hpp>
#include <rest/control-client.hpp>

namespace lynx::rest {

namespace pt = boost::property_tree;
using namespace std::chrono_literals;

constexpr auto CONNECT_TIMEOUT = 5s;

static std::string to_query_string(const std::map<std::string, std::string> &query) {
  SimpleWeb::CaseInsensitiveMultimap fields;
  for (const auto &[key, value] : query) {
    fields.emplace(key, value);
  }
  return SimpleWeb::QueryString::create(fields);
}

/**
 * Runs a synchronous GET and turns the body into an XML document,
 * every failure is mapped into the lynx error hierarchy
 */
template <class T>
static XML get_xml(SimpleWeb::Client<T> &client,
                   const std::string &path,
                   const std::map<std::string, std::string> &query,
                   std::chrono::seconds timeout) {
  client.config.timeout = timeout.count();
  client.config.timeout_connect = CONNECT_TIMEOUT.count();

  constexpr bool is_https = std::is_same_v<SimpleWeb::HTTPS, T>;
  logs::log(logs::debug, "[HTTP] GET {} {}", is_https ? "HTTPS" : "HTTP", path);

  std::string status;
  std::string body;
  try {
    auto response = client.request("GET", path + "?" + to_query_string(query));
    status = response->status_code;
    body = response->content.string();
  } catch (const boost::system::system_error &e) {
    if (is_https && e.code().category() == boost::asio::error::get_ssl_category()) {
      throw AuthenticationError(fmt::format("TLS handshake failed for {}: {}", path, e.what()));
    }
    throw TransportError(fmt::format("GET {} failed: {}", path, e.what()));
  }

  logs::log(logs::trace, "[HTTP] {} response: {}\n{}", path, status, body);
  if (status.rfind("200", 0) != 0) {
    throw ProtocolError(fmt::format("GET {} failed with status: {}", path, status));
  }

  try {
    auto xml = moonlight::parse_xml(body);
    auto status_code = moonlight::status_code(xml);
    if (status_code != 200) {
      throw ProtocolError(fmt::format("GET {} failed with status_code: {} {}",
                                      path,
                                      status_code,
                                      xml.get<std::string>("root.<xmlattr>.status_message", "")));
    }
    return xml;
  } catch (const pt::ptree_error &e) {
    throw ProtocolError(fmt::format("GET {} returned a malformed document: {}", path, e.what()));
  }
}

ControlClient::ControlClient(HostAddress address,
                             immer::box<identity::ClientIdentity> identity,
                             std::string device_name,
                             ServerCertAtom server_cert)
    : address_(std::move(address)), identity_(std::move(identity)), device_name_(std::move(device_name)),
      server_cert_(std::move(server_cert)) {}

XML ControlClient::http_get(const std::string &path,
                            const std::map<std::string, std::string> &query,
                            std::chrono::seconds timeout) {
  HttpClient client(address_.http_endpoint());
  return get_xml(client, path, query, timeout);
}

XML ControlClient::https_get(const std::string &path,
                             const std::map<std::string, std::string> &query,
                             const std::string &pinned_cert,
                             std::chrono::seconds timeout) {
  x509::x509_ptr pinned;
  try {
    pinned = x509::cert_from_string(pinned_cert);
  } catch (const std::runtime_error &e) {
    throw AuthenticationError(fmt::format("Invalid host certificate: {}", e.what()));
  }
  PinnedHttpsClient client(address_.https_endpoint(), *identity_, pinned);
  return get_xml(client, path, query, timeout);
}

std::string ControlClient::pinned_certificate() const {
  auto cert = server_certificate();
  if (!cert) {
    throw NotPairedError(fmt::format("No certificate for host {}, pair first", address_.host));
  }
  return *cert;
}

moonlight::ServerInfo ControlClient::capability_info() {
  std::map<std::string, std::string> query = {{"uniqueid", identity_->unique_id}};
  auto cert = server_certificate();
  auto xml = cert ? https_get("/serverinfo", query, *cert) : http_get("/serverinfo", query);

  try {
    auto info = moonlight::parse_serverinfo(xml);
    logs::log(logs::debug,
              "[HTTP] host {} GFE {} paired: {} codecs: {:#x}",
              info.hostname,
              info.gfe_version,
              info.is_paired(),
              info.server_codec_mode_support);
    server_info_.store(std::optional<moonlight::ServerInfo>{info});
    return info;
  } catch (const pt::ptree_error &e) {
    throw ProtocolError(fmt::format("Malformed serverinfo: {}", e.what()));
  }
}

immer::vector<moonlight::App> ControlClient::application_list() {
  auto xml = https_get("/applist", {{"uniqueid", identity_->unique_id}}, pinned_certificate());
  try {
    return moonlight::parse_applist(xml);
  } catch (const pt::ptree_error &e) {
    throw ProtocolError(fmt::format("Malformed applist: {}", e.what()));
  }
}

std::string ControlClient::launch_application(const moonlight::LaunchRequest &req) {
  auto info = last_server_info();
  if (!info) {
    throw StateError("Server info must be queried before launching an app");
  }
  if (!info->is_paired()) {
    throw NotPairedError(fmt::format("Not paired with {}", info->hostname));
  }

  auto query = moonlight::launch_query(req);
  query["uniqueid"] = identity_->unique_id;

  logs::log(logs::info, "[HTTP] launching app {} at {}x{}@{}", req.app_id, req.width, req.height, req.refresh_rate);
  auto xml = https_get("/launch", query, pinned_certificate());

  std::optional<std::string> session_url;
  try {
    session_url = moonlight::parse_launch(xml);
  } catch (const pt::ptree_error &e) {
    throw ProtocolError(fmt::format("Malformed launch response: {}", e.what()));
  }
  if (!session_url) {
    throw ProtocolError(fmt::format("Host refused to launch app {}", req.app_id));
  }
  return *session_url;
}

void ControlClient::quit_application() {
  auto xml = https_get("/cancel", {{"uniqueid", identity_->unique_id}}, pinned_certificate());
  bool cancelled = false;
  try {
    cancelled = moonlight::parse_cancel(xml);
  } catch (const pt::ptree_error &e) {
    throw ProtocolError(fmt::format("Malformed cancel response: {}", e.what()));
  }
  if (!cancelled) {
    throw ProtocolError("Host refused to quit the running app");
  }
  logs::log(logs::info, "[HTTP] running app stopped");
}

static moonlight::pair::PairResponse check_paired(const XML &xml) {
  moonlight::pair::PairResponse resp;
  try {
    resp = moonlight::pair::parse_pair(xml);
  } catch (const pt::ptree_error &e) {
    throw ProtocolError(fmt::format("Malformed pair response: {}", e.what()));
  }
  if (resp.paired != 1) {
    throw AuthenticationError("Host refused pairing");
  }
  return resp;
}

moonlight::pair::PairResponse ControlClient::pair_command(const std::map<std::string, std::string> &args,
                                                          std::chrono::seconds timeout) {
  std::map<std::string, std::string> query = {{"uniqueid", identity_->unique_id},
                                              {"devicename", device_name_},
                                              {"updateState", "1"}};
  query.insert(args.begin(), args.end());
  return check_paired(http_get("/pair", query, timeout));
}

moonlight::pair::PairResponse ControlClient::pair_challenge(const std::string &candidate_cert,
                                                            std::chrono::seconds timeout) {
  std::map<std::string, std::string> query = {{"uniqueid", identity_->unique_id},
                                              {"devicename", device_name_},
                                              {"updateState", "1"},
                                              {"phrase", "pairchallenge"}};
  return check_paired(https_get("/pair", query, candidate_cert, timeout));
}

void ControlClient::unpair() {
  http_get("/unpair", {{"uniqueid", identity_->unique_id}});
}

} // namespace lynx::rest
