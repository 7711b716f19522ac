#include <boost/asio.hpp>
#include <exceptions/errors.hpp>
#include <helpers/logger.hpp>
#include <helpers/utils.hpp>
#include <session/session.hpp>

namespace lynx::session {

namespace asio = boost::asio;
using asio::ip::tcp;
using namespace std::string_literals;

SessionUrl parse_session_url(std::string_view url) {
  constexpr std::string_view scheme = "rtsp://";
  if (!utils::starts_with(utils::to_lower(url), scheme)) {
    throw ProtocolError(fmt::format("Not an RTSP session url: {}", url));
  }

  auto authority = url.substr(scheme.size());
  authority = authority.substr(0, authority.find_first_of("/?"));

  SessionUrl result;
  std::string_view port;
  if (utils::starts_with(authority, "[")) { // [IPv6]:port
    auto closing = authority.find(']');
    if (closing == std::string_view::npos) {
      throw ProtocolError(fmt::format("Malformed session url: {}", url));
    }
    result.host = utils::to_string(authority.substr(1, closing - 1));
    auto rest = authority.substr(closing + 1);
    if (utils::starts_with(rest, ":")) {
      port = rest.substr(1);
    }
  } else {
    auto colon = authority.rfind(':');
    result.host = utils::to_string(authority.substr(0, colon));
    if (colon != std::string_view::npos) {
      port = authority.substr(colon + 1);
    }
  }

  if (result.host.empty()) {
    throw ProtocolError(fmt::format("Missing host in session url: {}", url));
  }

  if (!port.empty()) {
    try {
      auto port_number = std::stoi(utils::to_string(port));
      if (port_number <= 0 || port_number > 65535) {
        throw ProtocolError(fmt::format("Invalid port in session url: {}", url));
      }
      result.port = static_cast<unsigned short>(port_number);
    } catch (const std::logic_error &e) {
      throw ProtocolError(fmt::format("Invalid port in session url: {}", url));
    }
  }

  return result;
}

SessionClient::SessionClient(SessionUrl url, std::chrono::milliseconds timeout)
    : url(std::move(url)), timeout(timeout) {}

/**
 * Looks for the Content-Length header in the (raw) head of a message
 */
static std::optional<std::size_t> content_length(std::string_view head) {
  auto lower_head = utils::to_lower(head);
  auto pos = lower_head.find("content-length:");
  if (pos == std::string::npos) {
    return {};
  }
  pos += "content-length:"s.size();
  auto end = lower_head.find_first_of("\r\n", pos);
  try {
    return std::stoul(lower_head.substr(pos, end - pos));
  } catch (const std::logic_error &e) {
    logs::log(logs::warning, "[RTSP] invalid Content-Length in reply");
    return {};
  }
}

std::string SessionClient::exchange(const std::string &raw_request) {
  asio::io_context io_context;
  tcp::socket socket(io_context);
  boost::system::error_code ec;

  /*
   * Blocking operations with a deadline, adapted from:
   * https://www.boost.org/doc/libs/1_79_0/doc/html/boost_asio/example/cpp11/timeouts/blocking_tcp_client.cpp
   */
  auto run = [&](std::string_view step) {
    io_context.restart();
    io_context.run_for(timeout);
    if (!io_context.stopped()) {
      socket.close(ec);
      io_context.run();
      throw TransportError(fmt::format("RTSP {} to {} timed out", step, url.to_string()));
    }
  };

  tcp::resolver resolver(io_context);
  auto endpoints = resolver.resolve(url.host, std::to_string(url.port), ec);
  if (ec) {
    throw TransportError(fmt::format("Unable to resolve {}: {}", url.host, ec.message()));
  }

  asio::async_connect(socket, endpoints, [&](const boost::system::error_code &result, const tcp::endpoint &) {
    ec = result;
  });
  run("connect");
  if (ec) {
    throw TransportError(fmt::format("Unable to connect to {}: {}", url.to_string(), ec.message()));
  }

  asio::async_write(socket, asio::buffer(raw_request), [&](const boost::system::error_code &result, std::size_t) {
    ec = result;
  });
  run("write");
  if (ec) {
    throw TransportError(fmt::format("Unable to send RTSP request: {}", ec.message()));
  }

  std::string response;
  std::size_t head_size = 0;
  asio::async_read_until(socket,
                         asio::dynamic_buffer(response),
                         "\r\n\r\n",
                         [&](const boost::system::error_code &result, std::size_t bytes) {
                           ec = result;
                           head_size = bytes;
                         });
  run("read");
  if (ec && !(ec == asio::error::eof && !response.empty())) {
    throw TransportError(fmt::format("Unable to read RTSP reply: {}", ec.message()));
  }

  if (!ec) {
    auto body_size = content_length(std::string_view(response).substr(0, head_size));
    auto body_read = response.size() - head_size;
    if (body_size && *body_size > body_read) {
      asio::async_read(socket,
                       asio::dynamic_buffer(response),
                       asio::transfer_exactly(*body_size - body_read),
                       [&](const boost::system::error_code &result, std::size_t) { ec = result; });
      run("read");
      if (ec) {
        throw TransportError(fmt::format("Unable to read RTSP payload: {}", ec.message()));
      }
    } else if (!body_size) {
      /* No Content-Length: the host closes the connection once the payload has been sent */
      asio::async_read(socket,
                       asio::dynamic_buffer(response),
                       asio::transfer_all(),
                       [&](const boost::system::error_code &result, std::size_t) { ec = result; });
      run("read");
      if (ec && ec != asio::error::eof) {
        throw TransportError(fmt::format("Unable to read RTSP payload: {}", ec.message()));
      }
    }
  }

  socket.shutdown(tcp::socket::shutdown_both, ec);
  if (ec) {
    logs::log(logs::trace, "[RTSP] error while closing the socket: {}", ec.message());
  }
  return response;
}

rtsp::RTSP_PACKET SessionClient::request(const std::string &cmd,
                                         const std::string &target,
                                         std::vector<std::pair<std::string, std::string>> options,
                                         std::string payload) {
  rtsp::RTSP_PACKET req{.type = rtsp::REQUEST, .seq_number = seq_number++};
  req.request = {.cmd = cmd, .target = target};
  req.options.emplace_back("X-GS-ClientVersion", std::to_string(CLIENT_VERSION));
  if (session) {
    req.options.emplace_back("Session", *session);
  }
  req.options.emplace_back("User-Agent", USER_AGENT);
  req.options.insert(req.options.end(), options.begin(), options.end());
  req.payload = std::move(payload);

  auto raw_request = rtsp::to_string(req);
  logs::log(logs::trace, "[RTSP] sending request: \n{}", raw_request);
  auto raw_response = exchange(raw_request);
  logs::log(logs::trace, "[RTSP] received reply: \n{}", raw_response);

  auto response = rtsp::parse(raw_response);
  if (!response || response->type != rtsp::RESPONSE) {
    throw ProtocolError(fmt::format("Malformed RTSP reply to {}", cmd));
  }
  if (response->response.status_code != 200) {
    throw ProtocolError(rtsp::status_line(*response));
  }
  if (response->seq_number != req.seq_number) {
    logs::log(logs::warning, "[RTSP] {} reply CSeq {} doesn't match {}", cmd, response->seq_number, req.seq_number);
  }
  return *response;
}

rtsp::RTSP_PACKET SessionClient::probe() {
  logs::log(logs::debug, "[RTSP] OPTIONS {}", url.to_string());
  return request("OPTIONS", url.to_string());
}

std::string SessionClient::describe() {
  logs::log(logs::debug, "[RTSP] DESCRIBE {}", url.to_string());
  auto response = request("DESCRIBE",
                          url.to_string(),
                          {{"Accept", "application/sdp"}, {"If-Modified-Since", "Thu, 01 Jan 1970 00:00:00 GMT"}});
  return response.payload;
}

rtsp::RTSP_PACKET SessionClient::setup(const std::string &track) {
  logs::log(logs::debug, "[RTSP] SETUP {}", track);
  auto response = request("SETUP", "streamid=" + track, {{"Transport", "unicast;X-GS-ClientPort=50000-50001"}});

  auto session_header = rtsp::get_option(response, "Session");
  auto parts = session_header ? utils::split(*session_header, ';') : std::vector<std::string_view>{};
  if (!parts.empty() && !utils::trim(parts.front()).empty()) {
    auto id = utils::to_string(utils::trim(parts.front()));
    if (!session) {
      logs::log(logs::debug, "[RTSP] session id: {}", id);
      session = id;
    }
  } else if (!session) {
    throw ProtocolError(fmt::format("SETUP {} reply is missing the Session header", track));
  }
  return response;
}

rtsp::RTSP_PACKET SessionClient::announce(const std::string &sdp) {
  logs::log(logs::debug, "[RTSP] ANNOUNCE");
  return request("ANNOUNCE",
                 "streamid=control/13/0",
                 {{"Content-Type", "application/sdp"}, {"Content-Length", std::to_string(sdp.size())}},
                 sdp);
}

rtsp::RTSP_PACKET SessionClient::play() {
  logs::log(logs::debug, "[RTSP] PLAY");
  return request("PLAY", "/");
}

} // namespace lynx::session
