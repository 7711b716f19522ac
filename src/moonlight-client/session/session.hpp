#pragma once

#include <chrono>
#include <moonlight/data-structures.hpp>
#include <optional>
#include <rtsp/parser.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lynx::session {

/**
 * The host and port found in the `sessionUrl0` of a launch response
 */
struct SessionUrl {
  std::string host;
  unsigned short port = moonlight::RTSP_SETUP_PORT;

  std::string to_string() const {
    auto authority = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return "rtsp://" + authority + ":" + std::to_string(port);
  }
};

/**
 * @brief parses `rtsp://host[:port][/path][?query]`, IPv6 hosts must be in square brackets
 *
 * @throws lynx::ProtocolError if the url isn't an rtsp one
 */
SessionUrl parse_session_url(std::string_view url);

/**
 * Client side of the RTSP handshake that precedes the media streams.
 *
 * Hosts expect a brand new TCP connection for each request, the connection is closed as soon as the reply is read.
 *
 * @throws lynx::TransportError on connection errors or when a request doesn't complete in time
 * @throws lynx::ProtocolError on a malformed reply or a non 200 status code, the message carries the status line
 */
class SessionClient {
public:
  static constexpr int CLIENT_VERSION = 13;
  static constexpr auto USER_AGENT = "lynx";

  explicit SessionClient(SessionUrl url, std::chrono::milliseconds timeout = std::chrono::seconds(5));

  /**
   * @brief OPTIONS
   */
  rtsp::RTSP_PACKET probe();

  /**
   * @brief DESCRIBE
   * @return the host SDP
   */
  std::string describe();

  /**
   * @brief SETUP of a single stream: `audio/0/0`, `video/0/0` or `control/13/0`
   *
   * The first reply carrying a `Session` header sets the session id for all the following requests.
   */
  rtsp::RTSP_PACKET setup(const std::string &track);

  /**
   * @brief ANNOUNCE our stream configuration as an SDP document
   */
  rtsp::RTSP_PACKET announce(const std::string &sdp);

  /**
   * @brief PLAY, the host will start sending media after this
   */
  rtsp::RTSP_PACKET play();

  const std::optional<std::string> &session_id() const {
    return session;
  }

  int next_sequence_number() const {
    return seq_number;
  }

private:
  SessionUrl url;
  std::chrono::milliseconds timeout;
  int seq_number = 1;
  std::optional<std::string> session;

  rtsp::RTSP_PACKET request(const std::string &cmd,
                            const std::string &target,
                            std::vector<std::pair<std::string, std::string>> options = {},
                            std::string payload = {});

  std::string exchange(const std::string &raw_request);
};

} // namespace lynx::session
