#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rtsp {

enum PACKET_TYPE {
  REQUEST,
  RESPONSE
};

struct RTSP_REQUEST {
  std::string cmd;
  std::string target;
};

struct RTSP_RESPONSE {
  unsigned short status_code{};
  std::string msg;
};

struct RTSP_PACKET {
  PACKET_TYPE type{};

  int seq_number{};
  std::string protocol = "RTSP/1.0";

  RTSP_REQUEST request;
  RTSP_RESPONSE response;

  /* Headers, in the order they have been received (or will be sent) */
  std::vector<std::pair<std::string, std::string>> options = {};
  std::string payload;
};

/**
 * Parse the input message; if successful will return a PACKET object.
 *
 * Everything after the blank line that ends the headers is kept untouched as the payload.
 */
std::optional<RTSP_PACKET> parse(std::string_view msg);

/**
 * Turns the packet into a string, ready to be sent down the TCP socket
 */
std::string to_string(const RTSP_PACKET &pkt);

/**
 * @return the value of the (case insensitive) header `key`, if present
 */
std::optional<std::string> get_option(const RTSP_PACKET &pkt, std::string_view key);

/**
 * @return the status line, ex: `RTSP/1.0 404 NOT FOUND`
 */
std::string status_line(const RTSP_PACKET &pkt);

} // namespace rtsp
