#include <helpers/logger.hpp>
#include <helpers/utils.hpp>
#include <peglib.h>
#include <rtsp/parser.hpp>
#include <sstream>

namespace rtsp {

std::optional<RTSP_PACKET> parse(std::string_view msg) {

  // clang-format off
  // Test this out at https://yhirose.github.io/cpp-peglib/
  peg::parser parser = {R"(
    RTSP <- (RESPONSELINE / REQUESTLINE) ENDLINE OPTION* ENDLINE

    RESPONSELINE <- PROTOCOL ' ' RESPONSECODE (' ' RESPONSEMSG)?
    REQUESTLINE <- CMD ' ' TARGET ' ' PROTOCOL

    #####
    CMD <- < [a-zA-Z_]+ >
    TARGET <- < (![ \r\n] .)+ >
    PROTOCOL <- < [a-zA-Z]+ '/' [0-9.]+ >

    #####
    RESPONSECODE <- < [0-9]+ >
    RESPONSEMSG <- < (![\r\n] .)* >

    #####
    OPTION <- OPTKEY ':' [ \t]* OPTVAL ENDLINE
    OPTKEY <- < [a-zA-Z0-9_-]+ >
    OPTVAL <- < (![\r\n] .)* >

    #####
    ~ENDLINE <- '\r'? '\n'
    )"};
  // clang-format on

  if (!static_cast<bool>(parser)) { // If this fails we have passed a bad grammar
    logs::log(logs::error, "[RTSP] invalid grammar");
    return {};
  }

  /* The grammar only covers the head, anything past the first empty line is the payload */
  auto head_end = msg.find("\r\n\r\n");
  auto separator_size = 4;
  if (head_end == std::string_view::npos) {
    head_end = msg.find("\n\n");
    separator_size = 2;
  }
  if (head_end == std::string_view::npos) {
    logs::log(logs::warning, "[RTSP] message without an header terminator: {}", msg);
    return {};
  }
  auto head = msg.substr(0, head_end + separator_size);

  RTSP_PACKET pkt;

  parser["CMD"] = [&pkt](const peg::SemanticValues &vs) {
    pkt.type = REQUEST;
    pkt.request.cmd = vs.token_to_string();
  };
  parser["TARGET"] = [&pkt](const peg::SemanticValues &vs) { pkt.request.target = vs.token_to_string(); };
  parser["PROTOCOL"] = [&pkt](const peg::SemanticValues &vs) { pkt.protocol = vs.token_to_string(); };

  parser["RESPONSECODE"] = [&pkt](const peg::SemanticValues &vs) {
    pkt.type = RESPONSE;
    pkt.response.status_code = vs.token_to_number<unsigned short>();
  };
  parser["RESPONSEMSG"] = [&pkt](const peg::SemanticValues &vs) { pkt.response.msg = vs.token_to_string(); };

  parser["OPTION"] = [&pkt](const peg::SemanticValues &vs) {
    auto key = std::any_cast<std::string>(vs[0]);
    auto val = std::any_cast<std::string>(vs[1]);
    pkt.options.emplace_back(key, val);
  };
  parser["OPTKEY"] = [](const peg::SemanticValues &vs) { return vs.token_to_string(); };
  parser["OPTVAL"] = [](const peg::SemanticValues &vs) { return utils::to_string(utils::trim(vs.token())); };

  parser.set_logger([head](size_t line, size_t col, const std::string &error_msg, const std::string &rule) {
    logs::log(logs::warning, "[RTSP] {}:{}: {}\n{}", line, col, error_msg, head);
  });

  parser.enable_packrat_parsing();
  if (!parser.parse(head)) { // If this fails we have passed a packet that doesn't conform to the grammar
    return {};
  }

  if (auto cseq = get_option(pkt, "CSeq")) {
    try {
      pkt.seq_number = std::stoi(cseq.value());
    } catch (const std::logic_error &e) {
      logs::log(logs::warning, "[RTSP] invalid CSeq: {}", cseq.value());
      return {};
    }
  }

  pkt.payload = utils::to_string(msg.substr(head.size()));
  return pkt;
}

std::string to_string(const RTSP_PACKET &pkt) {
  std::ostringstream stream;
  constexpr auto endl = "\r\n";

  if (pkt.type == REQUEST) {
    stream << pkt.request.cmd << " " << pkt.request.target << " " << pkt.protocol;
  } else {
    stream << pkt.protocol << " " << pkt.response.status_code << " " << pkt.response.msg;
  }

  stream << endl << "CSeq: " << pkt.seq_number;

  for (const auto &opt : pkt.options) {
    if (utils::to_lower(opt.first) == "cseq") {
      continue;
    }
    stream << endl << opt.first << ": " << opt.second;
  }
  stream << endl << endl;
  stream << pkt.payload;

  return stream.str();
}

std::optional<std::string> get_option(const RTSP_PACKET &pkt, std::string_view key) {
  auto lower_key = utils::to_lower(key);
  for (const auto &opt : pkt.options) {
    if (utils::to_lower(opt.first) == lower_key) {
      return opt.second;
    }
  }
  return {};
}

std::string status_line(const RTSP_PACKET &pkt) {
  return pkt.protocol + " " + std::to_string(pkt.response.status_code) + " " + pkt.response.msg;
}

} // namespace rtsp
