#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::Equals;

#include <atomic>
#include <boost/asio.hpp>
#include <exceptions/errors.hpp>
#include <functional>
#include <helpers/utils.hpp>
#include <mutex>
#include <rtsp/parser.hpp>
#include <session/session.hpp>
#include <thread>

using namespace std::string_literals;
using namespace std::chrono_literals;
using namespace rtsp;

TEST_CASE("Parse RTSP requests", "[RTSP]") {
  SECTION("Missing header terminator") {
    REQUIRE_FALSE(parse("OPTIONS rtsp://10.1.2.49:48010 RTSP/1.0\r\nCSeq: 1").has_value());
  }

  SECTION("Not an RTSP message") {
    REQUIRE_FALSE(parse("Hello there!\r\n\r\n").has_value());
  }

  SECTION("Invalid CSeq") {
    REQUIRE_FALSE(parse("OPTIONS rtsp://10.1.2.49:48010 RTSP/1.0\r\nCSeq: one\r\n\r\n").has_value());
  }

  SECTION("Basic request") {
    auto parsed = parse("SETUP streamid=video/0/0 RTSP/1.0\r\n"
                        "CSeq: 3\r\n"
                        "X-GS-ClientVersion: 13\r\n"
                        "Transport: unicast;X-GS-ClientPort=50000-50001\r\n\r\n")
                      .value();

    REQUIRE(parsed.type == REQUEST);
    REQUIRE_THAT(parsed.request.cmd, Equals("SETUP"));
    REQUIRE_THAT(parsed.request.target, Equals("streamid=video/0/0"));
    REQUIRE_THAT(parsed.protocol, Equals("RTSP/1.0"));
    REQUIRE(parsed.seq_number == 3);
    REQUIRE(parsed.options.size() == 3);
    REQUIRE_THAT(get_option(parsed, "transport").value(), Equals("unicast;X-GS-ClientPort=50000-50001"));
    REQUIRE(parsed.payload.empty());
  }

  SECTION("Unix line endings, as sent by some Android clients") {
    auto parsed = parse("OPTIONS rtsp://:48010 RTSP/1.0\n"
                        "CSeq: 1\n"
                        "Host: \n\n")
                      .value();
    REQUIRE(parsed.type == REQUEST);
    REQUIRE_THAT(parsed.request.target, Equals("rtsp://:48010"));
    REQUIRE_THAT(get_option(parsed, "Host").value(), Equals(""));
  }

  SECTION("Request with a payload") {
    auto sdp = "v=0\r\n"
               "o=android 0 14 IN IPv4 0.0.0.0\r\n"
               "s=NVIDIA Streaming Client\r\n"
               "a=x-nv-video[0].clientViewportWd:1920 \r\n"
               "a=x-nv-video[0].clientViewportHt:1080 \r\n\r\n"s;
    auto parsed = parse("ANNOUNCE streamid=control/13/0 RTSP/1.0\r\n"
                        "CSeq: 5\r\n"
                        "Content-Type: application/sdp\r\n"
                        "Content-Length: " +
                        std::to_string(sdp.size()) + "\r\n\r\n" + sdp)
                      .value();

    REQUIRE(parsed.type == REQUEST);
    REQUIRE_THAT(parsed.request.cmd, Equals("ANNOUNCE"));
    REQUIRE(parsed.seq_number == 5);
    // The payload is kept as it is, blank lines included
    REQUIRE_THAT(parsed.payload, Equals(sdp));
  }
}

TEST_CASE("Parse RTSP responses", "[RTSP]") {
  SECTION("Status line") {
    auto parsed = parse("RTSP/1.0 404 NOT FOUND\r\nCSeq: 2\r\n\r\n").value();
    REQUIRE(parsed.type == RESPONSE);
    REQUIRE(parsed.response.status_code == 404);
    REQUIRE_THAT(parsed.response.msg, Equals("NOT FOUND"));
    REQUIRE(parsed.seq_number == 2);
    REQUIRE_THAT(status_line(parsed), Equals("RTSP/1.0 404 NOT FOUND"));
  }

  SECTION("Headers are looked up ignoring case") {
    auto parsed = parse("RTSP/1.0 200 OK\r\n"
                        "cseq: 4\r\n"
                        "SESSION:   DEADBEEFCAFE;timeout = 90\r\n\r\n")
                      .value();
    REQUIRE(parsed.seq_number == 4);
    REQUIRE_THAT(get_option(parsed, "Session").value(), Equals("DEADBEEFCAFE;timeout = 90"));
    REQUIRE_THAT(get_option(parsed, "session").value(), Equals("DEADBEEFCAFE;timeout = 90"));
    REQUIRE_FALSE(get_option(parsed, "Transport").has_value());
  }

  SECTION("Serialization") {
    RTSP_PACKET pkt{.type = RESPONSE, .seq_number = 7};
    pkt.response = {.status_code = 200, .msg = "OK"};
    pkt.options = {{"CSeq", "ignored"}, {"Session", "ABCD"}};
    pkt.payload = "v=0\r\n";

    auto raw = to_string(pkt);
    REQUIRE_THAT(raw, Equals("RTSP/1.0 200 OK\r\nCSeq: 7\r\nSession: ABCD\r\n\r\nv=0\r\n"));

    auto parsed = parse(raw).value();
    REQUIRE(parsed.seq_number == 7);
    REQUIRE_THAT(parsed.payload, Equals(pkt.payload));
    REQUIRE_THAT(get_option(parsed, "Session").value(), Equals("ABCD"));
  }
}

TEST_CASE("Session urls", "[RTSP]") {
  using lynx::session::parse_session_url;

  SECTION("Default port") {
    auto url = parse_session_url("rtsp://192.168.1.5");
    REQUIRE_THAT(url.host, Equals("192.168.1.5"));
    REQUIRE(url.port == 48010);
    REQUIRE_THAT(url.to_string(), Equals("rtsp://192.168.1.5:48010"));
  }

  SECTION("Explicit port, path and query") {
    auto url = parse_session_url("RTSP://my-host.local:48020/stream?id=1");
    REQUIRE_THAT(url.host, Equals("my-host.local"));
    REQUIRE(url.port == 48020);
  }

  SECTION("IPv6") {
    auto url = parse_session_url("rtsp://[fe80::1]:48011");
    REQUIRE_THAT(url.host, Equals("fe80::1"));
    REQUIRE(url.port == 48011);
    REQUIRE_THAT(url.to_string(), Equals("rtsp://[fe80::1]:48011"));

    REQUIRE(parse_session_url("rtsp://[::1]").port == 48010);
    REQUIRE_THROWS_AS(parse_session_url("rtsp://[::1"), lynx::ProtocolError);
  }

  SECTION("Invalid urls") {
    REQUIRE_THROWS_AS(parse_session_url("http://192.168.1.5:48010"), lynx::ProtocolError);
    REQUIRE_THROWS_AS(parse_session_url("rtsp://:48010"), lynx::ProtocolError);
    REQUIRE_THROWS_AS(parse_session_url("rtsp://192.168.1.5:0"), lynx::ProtocolError);
    REQUIRE_THROWS_AS(parse_session_url("rtsp://192.168.1.5:70000"), lynx::ProtocolError);
    REQUIRE_THROWS_AS(parse_session_url("rtsp://192.168.1.5:port"), lynx::ProtocolError);
  }
}

/**
 * A minimal RTSP host: one TCP connection per request, replies are built by the `reply` callback.
 * When the callback returns nothing the connection is kept open without answering.
 * A `late_payload` is written on its own, a bit after the reply, right before closing the connection.
 */
class FakeRTSPHost {
public:
  using ReplyFn = std::function<std::optional<std::string>(const RTSP_PACKET &)>;

  explicit FakeRTSPHost(ReplyFn reply, std::string late_payload = "")
      : acceptor(io_context, {boost::asio::ip::make_address("127.0.0.1"), 0}), reply(std::move(reply)),
        late_payload(std::move(late_payload)) {
    server_thread = std::thread([this]() { serve(); });
  }

  ~FakeRTSPHost() {
    stopping = true;
    boost::system::error_code ec;
    // Wake up the blocking accept()
    boost::asio::ip::tcp::socket wake_up(io_context);
    wake_up.connect(acceptor.local_endpoint(), ec);
    server_thread.join();
  }

  lynx::session::SessionUrl url() const {
    return {.host = "127.0.0.1", .port = acceptor.local_endpoint().port()};
  }

  std::vector<RTSP_PACKET> requests() {
    std::lock_guard lock(mutex);
    return received;
  }

private:
  boost::asio::io_context io_context;
  boost::asio::ip::tcp::acceptor acceptor;
  ReplyFn reply;
  std::string late_payload;
  std::thread server_thread;
  std::atomic<bool> stopping = false;

  std::mutex mutex;
  std::vector<RTSP_PACKET> received;
  std::vector<boost::asio::ip::tcp::socket> unanswered;

  void serve() {
    while (!stopping) {
      boost::asio::ip::tcp::socket socket(io_context);
      boost::system::error_code ec;
      acceptor.accept(socket, ec);
      if (ec || stopping) {
        return;
      }

      std::string raw;
      auto head_size = boost::asio::read_until(socket, boost::asio::dynamic_buffer(raw), "\r\n\r\n", ec);
      if (ec) {
        continue;
      }
      auto pkt = parse(raw);
      if (!pkt) {
        continue;
      }
      if (auto length = get_option(*pkt, "Content-Length")) {
        auto missing = std::stoul(*length) - (raw.size() - head_size);
        if (missing > 0) {
          boost::asio::read(socket, boost::asio::dynamic_buffer(raw), boost::asio::transfer_exactly(missing), ec);
        }
        pkt = parse(raw);
      }

      {
        std::lock_guard lock(mutex);
        received.push_back(*pkt);
      }

      if (auto response = reply(*pkt)) {
        boost::asio::write(socket, boost::asio::buffer(*response), ec);
        if (!late_payload.empty()) {
          std::this_thread::sleep_for(100ms);
          boost::asio::write(socket, boost::asio::buffer(late_payload), ec);
        }
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
      } else {
        unanswered.push_back(std::move(socket));
      }
    }
  }
};

static std::string ok(const RTSP_PACKET &req, const std::string &extra_headers = "", const std::string &payload = "") {
  auto content = payload.empty() ? ""s : "Content-Length: " + std::to_string(payload.size()) + "\r\n";
  return "RTSP/1.0 200 OK\r\nCSeq: " + std::to_string(req.seq_number) + "\r\n" + extra_headers + content + "\r\n" +
         payload;
}

TEST_CASE("RTSP session handshake", "[RTSP]") {
  auto sdp = "v=0\r\n"
             "o=- 0 0 IN IP4 127.0.0.1\r\n"
             "s=Lynx test host\r\n"
             "a=x-ss-general.featureFlags:3\r\n"
             "sprop-parameter-sets=AAAAAU\r\n"s;

  FakeRTSPHost host([&sdp](const RTSP_PACKET &req) -> std::optional<std::string> {
    if (req.request.cmd == "DESCRIBE") {
      return ok(req, "Content-Type: application/sdp\r\n", sdp);
    } else if (req.request.cmd == "SETUP") {
      return ok(req, "Session: AAAABBBB;timeout=90\r\nTransport: server_port=47998\r\n");
    }
    return ok(req);
  });

  lynx::session::SessionClient client(host.url());

  auto options = client.probe();
  REQUIRE(options.response.status_code == 200);
  REQUIRE(options.seq_number == 1);

  REQUIRE_THAT(client.describe(), Equals(sdp));
  REQUIRE_FALSE(client.session_id().has_value());

  auto audio = client.setup("audio/0/0");
  REQUIRE_THAT(get_option(audio, "Transport").value(), Equals("server_port=47998"));
  REQUIRE_THAT(client.session_id().value(), Equals("AAAABBBB"));
  client.setup("video/0/0");
  client.setup("control/13/0");

  auto announced = "v=0\r\na=x-nv-video[0].clientViewportWd:1920 \r\n"s;
  client.announce(announced);
  client.play();
  REQUIRE(client.next_sequence_number() == 8);

  auto requests = host.requests();
  REQUIRE(requests.size() == 7);

  REQUIRE_THAT(requests[0].request.cmd, Equals("OPTIONS"));
  REQUIRE_THAT(requests[0].request.target, Equals(host.url().to_string()));
  REQUIRE_THAT(get_option(requests[0], "X-GS-ClientVersion").value(), Equals("13"));
  REQUIRE_FALSE(get_option(requests[0], "Session").has_value());

  REQUIRE_THAT(requests[1].request.cmd, Equals("DESCRIBE"));
  REQUIRE_THAT(get_option(requests[1], "Accept").value(), Equals("application/sdp"));

  REQUIRE_THAT(requests[2].request.cmd, Equals("SETUP"));
  REQUIRE_THAT(requests[2].request.target, Equals("streamid=audio/0/0"));
  REQUIRE_THAT(get_option(requests[2], "Transport").value(), ContainsSubstring("X-GS-ClientPort"));
  REQUIRE_FALSE(get_option(requests[2], "Session").has_value());

  // Everything after the first SETUP carries the session id
  REQUIRE_THAT(requests[3].request.target, Equals("streamid=video/0/0"));
  REQUIRE_THAT(get_option(requests[3], "Session").value(), Equals("AAAABBBB"));
  REQUIRE_THAT(requests[4].request.target, Equals("streamid=control/13/0"));

  REQUIRE_THAT(requests[5].request.cmd, Equals("ANNOUNCE"));
  REQUIRE_THAT(requests[5].request.target, Equals("streamid=control/13/0"));
  REQUIRE_THAT(get_option(requests[5], "Session").value(), Equals("AAAABBBB"));
  REQUIRE_THAT(get_option(requests[5], "Content-Type").value(), Equals("application/sdp"));
  REQUIRE_THAT(requests[5].payload, Equals(announced));

  REQUIRE_THAT(requests[6].request.cmd, Equals("PLAY"));
  REQUIRE_THAT(requests[6].request.target, Equals("/"));
  REQUIRE(requests[6].seq_number == 7);
}

TEST_CASE("RTSP replies without Content-Length", "[RTSP]") {
  auto sdp = "v=0\r\ns=Lynx test host\r\na=x-ss-general.featureFlags:3\r\n"s;

  SECTION("The payload is read until the host closes the connection") {
    FakeRTSPHost host([](const RTSP_PACKET &req) -> std::optional<std::string> { return ok(req); }, sdp);
    lynx::session::SessionClient client(host.url());
    REQUIRE_THAT(client.describe(), Equals(sdp));
  }

  SECTION("Head and payload in a single write") {
    FakeRTSPHost host([&sdp](const RTSP_PACKET &req) -> std::optional<std::string> {
      return "RTSP/1.0 200 OK\r\nCSeq: " + std::to_string(req.seq_number) + "\r\n\r\n" + sdp;
    });
    lynx::session::SessionClient client(host.url());
    REQUIRE_THAT(client.describe(), Equals(sdp));
  }

  SECTION("The host must close the connection in time") {
    FakeRTSPHost host([](const RTSP_PACKET &req) -> std::optional<std::string> { return ok(req); }, sdp);
    lynx::session::SessionClient client(host.url(), 50ms);
    REQUIRE_THROWS_AS(client.describe(), lynx::TransportError);
  }
}

TEST_CASE("RTSP session errors", "[RTSP]") {
  SECTION("Host rejects the request") {
    FakeRTSPHost host([](const RTSP_PACKET &req) -> std::optional<std::string> {
      return "RTSP/1.0 404 NOT FOUND\r\nCSeq: " + std::to_string(req.seq_number) + "\r\n\r\n";
    });
    lynx::session::SessionClient client(host.url());

    try {
      client.setup("audio/0/0");
      FAIL("SETUP should have been rejected");
    } catch (const lynx::ProtocolError &err) {
      REQUIRE_THAT(err.what(), ContainsSubstring("RTSP/1.0 404 NOT FOUND"));
    }
  }

  SECTION("Garbage reply") {
    FakeRTSPHost host([](const RTSP_PACKET &) -> std::optional<std::string> { return "HTTP/1.1 418\r\n"; });
    lynx::session::SessionClient client(host.url());
    REQUIRE_THROWS_AS(client.probe(), lynx::ProtocolError);
  }

  SECTION("SETUP without a session") {
    FakeRTSPHost host([](const RTSP_PACKET &req) -> std::optional<std::string> { return ok(req); });
    lynx::session::SessionClient client(host.url());
    REQUIRE_THROWS_AS(client.setup("audio/0/0"), lynx::ProtocolError);
    REQUIRE_FALSE(client.session_id().has_value());
  }

  SECTION("Host never answers") {
    FakeRTSPHost host([](const RTSP_PACKET &) -> std::optional<std::string> { return {}; });
    lynx::session::SessionClient client(host.url(), 200ms);
    REQUIRE_THROWS_AS(client.probe(), lynx::TransportError);
    REQUIRE(host.requests().size() == 1);
  }

  SECTION("Nobody is listening") {
    lynx::session::SessionClient client({.host = "127.0.0.1", .port = 1}, 1s);
    REQUIRE_THROWS_AS(client.play(), lynx::TransportError);
  }
}
