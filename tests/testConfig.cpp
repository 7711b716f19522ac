#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using Catch::Matchers::Equals;

#include <cstdlib>
#include <exceptions/errors.hpp>
#include <state/config.hpp>

using namespace lynx;
using namespace std::string_literals;

TEST_CASE("Load config from file", "[CONFIG]") {
  auto cfg = state::load_or_default(LYNX_TEST_ASSETS "/config.test.toml"s);

  REQUIRE_THAT(cfg.host.host, Equals("192.168.1.50"));
  REQUIRE(cfg.host.http_port == 47999);
  REQUIRE(cfg.host.https_port == moonlight::HTTPS_PORT);

  REQUIRE_THAT(cfg.client.unique_id.value(), Equals("0123456789ABCDEF"));
  REQUIRE_THAT(cfg.client.device_name, Equals("living-room"));
  REQUIRE_THAT(cfg.client.certs_folder, Equals("/tmp/lynx-certs"));

  auto &stream = cfg.stream;
  REQUIRE(stream.width == 3840);
  REQUIRE(stream.height == 2160);
  REQUIRE(stream.fps == 120);
  REQUIRE(stream.launch_refresh_rate == 120);
  REQUIRE(stream.bitrate == 80000);
  REQUIRE(stream.packet_size == 1392);
  REQUIRE(stream.streaming_remotely == moonlight::STREAM_CFG_REMOTE);
  REQUIRE(stream.audio.channel_count == 8);
  REQUIRE(stream.supported_video_formats ==
          (moonlight::H264 | moonlight::H265 | moonlight::AV1_MAIN8 | moonlight::H265_MAIN10));
  REQUIRE(stream.hdr_requested());
  REQUIRE(stream.color_space == moonlight::REC_2020);
  REQUIRE(stream.color_range == moonlight::COLOR_RANGE_FULL);
  REQUIRE(stream.encryption_flags == moonlight::ENCFLG_VIDEO);
  REQUIRE(stream.gamepads.value() == 0b11);
  REQUIRE_FALSE(stream.persist_gamepads);
  REQUIRE_FALSE(stream.play_local_audio);

  REQUIRE(cfg.video_queue_bytes == 8 * 1024 * 1024);
  REQUIRE(cfg.audio_queue_bytes == 64 * 1024);
}

TEST_CASE("Missing config file", "[CONFIG]") {
  setenv("LYNX_CFG_FOLDER", "/tmp/lynx-cfg", 1);
  auto cfg = state::load_or_default("/this/file/does/not/exist.toml");
  unsetenv("LYNX_CFG_FOLDER");

  REQUIRE(cfg.host.host.empty());
  REQUIRE(cfg.host.http_port == moonlight::HTTP_PORT);
  REQUIRE(cfg.host.https_port == moonlight::HTTPS_PORT);
  REQUIRE_FALSE(cfg.client.unique_id.has_value());
  REQUIRE_THAT(cfg.client.device_name, Equals("lynx"));
  REQUIRE_THAT(cfg.client.certs_folder, Equals("/tmp/lynx-cfg/certs"));

  REQUIRE(cfg.stream.width == 1280);
  REQUIRE(cfg.stream.height == 720);
  REQUIRE(cfg.stream.fps == 60);
  REQUIRE(cfg.stream.supported_video_formats == moonlight::H264);
  REQUIRE_FALSE(cfg.stream.hdr_requested());
  REQUIRE(cfg.stream.streaming_remotely == moonlight::STREAM_CFG_AUTO);
  REQUIRE(cfg.stream.encryption_flags == moonlight::ENCFLG_ALL);
  REQUIRE(cfg.stream.gamepads.value() == 0);
  REQUIRE(cfg.stream.persist_gamepads);
}

TEST_CASE("Config values", "[CONFIG]") {
  SECTION("Video formats") {
    REQUIRE(state::parse_video_format("H264") == moonlight::H264);
    REQUIRE(state::parse_video_format("hevc") == moonlight::H265);
    REQUIRE(state::parse_video_format("hevc_main10") == moonlight::H265_MAIN10);
    REQUIRE(state::parse_video_format("av1_high10_444") == moonlight::AV1_HIGH10_444);
    REQUIRE_THROWS_AS(state::parse_video_format("vp9"), Error);
  }

  SECTION("Audio") {
    REQUIRE(state::parse_audio_configuration("stereo").channel_count == 2);
    REQUIRE(state::parse_audio_configuration("5.1").channel_mask == 0x3F);
    REQUIRE_THROWS_AS(state::parse_audio_configuration("mono"), Error);
  }

  SECTION("Streaming mode") {
    REQUIRE(state::parse_streaming_mode("LOCAL") == moonlight::STREAM_CFG_LOCAL);
    REQUIRE(state::parse_streaming_mode("remote") == moonlight::STREAM_CFG_REMOTE);
    REQUIRE_THROWS_AS(state::parse_streaming_mode("lan"), Error);
  }

  SECTION("Documents") {
    auto gamepads = toml::table{{"stream", toml::table{{"gamepad_mask", 0b1010}, {"gamepad_count", 4}}}};
    REQUIRE(state::from_toml(gamepads).stream.gamepads.value() == 0b1010);

    auto bad_color = toml::table{{"stream", toml::table{{"color_space", "bt2100"}}}};
    REQUIRE_THROWS_AS(state::from_toml(bad_color), Error);

    auto refresh = toml::table{{"stream", toml::table{{"fps", 30}, {"launch_refresh_rate", 60}}}};
    auto cfg = state::from_toml(refresh);
    REQUIRE(cfg.stream.fps == 30);
    REQUIRE(cfg.stream.launch_refresh_rate == 60);
  }
}
