#pragma once

#include <cstddef>
#include <cstdint>
#include <moonlight/data-structures.hpp>
#include <optional>
#include <rest/rest.hpp>
#include <string>

namespace lynx::state {

/**
 * What the user asks the host to stream, it's immutable for the whole session
 */
struct StreamConfiguration {
  int width = 1280;
  int height = 720;
  int fps = 60;
  int launch_refresh_rate = 60;
  int client_refresh_rate_x100 = 0;
  int bitrate = 10000; // Kbps
  int packet_size = 1024;
  moonlight::STREAMING_MODE streaming_remotely = moonlight::STREAM_CFG_AUTO;
  moonlight::AudioConfiguration audio = moonlight::AUDIO_STEREO;
  int supported_video_formats = moonlight::H264;
  moonlight::COLOR_SPACE color_space = moonlight::REC_601;
  moonlight::COLOR_RANGE color_range = moonlight::COLOR_RANGE_LIMITED;
  std::uint32_t encryption_flags = moonlight::ENCFLG_ALL;
  moonlight::GamepadMask gamepads = moonlight::GamepadMask::from_mask(0);
  bool persist_gamepads = true;
  bool play_local_audio = false;

  /**
   * HDR is implied by asking for any 10 bit video format
   */
  bool hdr_requested() const {
    return (supported_video_formats & moonlight::MASK_10BIT) != 0;
  }
};

struct ClientConfig {
  std::optional<std::string> unique_id;
  std::string device_name = "lynx";
  std::string certs_folder;
};

struct Config {
  rest::HostAddress host;
  ClientConfig client;
  StreamConfiguration stream;
  std::size_t video_queue_bytes = 4 * 1024 * 1024;
  std::size_t audio_queue_bytes = 64 * 1024;
};

} // namespace lynx::state
