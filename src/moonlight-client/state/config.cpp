#include <exceptions/errors.hpp>
#include <filesystem>
#include <helpers/logger.hpp>
#include <helpers/utils.hpp>
#include <state/config.hpp>

namespace lynx::state {

using namespace std::literals;

static bool file_exist(const std::string &filename) {
  std::error_code ec;
  return std::filesystem::exists(filename, ec);
}

static toml::value section(const toml::value &cfg, const std::string &key) {
  if (cfg.is_table() && cfg.as_table().count(key) > 0) {
    return toml::find(cfg, key);
  }
  return toml::table{};
}

std::string default_certs_folder() {
  if (auto cfg_folder = utils::get_env("LYNX_CFG_FOLDER")) {
    return std::string(cfg_folder) + "/certs";
  }
  return std::string(utils::get_env("HOME", ".")) + "/.config/lynx/certs";
}

int parse_video_format(const std::string &name) {
  switch (utils::hash(utils::to_lower(name))) {
  case (utils::hash("h264")):
    return moonlight::H264;
  case (utils::hash("h264_high8_444")):
    return moonlight::H264_HIGH8_444;
  case (utils::hash("h265")):
  case (utils::hash("hevc")):
    return moonlight::H265;
  case (utils::hash("h265_main10")):
  case (utils::hash("hevc_main10")):
    return moonlight::H265_MAIN10;
  case (utils::hash("h265_rext8_444")):
    return moonlight::H265_REXT8_444;
  case (utils::hash("h265_rext10_444")):
    return moonlight::H265_REXT10_444;
  case (utils::hash("av1")):
  case (utils::hash("av1_main8")):
    return moonlight::AV1_MAIN8;
  case (utils::hash("av1_main10")):
    return moonlight::AV1_MAIN10;
  case (utils::hash("av1_high8_444")):
    return moonlight::AV1_HIGH8_444;
  case (utils::hash("av1_high10_444")):
    return moonlight::AV1_HIGH10_444;
  }
  throw Error(fmt::format("Unrecognised video format: {}", name));
}

moonlight::AudioConfiguration parse_audio_configuration(const std::string &name) {
  switch (utils::hash(utils::to_lower(name))) {
  case (utils::hash("stereo")):
    return moonlight::AUDIO_STEREO;
  case (utils::hash("5.1")):
    return moonlight::AUDIO_51_SURROUND;
  case (utils::hash("7.1")):
    return moonlight::AUDIO_71_SURROUND;
  }
  throw Error(fmt::format("Unrecognised audio configuration: {}", name));
}

moonlight::STREAMING_MODE parse_streaming_mode(const std::string &name) {
  switch (utils::hash(utils::to_lower(name))) {
  case (utils::hash("local")):
    return moonlight::STREAM_CFG_LOCAL;
  case (utils::hash("remote")):
    return moonlight::STREAM_CFG_REMOTE;
  case (utils::hash("auto")):
    return moonlight::STREAM_CFG_AUTO;
  }
  throw Error(fmt::format("Unrecognised streaming mode: {}", name));
}

static moonlight::COLOR_SPACE parse_color_space(const std::string &name) {
  switch (utils::hash(utils::to_lower(name))) {
  case (utils::hash("rec601")):
    return moonlight::REC_601;
  case (utils::hash("rec709")):
    return moonlight::REC_709;
  case (utils::hash("rec2020")):
    return moonlight::REC_2020;
  }
  throw Error(fmt::format("Unrecognised color space: {}", name));
}

static moonlight::COLOR_RANGE parse_color_range(const std::string &name) {
  switch (utils::hash(utils::to_lower(name))) {
  case (utils::hash("limited")):
    return moonlight::COLOR_RANGE_LIMITED;
  case (utils::hash("full")):
    return moonlight::COLOR_RANGE_FULL;
  }
  throw Error(fmt::format("Unrecognised color range: {}", name));
}

static std::uint32_t parse_encryption(const std::string &name) {
  switch (utils::hash(utils::to_lower(name))) {
  case (utils::hash("none")):
    return moonlight::ENCFLG_NONE;
  case (utils::hash("audio")):
    return moonlight::ENCFLG_AUDIO;
  case (utils::hash("video")):
    return moonlight::ENCFLG_VIDEO;
  case (utils::hash("all")):
    return moonlight::ENCFLG_ALL;
  }
  throw Error(fmt::format("Unrecognised encryption: {}", name));
}

static StreamConfiguration stream_from_toml(const toml::value &v) {
  StreamConfiguration stream;
  stream.width = toml::find_or(v, "width", stream.width);
  stream.height = toml::find_or(v, "height", stream.height);
  stream.fps = toml::find_or(v, "fps", stream.fps);
  stream.launch_refresh_rate = toml::find_or(v, "launch_refresh_rate", stream.fps);
  stream.client_refresh_rate_x100 = toml::find_or(v, "client_refresh_rate_x100", stream.client_refresh_rate_x100);
  stream.bitrate = toml::find_or(v, "bitrate", stream.bitrate);
  stream.packet_size = toml::find_or(v, "packet_size", stream.packet_size);
  stream.streaming_remotely = parse_streaming_mode(toml::find_or(v, "streaming_remotely", "auto"s));
  stream.audio = parse_audio_configuration(toml::find_or(v, "audio", "stereo"s));
  stream.color_space = parse_color_space(toml::find_or(v, "color_space", "rec601"s));
  stream.color_range = parse_color_range(toml::find_or(v, "color_range", "limited"s));
  stream.encryption_flags = parse_encryption(toml::find_or(v, "encryption", "all"s));
  stream.persist_gamepads = toml::find_or(v, "persist_gamepads", stream.persist_gamepads);
  stream.play_local_audio = toml::find_or(v, "play_local_audio", stream.play_local_audio);

  auto video_formats = toml::find_or<std::vector<std::string>>(v, "video_formats", {"h264"});
  stream.supported_video_formats = 0;
  for (const auto &format : video_formats) {
    stream.supported_video_formats |= parse_video_format(format);
  }
  if (toml::find_or(v, "hdr", false)) {
    stream.supported_video_formats |= moonlight::H265_MAIN10;
  }

  if (v.as_table().count("gamepad_mask") > 0) {
    stream.gamepads = moonlight::GamepadMask::from_mask(toml::find<int>(v, "gamepad_mask"));
  } else if (v.as_table().count("gamepad_count") > 0) {
    stream.gamepads = moonlight::GamepadMask::from_count(toml::find<int>(v, "gamepad_count"));
  }

  return stream;
}

Config from_toml(const toml::value &cfg) {
  Config result;

  auto host = section(cfg, "host");
  result.host.host = toml::find_or(host, "address", ""s);
  result.host.http_port = static_cast<unsigned short>(toml::find_or(host, "http_port", static_cast<int>(moonlight::HTTP_PORT)));
  result.host.https_port = static_cast<unsigned short>(toml::find_or(host, "https_port", static_cast<int>(moonlight::HTTPS_PORT)));

  auto client = section(cfg, "client");
  if (client.as_table().count("unique_id") > 0) {
    result.client.unique_id = toml::find<std::string>(client, "unique_id");
  }
  result.client.device_name = toml::find_or(client, "device_name", result.client.device_name);
  result.client.certs_folder = toml::find_or(client, "certs_folder", default_certs_folder());

  auto stream = section(cfg, "stream");
  result.stream = stream_from_toml(stream);
  result.video_queue_bytes = toml::find_or(stream, "video_queue_bytes", result.video_queue_bytes);
  result.audio_queue_bytes = toml::find_or(stream, "audio_queue_bytes", result.audio_queue_bytes);

  if (auto host_override = utils::get_env("LYNX_HOST")) {
    result.host.host = host_override;
  }

  return result;
}

Config load_or_default(const std::string &source) {
  if (!file_exist(source)) {
    logs::log(logs::warning, "Unable to open config file: {}, using defaults", source);
    return from_toml(toml::table{});
  }

  logs::log(logs::debug, "Reading config file: {}", source);
  const auto cfg = toml::parse(source);
  return from_toml(cfg);
}

} // namespace lynx::state
