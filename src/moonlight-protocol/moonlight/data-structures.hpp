#pragma once
#include <cstdint>
#include <string>

namespace moonlight {

constexpr unsigned short HTTP_PORT = 47989;
constexpr unsigned short HTTPS_PORT = 47984;
constexpr unsigned short RTSP_SETUP_PORT = 48010;

enum VIDEO_FORMAT : int {
  H264 = 0x0001,            // H.264 High Profile
  H264_HIGH8_444 = 0x0004,  // H.264 High 4:4:4 8-bit Profile
  H265 = 0x0100,            // HEVC Main Profile
  H265_MAIN10 = 0x0200,     // HEVC Main10 Profile
  H265_REXT8_444 = 0x0400,  // HEVC RExt 4:4:4 8-bit Profile
  H265_REXT10_444 = 0x0800, // HEVC RExt 4:4:4 10-bit Profile
  AV1_MAIN8 = 0x1000,
  AV1_MAIN10 = 0x2000,
  AV1_HIGH8_444 = 0x4000,
  AV1_HIGH10_444 = 0x8000
};

/**
 * Masks to match video codecs without profile-specific details
 */
enum VIDEO_FORMAT_MASK : int {
  MASK_H264 = 0x000F,
  MASK_H265 = 0x0F00,
  MASK_AV1 = 0xF000,
  MASK_10BIT = 0xAA00,
  MASK_YUV444 = 0xCC04
};

/**
 * Host ServerCodecModeSupport bits
 */
enum SERVER_CODEC_SUPPORT : int {
  SCM_H264 = 0x1,
  SCM_HEVC = 0x100,
  SCM_HEVC_MAIN10 = 0x200,
  SCM_AV1_MAIN8 = 0x10000,
  SCM_AV1_MAIN10 = 0x20000,
  SCM_HDR_CAPABLE = 0x20200 // any of these bits advertises 10 bit (HDR) streaming
};

enum ENCRYPTION_FLAGS : std::uint32_t {
  ENCFLG_NONE = 0x00000000,
  ENCFLG_AUDIO = 0x00000001,
  ENCFLG_VIDEO = 0x00000002,
  ENCFLG_ALL = 0xFFFFFFFF
};

enum STREAMING_MODE : int {
  STREAM_CFG_LOCAL = 0,
  STREAM_CFG_REMOTE = 1,
  STREAM_CFG_AUTO = 2
};

enum COLOR_SPACE : int {
  REC_601 = 0,
  REC_709 = 1,
  REC_2020 = 2 // not supported with H.264 on GFE hosts
};

enum COLOR_RANGE : int {
  COLOR_RANGE_LIMITED = 0,
  COLOR_RANGE_FULL = 1
};

enum BUFFER_TYPE : int {
  BUFFER_TYPE_PICDATA = 0,
  BUFFER_TYPE_SPS = 1,
  BUFFER_TYPE_PPS = 2,
  BUFFER_TYPE_VPS = 3
};

enum FRAME_TYPE : int {
  FRAME_TYPE_PFRAME = 0,
  FRAME_TYPE_IDR = 1
};

constexpr int DR_OK = 0;
constexpr int DR_NEED_IDR = -1;

struct AudioConfiguration {
  int channel_count;
  int channel_mask;

  /**
   * @return the `surroundAudioInfo` launch parameter: mask in the high 16 bits, count in the low ones
   */
  int surround_audio_info() const {
    return channel_mask << 16 | channel_count;
  }
};

constexpr AudioConfiguration AUDIO_STEREO = {2, 0x3};
constexpr AudioConfiguration AUDIO_51_SURROUND = {6, 0x3F};
constexpr AudioConfiguration AUDIO_71_SURROUND = {8, 0x63F};

constexpr int MAX_GAMEPADS = 4;

/**
 * Which controllers are attached, bit N set means gamepad N is plugged in
 */
class GamepadMask {
public:
  static GamepadMask from_mask(int mask) {
    return GamepadMask(mask & ((1 << MAX_GAMEPADS) - 1));
  }

  static GamepadMask from_count(int count) {
    int mask = 0;
    for (int i = 0; i < count && i < MAX_GAMEPADS; i++) {
      mask |= 1 << i;
    }
    return GamepadMask(mask);
  }

  int value() const {
    return mask;
  }

  bool operator==(const GamepadMask &other) const {
    return mask == other.mask;
  }

private:
  explicit GamepadMask(int mask) : mask(mask) {}
  int mask;
};

struct ServerInfo {
  std::string hostname;
  std::string app_version;
  std::string gfe_version;
  std::string unique_id;
  std::string mac;
  std::string local_ip;
  std::string state;
  int https_port = HTTPS_PORT;
  int external_port = HTTP_PORT;
  long max_luma_pixels_hevc = 0;
  int server_codec_mode_support = 0;
  int pair_status = 0;
  int current_game = 0;

  bool is_paired() const {
    return pair_status == 1;
  }

  /**
   * Old GFE releases (2.x) or hosts that don't report a version can't stream above 4K
   */
  bool supports_4k() const {
    return !gfe_version.empty() && gfe_version.rfind("2.", 0) != 0;
  }
};

struct App {
  std::string title;
  int id;
  bool support_hdr;
};

/**
 * AES key material used by the host to decrypt our input packets
 */
struct RemoteInputKey {
  std::string key; // 16 raw bytes
  std::string iv;  // 16 raw bytes

  /**
   * @return the first 4 bytes of the IV as a big endian integer, that's what `rikeyid` carries
   */
  std::int32_t key_id() const {
    std::uint32_t id = 0;
    for (std::size_t i = 0; i < 4 && i < iv.size(); i++) {
      id = (id << 8) | static_cast<std::uint8_t>(iv[i]);
    }
    return static_cast<std::int32_t>(id);
  }
};

} // namespace moonlight
