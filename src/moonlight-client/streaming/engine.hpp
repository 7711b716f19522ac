#pragma once

#include <cstdint>
#include <memory>
#include <moonlight/data-structures.hpp>
#include <rest/rest.hpp>
#include <session/session.hpp>
#include <state/data-structures.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace lynx::streaming {

class VideoRenderer;
class AudioRenderer;

struct BufferSegment {
  moonlight::BUFFER_TYPE type;
  std::string data;
};

/**
 * A full video frame as reassembled by the streaming engine
 */
struct DecodeUnit {
  int frame_number;
  moonlight::FRAME_TYPE frame_type;
  std::uint64_t receive_time_ms;
  std::uint32_t presentation_time_ms;
  std::vector<BufferSegment> buffers;

  std::size_t size() const {
    std::size_t total = 0;
    for (const auto &buffer : buffers) {
      total += buffer.data.size();
    }
    return total;
  }
};

/**
 * Everything that has been agreed with the host for the current session
 */
struct NegotiatedSession {
  rest::HostAddress address;
  std::string app_version;
  std::string gfe_version;
  int server_codec_mode_support;
  std::string session_url;
  int packet_size;
  moonlight::STREAMING_MODE streaming_mode;
};

/**
 * Callbacks from the streaming engine, they can be called from any engine thread
 */
class ConnectionListener {
public:
  virtual ~ConnectionListener() = default;

  virtual void stage_starting(int stage) = 0;
  virtual void stage_complete(int stage) = 0;
  virtual void stage_failed(int stage, int error_code) = 0;
  virtual void connection_started() = 0;
  virtual void connection_terminated(int error_code) = 0;
  virtual void connection_status_update(int status) = 0;
  virtual void log_message(std::string_view message) = 0;
  virtual void rumble(std::uint16_t controller_number, std::uint16_t low_freq_motor, std::uint16_t high_freq_motor) = 0;
  virtual void rumble_triggers(std::uint16_t controller_number,
                               std::uint16_t left_trigger_motor,
                               std::uint16_t right_trigger_motor) = 0;
  virtual void set_hdr_mode(bool enabled) = 0;
  virtual void
  set_motion_event_state(std::uint16_t controller_number, std::uint8_t motion_type, std::uint16_t report_rate_hz) = 0;
  virtual void set_controller_led(std::uint16_t controller_number, std::uint8_t r, std::uint8_t g, std::uint8_t b) = 0;
};

/**
 * Built when a session starts and handed (by reference) to the streaming engine,
 * it lives until the session is stopped
 */
struct SessionContext {
  NegotiatedSession session;
  state::StreamConfiguration stream;
  moonlight::RemoteInputKey remote_input;
  std::shared_ptr<session::SessionClient> rtsp;
  std::shared_ptr<VideoRenderer> video;
  std::shared_ptr<AudioRenderer> audio;
  std::shared_ptr<ConnectionListener> listener;
};

/**
 * The native engine that runs the RTSP handshake and the RTP/FEC media transport
 */
class StreamEngine {
public:
  virtual ~StreamEngine() = default;

  /**
   * @throws lynx::Error if the transport can't be established
   */
  virtual void start(SessionContext &ctx) = 0;

  /**
   * @throws lynx::StateError when there's nothing to stop
   */
  virtual void stop() = 0;

  /**
   * Aborts a start() that is still in progress, can be called from any thread
   */
  virtual void interrupt() = 0;
};

} // namespace lynx::streaming
