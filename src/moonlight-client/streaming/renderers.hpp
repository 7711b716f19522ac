#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <streaming/engine.hpp>
#include <streaming/media-sink.hpp>
#include <string>
#include <string_view>

namespace lynx::streaming {

/**
 * Receives full frames from the streaming engine and pushes them down the video sink
 */
class VideoRenderer {
public:
  explicit VideoRenderer(std::shared_ptr<VideoSink> sink) : sink(std::move(sink)) {}

  /**
   * @return 0 on success, -1 if the resolution is too high for H.264, -3 if the format is unknown
   */
  int setup(int video_format, int width, int height, int fps);

  void start();
  void stop();

  /**
   * @brief drops anything still buffered, the sink stays open
   */
  void cleanup();

  /**
   * @return DR_OK, the unit is always accepted (the sink drops old frames on its own)
   */
  int submit(const DecodeUnit &unit);

  std::shared_ptr<VideoSink> video_sink() const {
    return sink;
  }

  /**
   * @return the mime type negotiated in setup(), empty before that
   */
  std::string mime_type() const;

private:
  std::shared_ptr<VideoSink> sink;
  mutable std::mutex m_mutex;
  std::string mime;
  int width = 0;
  int height = 0;
  int fps = 0;
};

/**
 * Receives Opus packets from the streaming engine and pushes them down the audio sink
 */
class AudioRenderer {
public:
  explicit AudioRenderer(std::shared_ptr<AudioSink> sink) : sink(std::move(sink)) {}

  /**
   * @return 0 on success, -1 if the channel count isn't mono, stereo, quad, 5.1 or 7.1
   */
  int init(int channel_count, int sample_rate, int samples_per_frame);

  void start();
  void stop();
  void cleanup();

  void play(std::string_view sample);

  std::shared_ptr<AudioSink> audio_sink() const {
    return sink;
  }

  /**
   * @return how long a single packet lasts, as computed in init()
   */
  std::chrono::milliseconds sample_duration() const;

private:
  std::shared_ptr<AudioSink> sink;
  mutable std::mutex m_mutex;
  std::chrono::milliseconds duration{0};
};

} // namespace lynx::streaming
