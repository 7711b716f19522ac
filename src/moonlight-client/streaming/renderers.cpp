#include <helpers/logger.hpp>
#include <moonlight/data-structures.hpp>
#include <streaming/renderers.hpp>

namespace lynx::streaming {

using namespace moonlight;

int VideoRenderer::setup(int video_format, int width, int height, int fps) {
  std::string mime_type;
  if ((video_format & MASK_H264) != 0) {
    if (width > 4096 || height > 4096) {
      logs::log(logs::error, "[VIDEO] {}x{} is too high for an H.264 decoder", width, height);
      return -1;
    }
    mime_type = "video/avc";
  } else if ((video_format & MASK_H265) != 0) {
    mime_type = "video/hevc";
  } else if ((video_format & MASK_AV1) != 0) {
    mime_type = "video/av01";
  } else {
    logs::log(logs::error, "[VIDEO] unsupported video format: {:#x}", video_format);
    return -3;
  }

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    this->mime = mime_type;
    this->width = width;
    this->height = height;
    this->fps = fps;
  }

  logs::log(logs::info, "[VIDEO] setup {}x{}@{} {}", width, height, fps, mime_type);
  return 0;
}

void VideoRenderer::start() {
  logs::log(logs::debug, "[VIDEO] started");
}

void VideoRenderer::stop() {
  logs::log(logs::debug, "[VIDEO] stopped");
}

void VideoRenderer::cleanup() {
  sink->clear();
  logs::log(logs::debug, "[VIDEO] cleaned up");
}

int VideoRenderer::submit(const DecodeUnit &unit) {
  MediaUnit media_unit{.key_frame = unit.frame_type == FRAME_TYPE_IDR};
  media_unit.data.reserve(unit.size());
  for (const auto &buffer : unit.buffers) {
    media_unit.data.append(buffer.data);
  }

  if (media_unit.key_frame) {
    logs::log(logs::trace, "[VIDEO] received IDR frame {}", unit.frame_number);
  }
  sink->submit(std::move(media_unit));
  return DR_OK;
}

std::string VideoRenderer::mime_type() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return mime;
}

int AudioRenderer::init(int channel_count, int sample_rate, int samples_per_frame) {
  std::string layout;
  switch (channel_count) {
  case 1:
    layout = "mono";
    break;
  case 2:
    layout = "stereo";
    break;
  case 4:
    layout = "quad";
    break;
  case 6:
    layout = "5.1";
    break;
  case 8:
    layout = "7.1";
    break;
  default:
    logs::log(logs::error, "[AUDIO] unsupported channel count: {}", channel_count);
    return -1;
  }

  if (sample_rate <= 0) {
    logs::log(logs::error, "[AUDIO] invalid sample rate: {}", sample_rate);
    return -1;
  }

  auto duration_ms = std::chrono::milliseconds((samples_per_frame * 1000) / sample_rate);
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    duration = duration_ms;
  }

  logs::log(logs::info, "[AUDIO] init {} {}Hz, {}ms per packet", layout, sample_rate, duration_ms.count());
  return 0;
}

void AudioRenderer::start() {
  logs::log(logs::debug, "[AUDIO] started");
}

void AudioRenderer::stop() {
  logs::log(logs::debug, "[AUDIO] stopped");
}

void AudioRenderer::cleanup() {
  sink->clear();
  logs::log(logs::debug, "[AUDIO] cleaned up");
}

void AudioRenderer::play(std::string_view sample) {
  sink->submit(MediaUnit{.data = std::string(sample)});
}

std::chrono::milliseconds AudioRenderer::sample_duration() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return duration;
}

} // namespace lynx::streaming
