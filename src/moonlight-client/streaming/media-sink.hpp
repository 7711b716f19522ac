#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <helpers/logger.hpp>
#include <mutex>
#include <optional>
#include <string>

namespace lynx::streaming {

/**
 * A chunk of decoder ready data, as delivered by the streaming engine
 */
struct MediaUnit {
  std::string data;
  bool key_frame = false;
};

/**
 * Video: a key frame makes everything that is still buffered useless, the decoder can restart from it
 */
struct VideoPolicy {
  static constexpr auto name = "VIDEO";

  static bool resets_queue(const MediaUnit &unit) {
    return unit.key_frame;
  }
};

/**
 * Audio: every sample counts, only drop when we run out of space
 */
struct AudioPolicy {
  static constexpr auto name = "AUDIO";

  static bool resets_queue(const MediaUnit &unit) {
    return false;
  }
};

/**
 * Bounded byte queue between the streaming engine (producer) and a consumer.
 *
 * The producer runs on the engine real time thread so it'll never be blocked:
 * when there's no space left the oldest units are dropped to make room for the new one.
 * The consumer blocks on read() until there's something to read or the sink is closed.
 *
 * @tparam Policy: decides when a new unit resets the whole queue, see VideoPolicy and AudioPolicy
 */
template <class Policy> class MediaSink {
public:
  explicit MediaSink(std::size_t capacity) : capacity(capacity) {}

  /**
   * Pushes a new unit, evicting the oldest ones if needed; never blocks.
   * Units bigger than the whole capacity are dropped.
   *
   * @return false if the unit has been discarded (sink closed or unit too big)
   */
  bool submit(MediaUnit unit) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (closed) {
      return false;
    }

    if (unit.data.empty()) {
      return true;
    }

    if (unit.data.size() > capacity) {
      logs::log(logs::warning,
                "[{}] dropping a unit of {} bytes, bigger than the sink capacity ({})",
                Policy::name,
                unit.data.size(),
                capacity);
      dropped++;
      return false;
    }

    if (Policy::resets_queue(unit) && !m_queue.empty()) {
      logs::log(logs::trace, "[{}] key frame received, discarding {} queued units", Policy::name, m_queue.size());
      reset();
    }

    while (size + unit.data.size() > capacity) {
      evict_oldest();
    }

    size += unit.data.size();
    m_queue.push_back(std::move(unit.data));
    m_cond.notify_all();
    return true;
  }

  /**
   * Blocks until at least one byte is available
   *
   * @param max_bytes: the maximum number of bytes that will be returned
   * @return the buffered data (up to max_bytes), an empty optional once the sink has been closed
   */
  std::optional<std::string> read(std::size_t max_bytes) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cond.wait(lock, [this]() { return closed || !m_queue.empty(); });

    if (closed) {
      return {};
    }

    std::string result;
    while (!m_queue.empty() && result.size() < max_bytes) {
      auto &front = m_queue.front();
      auto chunk = std::min(front.size() - front_offset, max_bytes - result.size());
      result.append(front, front_offset, chunk);
      front_offset += chunk;
      size -= chunk;
      if (front_offset == front.size()) {
        m_queue.pop_front();
        front_offset = 0;
      }
    }
    return result;
  }

  /**
   * Wakes up any blocked reader and discards everything that was buffered, it's safe to call this more than once
   */
  void close() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (closed) {
      return;
    }
    closed = true;
    reset();
    m_cond.notify_all();
  }

  /**
   * Drops everything that is currently buffered, the sink stays open
   */
  void clear() {
    std::unique_lock<std::mutex> lock(m_mutex);
    reset();
  }

  bool is_closed() const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return closed;
  }

  /**
   * @return how many bytes are waiting to be read
   */
  std::size_t buffered_bytes() const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return size;
  }

  /**
   * @return how many units have been evicted or discarded so far
   */
  std::size_t dropped_units() const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return dropped;
  }

  std::size_t max_size() const {
    return capacity;
  }

private:
  const std::size_t capacity;
  std::deque<std::string> m_queue;
  std::size_t front_offset = 0; // bytes of the front unit already consumed by read()
  std::size_t size = 0;
  std::size_t dropped = 0;
  bool closed = false;

  mutable std::mutex m_mutex;
  std::condition_variable m_cond;

  void evict_oldest() {
    size -= m_queue.front().size() - front_offset;
    m_queue.pop_front();
    front_offset = 0;
    dropped++;
  }

  void reset() {
    dropped += m_queue.size();
    m_queue.clear();
    front_offset = 0;
    size = 0;
  }
};

using VideoSink = MediaSink<VideoPolicy>;
using AudioSink = MediaSink<AudioPolicy>;

} // namespace lynx::streaming
