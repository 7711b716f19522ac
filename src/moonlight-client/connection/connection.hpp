#pragma once

#include <cstddef>
#include <cstdint>
#include <events/events.hpp>
#include <memory>
#include <moonlight/protocol.hpp>
#include <mutex>
#include <rest/control-client.hpp>
#include <state/data-structures.hpp>
#include <streaming/engine.hpp>
#include <streaming/renderers.hpp>
#include <string_view>

namespace lynx::connection {

enum class State {
  Idle,
  Starting,
  Active,
  Stopping
};

std::string_view to_string(State state);

/**
 * @brief checks the requested stream against what the host is able to do
 *
 * @throws lynx::CapabilityError
 */
void check_capabilities(const moonlight::ServerInfo &info, const state::StreamConfiguration &cfg);

/**
 * Logs every engine callback and forwards it on the event bus
 */
class EventListener : public streaming::ConnectionListener {
public:
  explicit EventListener(std::shared_ptr<events::EventBusType> event_bus) : event_bus(std::move(event_bus)) {}

  void stage_starting(int stage) override;
  void stage_complete(int stage) override;
  void stage_failed(int stage, int error_code) override;
  void connection_started() override;
  void connection_terminated(int error_code) override;
  void connection_status_update(int status) override;
  void log_message(std::string_view message) override;
  void rumble(std::uint16_t controller_number, std::uint16_t low_freq_motor, std::uint16_t high_freq_motor) override;
  void rumble_triggers(std::uint16_t controller_number,
                       std::uint16_t left_trigger_motor,
                       std::uint16_t right_trigger_motor) override;
  void set_hdr_mode(bool enabled) override;
  void set_motion_event_state(std::uint16_t controller_number,
                              std::uint8_t motion_type,
                              std::uint16_t report_rate_hz) override;
  void set_controller_led(std::uint16_t controller_number, std::uint8_t r, std::uint8_t g, std::uint8_t b) override;

private:
  std::shared_ptr<events::EventBusType> event_bus;
};

/**
 * Owns the renderers that have been handed over to the streaming engine.
 *
 * Releasing it (or destroying it) stops the engine and closes the media sinks,
 * readers blocked on them will get an end of stream.
 */
class EngineRegistration {
public:
  EngineRegistration(std::shared_ptr<streaming::StreamEngine> engine, std::shared_ptr<streaming::SessionContext> ctx);
  ~EngineRegistration();

  EngineRegistration(const EngineRegistration &) = delete;
  EngineRegistration &operator=(const EngineRegistration &) = delete;

  /**
   * Safe to call more than once, only the first call stops the engine
   */
  void release();

  bool is_active() const;

  const streaming::SessionContext &context() const {
    return *ctx;
  }

  std::shared_ptr<streaming::VideoSink> video_sink() const {
    return ctx->video->video_sink();
  }

  std::shared_ptr<streaming::AudioSink> audio_sink() const {
    return ctx->audio->audio_sink();
  }

private:
  std::shared_ptr<streaming::StreamEngine> engine;
  std::shared_ptr<streaming::SessionContext> ctx;
  mutable std::mutex m_mutex;
  bool active = true;
};

/**
 * Sole owner of a streaming session: validates the request, launches the app and starts the engine.
 *
 * Idle -> Starting -> Active -> Stopping -> Idle
 */
class ConnectionOrchestrator {
public:
  ConnectionOrchestrator(std::shared_ptr<rest::ControlClient> client,
                         std::shared_ptr<streaming::StreamEngine> engine,
                         std::shared_ptr<events::EventBusType> event_bus,
                         std::size_t video_queue_bytes,
                         std::size_t audio_queue_bytes);

  /**
   * @throws lynx::AlreadyActiveError if a session has already been started
   * @throws lynx::NotPairedError if the host doesn't report us as paired
   * @throws lynx::CapabilityError before any change is made on the host
   * @throws lynx::Error any error coming from the host or the engine
   */
  std::shared_ptr<EngineRegistration> start(const moonlight::App &app, const state::StreamConfiguration &cfg);

  /**
   * Stops the engine (if running) and asks the host to quit the app.
   * It's safe to call this at any time, errors are only logged.
   * When a start() is still in progress it is only flagged: start() quits the app and throws StateError,
   * the state stays Stopping until then.
   */
  void stop();

  State current_state() const;

  /**
   * @return the registration of the running session, nullptr if none
   */
  std::shared_ptr<EngineRegistration> registration() const;

private:
  std::shared_ptr<rest::ControlClient> client;
  std::shared_ptr<streaming::StreamEngine> engine;
  std::shared_ptr<events::EventBusType> event_bus;
  std::size_t video_queue_bytes;
  std::size_t audio_queue_bytes;

  mutable std::mutex m_mutex;
  State state = State::Idle;
  std::shared_ptr<EngineRegistration> current_registration;

  void set_state(State new_state);
  bool is_starting() const;
  void quit_application(const moonlight::App &app);
  [[noreturn]] void abort_start(const moonlight::App &app);
  std::shared_ptr<streaming::SessionContext> negotiate(const moonlight::App &app,
                                                       const state::StreamConfiguration &cfg);
};

} // namespace lynx::connection
