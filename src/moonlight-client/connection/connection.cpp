#include <connection/connection.hpp>
#include <crypto/crypto.hpp>
#include <exceptions/errors.hpp>
#include <helpers/logger.hpp>
#include <session/session.hpp>

namespace lynx::connection {

using namespace moonlight;

constexpr int REMOTE_PACKET_SIZE = 1024;
constexpr int MAX_RESOLUTION = 4096;
constexpr int MAX_WIDTH_WITHOUT_4K = 2160;
constexpr int REMOTE_INPUT_KEY_SIZE = 16;

std::string_view to_string(State state) {
  switch (state) {
  case State::Idle:
    return "IDLE";
  case State::Starting:
    return "STARTING";
  case State::Active:
    return "ACTIVE";
  case State::Stopping:
    return "STOPPING";
  }
  return "UNKNOWN";
}

void check_capabilities(const ServerInfo &info, const state::StreamConfiguration &cfg) {
  if (cfg.hdr_requested() && (info.server_codec_mode_support & SCM_HDR_CAPABLE) == 0) {
    throw CapabilityError("Host does not support HDR streaming");
  }

  if (cfg.width > MAX_RESOLUTION || cfg.height > MAX_RESOLUTION) {
    if ((info.server_codec_mode_support & SCM_HEVC_MAIN10) == 0) {
      throw CapabilityError("Host does not support resolutions above 4K pixels");
    }
    if ((cfg.supported_video_formats & ~MASK_H264) == 0) {
      throw CapabilityError("Host does not support resolutions above 4K pixels for H.264 streams");
    }
  }

  if (cfg.width > MAX_WIDTH_WITHOUT_4K && !info.supports_4k()) {
    throw CapabilityError(fmt::format("Host (GFE {}) does not support 4K streaming", info.gfe_version));
  }
}

/*
 * EventListener
 */

void EventListener::stage_starting(int stage) {
  logs::log(logs::debug, "[CONNECTION] stage {} starting", stage);
  event_bus->fire_event(immer::box<events::StageEvent>(
      events::StageEvent{.stage = stage, .status = events::StageEvent::STARTING}));
}

void EventListener::stage_complete(int stage) {
  logs::log(logs::debug, "[CONNECTION] stage {} complete", stage);
  event_bus->fire_event(immer::box<events::StageEvent>(
      events::StageEvent{.stage = stage, .status = events::StageEvent::COMPLETE}));
}

void EventListener::stage_failed(int stage, int error_code) {
  logs::log(logs::error, "[CONNECTION] stage {} failed, error code: {}", stage, error_code);
  event_bus->fire_event(immer::box<events::StageEvent>(
      events::StageEvent{.stage = stage, .status = events::StageEvent::FAILED, .error_code = error_code}));
}

void EventListener::connection_started() {
  logs::log(logs::info, "[CONNECTION] connection started");
  event_bus->fire_event(immer::box<events::ConnectionStartedEvent>(events::ConnectionStartedEvent{}));
}

void EventListener::connection_terminated(int error_code) {
  logs::log(logs::info, "[CONNECTION] connection terminated, error code: {}", error_code);
  event_bus->fire_event(
      immer::box<events::ConnectionTerminatedEvent>(events::ConnectionTerminatedEvent{.error_code = error_code}));
}

void EventListener::connection_status_update(int status) {
  logs::log(logs::info, "[CONNECTION] connection status: {}", status == 0 ? "OK" : "POOR");
  event_bus->fire_event(immer::box<events::ConnectionStatusEvent>(events::ConnectionStatusEvent{.status = status}));
}

void EventListener::log_message(std::string_view message) {
  logs::log(logs::debug, "[ENGINE] {}", message);
}

void EventListener::rumble(std::uint16_t controller_number, std::uint16_t low_freq_motor, std::uint16_t high_freq_motor) {
  logs::log(logs::trace,
            "[CONNECTION] rumble controller {} low: {:04x} high: {:04x}",
            controller_number,
            low_freq_motor,
            high_freq_motor);
  event_bus->fire_event(immer::box<events::RumbleEvent>(events::RumbleEvent{.controller_number = controller_number,
                                                                            .low_freq_motor = low_freq_motor,
                                                                            .high_freq_motor = high_freq_motor}));
}

void EventListener::rumble_triggers(std::uint16_t controller_number,
                                    std::uint16_t left_trigger_motor,
                                    std::uint16_t right_trigger_motor) {
  logs::log(logs::trace,
            "[CONNECTION] rumble triggers controller {} left: {:04x} right: {:04x}",
            controller_number,
            left_trigger_motor,
            right_trigger_motor);
  event_bus->fire_event(immer::box<events::RumbleTriggersEvent>(
      events::RumbleTriggersEvent{.controller_number = controller_number,
                                  .left_trigger_motor = left_trigger_motor,
                                  .right_trigger_motor = right_trigger_motor}));
}

void EventListener::set_hdr_mode(bool enabled) {
  logs::log(logs::info, "[CONNECTION] HDR mode: {}", enabled);
  event_bus->fire_event(immer::box<events::HdrModeEvent>(events::HdrModeEvent{.enabled = enabled}));
}

void EventListener::set_motion_event_state(std::uint16_t controller_number,
                                           std::uint8_t motion_type,
                                           std::uint16_t report_rate_hz) {
  logs::log(logs::debug,
            "[CONNECTION] motion events controller {} type: {} rate: {}Hz",
            controller_number,
            motion_type,
            report_rate_hz);
  event_bus->fire_event(immer::box<events::MotionEventStateEvent>(
      events::MotionEventStateEvent{.controller_number = controller_number,
                                    .motion_type = motion_type,
                                    .report_rate_hz = report_rate_hz}));
}

void EventListener::set_controller_led(std::uint16_t controller_number, std::uint8_t r, std::uint8_t g, std::uint8_t b) {
  logs::log(logs::debug, "[CONNECTION] controller {} LED: #{:02x}{:02x}{:02x}", controller_number, r, g, b);
  event_bus->fire_event(immer::box<events::ControllerLEDEvent>(
      events::ControllerLEDEvent{.controller_number = controller_number, .r = r, .g = g, .b = b}));
}

/*
 * EngineRegistration
 */

EngineRegistration::EngineRegistration(std::shared_ptr<streaming::StreamEngine> engine,
                                       std::shared_ptr<streaming::SessionContext> ctx)
    : engine(std::move(engine)), ctx(std::move(ctx)) {}

EngineRegistration::~EngineRegistration() {
  release();
}

void EngineRegistration::release() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!active) {
      return;
    }
    active = false;
  }

  logs::log(logs::debug, "[CONNECTION] stopping the streaming engine");
  engine->interrupt();
  try {
    engine->stop();
  } catch (const StateError &e) {
    logs::log(logs::debug, "[CONNECTION] nothing to stop: {}", e.what());
  } catch (const std::exception &e) {
    logs::log(logs::warning, "[CONNECTION] error while stopping the streaming engine: {}", e.what());
  }

  ctx->video->stop();
  ctx->audio->stop();
  ctx->video->video_sink()->close();
  ctx->audio->audio_sink()->close();
}

bool EngineRegistration::is_active() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return active;
}

/*
 * ConnectionOrchestrator
 */

ConnectionOrchestrator::ConnectionOrchestrator(std::shared_ptr<rest::ControlClient> client,
                                               std::shared_ptr<streaming::StreamEngine> engine,
                                               std::shared_ptr<events::EventBusType> event_bus,
                                               std::size_t video_queue_bytes,
                                               std::size_t audio_queue_bytes)
    : client(std::move(client)), engine(std::move(engine)), event_bus(std::move(event_bus)),
      video_queue_bytes(video_queue_bytes), audio_queue_bytes(audio_queue_bytes) {}

void ConnectionOrchestrator::set_state(State new_state) {
  std::lock_guard<std::mutex> lock(m_mutex);
  logs::log(logs::trace, "[CONNECTION] {} -> {}", to_string(state), to_string(new_state));
  state = new_state;
}

State ConnectionOrchestrator::current_state() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return state;
}

std::shared_ptr<EngineRegistration> ConnectionOrchestrator::registration() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return current_registration;
}

std::shared_ptr<streaming::SessionContext> ConnectionOrchestrator::negotiate(const App &app,
                                                                             const state::StreamConfiguration &cfg) {
  auto info = client->capability_info();
  if (!info.is_paired()) {
    throw NotPairedError(fmt::format("Not paired with {}", client->address().host));
  }

  check_capabilities(info, cfg);
  if (!is_starting()) {
    throw StateError(fmt::format("Session for {} stopped before launch", app.title));
  }

  auto packet_size = cfg.streaming_remotely == STREAM_CFG_REMOTE ? REMOTE_PACKET_SIZE : cfg.packet_size;
  auto remote_input = RemoteInputKey{.key = crypto::random(REMOTE_INPUT_KEY_SIZE),
                                     .iv = crypto::random(REMOTE_INPUT_KEY_SIZE)};

  auto session_url = client->launch_application(LaunchRequest{.app_id = app.id,
                                                              .width = cfg.width,
                                                              .height = cfg.height,
                                                              .refresh_rate = cfg.launch_refresh_rate,
                                                              .hdr = cfg.hdr_requested(),
                                                              .play_local_audio = cfg.play_local_audio,
                                                              .audio = cfg.audio,
                                                              .gamepads = cfg.gamepads,
                                                              .persist_gamepads = cfg.persist_gamepads,
                                                              .remote_input = remote_input});
  logs::log(logs::info, "[CONNECTION] {} launched, session: {}", app.title, session_url);

  auto video_sink = std::make_shared<streaming::VideoSink>(video_queue_bytes);
  auto audio_sink = std::make_shared<streaming::AudioSink>(audio_queue_bytes);

  return std::make_shared<streaming::SessionContext>(streaming::SessionContext{
      .session = {.address = client->address(),
                  .app_version = info.app_version,
                  .gfe_version = info.gfe_version,
                  .server_codec_mode_support = info.server_codec_mode_support,
                  .session_url = session_url,
                  .packet_size = packet_size,
                  .streaming_mode = cfg.streaming_remotely},
      .stream = cfg,
      .remote_input = remote_input,
      .rtsp = std::make_shared<session::SessionClient>(session::parse_session_url(session_url)),
      .video = std::make_shared<streaming::VideoRenderer>(video_sink),
      .audio = std::make_shared<streaming::AudioRenderer>(audio_sink),
      .listener = std::make_shared<EventListener>(event_bus)});
}

std::shared_ptr<EngineRegistration> ConnectionOrchestrator::start(const App &app,
                                                                  const state::StreamConfiguration &cfg) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (state != State::Idle) {
      throw AlreadyActiveError(fmt::format("Can't start a new session, current state: {}", to_string(state)));
    }
    state = State::Starting;
  }

  logs::log(logs::info, "[CONNECTION] starting {} at {}x{}@{}", app.title, cfg.width, cfg.height, cfg.fps);

  std::shared_ptr<streaming::SessionContext> ctx;
  try {
    ctx = negotiate(app, cfg);
  } catch (const std::exception &e) {
    logs::log(logs::error, "[CONNECTION] unable to launch {}: {}", app.title, e.what());
    set_state(State::Idle);
    throw;
  }

  auto registration = std::make_shared<EngineRegistration>(engine, ctx);
  if (!is_starting()) {
    abort_start(app);
  }

  try {
    engine->start(*ctx);
  } catch (const std::exception &e) {
    logs::log(logs::error, "[CONNECTION] unable to start the streaming engine: {}", e.what());
    registration->release();
    quit_application(app);
    set_state(State::Idle);
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (state == State::Starting) {
      current_registration = registration;
      state = State::Active;
      return registration;
    }
  }

  registration->release();
  abort_start(app);
}

void ConnectionOrchestrator::stop() {
  std::shared_ptr<EngineRegistration> registration;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (state == State::Stopping) {
      return;
    }
    if (state == State::Starting) {
      /* The running start() owns the session, it will quit the app and go back to Idle */
      state = State::Stopping;
      logs::log(logs::info, "[CONNECTION] stop requested while starting");
      engine->interrupt();
      return;
    }
    state = State::Stopping;
    registration = std::move(current_registration);
  }

  logs::log(logs::info, "[CONNECTION] stopping");
  if (registration) {
    registration->release();
  } else {
    engine->interrupt();
    try {
      engine->stop();
    } catch (const StateError &e) {
      logs::log(logs::debug, "[CONNECTION] nothing to stop: {}", e.what());
    } catch (const std::exception &e) {
      logs::log(logs::warning, "[CONNECTION] error while stopping the streaming engine: {}", e.what());
    }
  }

  try {
    client->quit_application();
  } catch (const Error &e) {
    logs::log(logs::warning, "[CONNECTION] unable to quit the running app: {}", e.what());
  }

  set_state(State::Idle);
}

bool ConnectionOrchestrator::is_starting() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return state == State::Starting;
}

void ConnectionOrchestrator::quit_application(const App &app) {
  try {
    client->quit_application();
  } catch (const Error &e) {
    logs::log(logs::warning, "[CONNECTION] unable to quit {}: {}", app.title, e.what());
  }
}

void ConnectionOrchestrator::abort_start(const App &app) {
  logs::log(logs::info, "[CONNECTION] {} stopped while starting", app.title);
  quit_application(app);
  set_state(State::Idle);
  throw StateError(fmt::format("Session for {} stopped while starting", app.title));
}

} // namespace lynx::connection
