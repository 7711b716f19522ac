#pragma once

#include <cstdint>
#include <eventbus/event_bus.hpp>
#include <immer/box.hpp>
#include <string>

namespace lynx::events {

/**
 * Progress of the streaming engine while it's bringing up the connection
 */
struct StageEvent {
  enum STATUS {
    STARTING,
    COMPLETE,
    FAILED
  };

  int stage;
  STATUS status;
  int error_code = 0;
};

struct ConnectionStartedEvent {};

struct ConnectionTerminatedEvent {
  int error_code;
};

/**
 * 0 means OK, 1 means the connection is poor
 */
struct ConnectionStatusEvent {
  int status;
};

struct RumbleEvent {
  std::uint16_t controller_number;
  std::uint16_t low_freq_motor;
  std::uint16_t high_freq_motor;
};

struct RumbleTriggersEvent {
  std::uint16_t controller_number;
  std::uint16_t left_trigger_motor;
  std::uint16_t right_trigger_motor;
};

struct HdrModeEvent {
  bool enabled;
};

struct MotionEventStateEvent {
  std::uint16_t controller_number;
  std::uint8_t motion_type;
  std::uint16_t report_rate_hz;
};

struct ControllerLEDEvent {
  std::uint16_t controller_number;
  std::uint8_t r;
  std::uint8_t g;
  std::uint8_t b;
};

using EventBusType = dp::event_bus<immer::box<StageEvent>,
                                   immer::box<ConnectionStartedEvent>,
                                   immer::box<ConnectionTerminatedEvent>,
                                   immer::box<ConnectionStatusEvent>,
                                   immer::box<RumbleEvent>,
                                   immer::box<RumbleTriggersEvent>,
                                   immer::box<HdrModeEvent>,
                                   immer::box<MotionEventStateEvent>,
                                   immer::box<ControllerLEDEvent>>;

} // namespace lynx::events
