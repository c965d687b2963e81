#pragma once

#include <cstdint>

enum class RobotState : std::uint8_t
{
  Initialization,
  GotoPickup,
  AtPickup,
  GotoDropoff,
  AtDropoff,
  Error
};

inline const char * toString(RobotState state)
{
  switch (state) {
    case RobotState::Initialization: return "INITIALIZATION";
    case RobotState::GotoPickup:     return "GOTO_PICKUP";
    case RobotState::AtPickup:       return "AT_PICKUP";
    case RobotState::GotoDropoff:    return "GOTO_DROPOFF";
    case RobotState::AtDropoff:      return "AT_DROPOFF";
    case RobotState::Error:          return "ERROR";
  }
  return "UNKNOWN";
}
