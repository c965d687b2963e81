#pragma once

#include <cstdint>
#include <string>

#include "delivery_controller/robot_state.hpp"

// Wire values of the indicator colour topics.
enum class LedColor : std::uint8_t
{
  Off = 0,
  Green = 1,
  Orange = 2,
  Red = 3
};

struct IndicatorFrame
{
  LedColor led1{LedColor::Off};
  LedColor led2{LedColor::Off};
};

/**
 * @brief Two-phase alternating indicator pattern.
 *
 * Phase 1 lights led2, phase 2 lights led1. Red while the error bit is set,
 * green otherwise. Pure function, no emission.
 */
IndicatorFrame computeIndicators(bool error, unsigned phase);

inline IndicatorFrame computeIndicators(RobotState state, unsigned phase)
{
  return computeIndicators(state == RobotState::Error, phase);
}

std::string formatNavigationProgress(double distance, const std::string & message);

// Order feedback text: "Status : <STATE>  [<navigation progress>]"
std::string formatOrderProgress(RobotState state, const std::string & navigation_progress);

/**
 * @brief Sub-rate divider for the control loop.
 *
 * advance() is called once per tick and returns true every `divider` ticks.
 * The counter starts at 2, so with the default divider of 5 the first
 * emission is on the fourth tick. Each emission flips the indicator phase
 * between 1 and 2, starting at 1.
 */
class FeedbackTicker
{
public:
  explicit FeedbackTicker(int divider);

  bool advance();

  unsigned phase() const { return phase_; }

private:
  int divider_;
  int counter_{2};
  unsigned phase_{2};
};
