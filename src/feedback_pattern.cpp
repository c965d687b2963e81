#include "delivery_controller/feedback_pattern.hpp"

#include <algorithm>
#include <sstream>

IndicatorFrame computeIndicators(bool error, unsigned phase)
{
  const LedColor on = error ? LedColor::Red : LedColor::Green;

  IndicatorFrame frame;
  if (phase == 1) {
    frame.led1 = LedColor::Off;
    frame.led2 = on;
  } else {
    frame.led1 = on;
    frame.led2 = LedColor::Off;
  }
  return frame;
}

std::string formatNavigationProgress(double distance, const std::string & message)
{
  std::ostringstream out;
  out << "Distance : " << distance << ", Message : " << message;
  return out.str();
}

std::string formatOrderProgress(RobotState state, const std::string & navigation_progress)
{
  return std::string("Status : ") + toString(state) + "  [" + navigation_progress + "]";
}

FeedbackTicker::FeedbackTicker(int divider)
: divider_(std::max(divider, 1))
{
}

bool FeedbackTicker::advance()
{
  counter_ = (counter_ % divider_) + 1;
  if (counter_ != 1) {
    return false;
  }

  phase_ = (phase_ % 2) + 1;
  return true;
}
