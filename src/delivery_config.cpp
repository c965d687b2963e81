#include "delivery_controller/delivery_config.hpp"

#include <stdexcept>

namespace
{

void require(bool condition, const std::string & what)
{
  if (!condition) {
    throw std::invalid_argument("invalid parameter: " + what);
  }
}

}  // namespace

void DeliveryConfig::validate() const
{
  require(control_rate_hz > 0.0, "control_rate_hz must be > 0");
  require(feedback_divider >= 1, "feedback_divider must be >= 1");
  require(!pickup_location.empty(), "pickup_location must not be empty");
  require(nav_pickup_timeout > 0.0, "nav_pickup_timeout must be > 0");
  require(nav_dropoff_timeout > 0.0, "nav_dropoff_timeout must be > 0");
  require(nav_return_timeout > 0.0, "nav_return_timeout must be > 0");
  require(nav_retry >= 0, "nav_retry must be >= 0");
  require(nav_return_retry >= 0, "nav_return_retry must be >= 0");
  require(nav_dropoff_distance >= 0.0, "nav_dropoff_distance must be >= 0");
  require(nav_watchdog_grace >= 0.0, "nav_watchdog_grace must be >= 0");
  require(navigator_wait_s >= 0.0, "navigator_wait_s must be >= 0");
  require(!sound_endpoint.empty(), "sound_endpoint must not be empty");
}

const std::string & DeliveryConfig::soundFile(Cue cue) const
{
  switch (cue) {
    case Cue::Confirmation:     return confirm_sound;
    case Cue::Retry:            return retry_sound;
    case Cue::NavigationFailed: return navigation_failed_sound;
    case Cue::OrderReceived:    return order_received_sound;
    case Cue::Arrival:          return arrival_sound;
    case Cue::EnjoyMeal:        return enjoy_meal_sound;
  }
  return confirm_sound;
}

std::string DeliveryConfig::soundPath(Cue cue) const
{
  const std::string & file = soundFile(cue);
  if (resource_path.empty()) {
    return file;
  }
  if (resource_path.back() == '/') {
    return resource_path + file;
  }
  return resource_path + "/" + file;
}
