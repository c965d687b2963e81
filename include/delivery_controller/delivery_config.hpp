#pragma once

#include <string>

#include "delivery_controller/delivery_effects.hpp"

/**
 * @brief Startup configuration of the delivery controller.
 *
 * Filled once from node parameters in on_configure and treated as immutable
 * afterwards. validate() throws std::invalid_argument on the first bad value.
 */
struct DeliveryConfig
{
  // Control loop
  double control_rate_hz{10.0};
  int feedback_divider{5};

  // Navigation
  std::string pickup_location{"kitchen"};
  double nav_pickup_timeout{300.0};
  double nav_dropoff_timeout{300.0};
  int nav_retry{3};
  double nav_dropoff_distance{5.0};
  int nav_return_retry{3};
  double nav_return_timeout{300.0};
  double nav_watchdog_grace{30.0};     // 0 disables the local watchdog
  double navigator_wait_s{5.0};

  // Behaviour
  bool require_operator_start{false};
  bool delivery_result_success{true};

  // Cues
  std::string resource_path;
  std::string sound_endpoint{"http://localhost:8106"};
  std::string confirm_sound{"kaku.wav"};
  std::string retry_sound{"moo.wav"};
  std::string navigation_failed_sound{"angry_cat.wav"};
  std::string order_received_sound{"kaku.wav"};
  std::string arrival_sound{"lion.wav"};
  std::string enjoy_meal_sound{"meow.wav"};

  void validate() const;

  const std::string & soundFile(Cue cue) const;

  // resource_path joined with soundFile(cue)
  std::string soundPath(Cue cue) const;
};
