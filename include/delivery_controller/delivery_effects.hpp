#pragma once

#include <cstdint>
#include <string>

// Audible cues. One sound file per cue, see DeliveryConfig::soundFile().
enum class Cue : std::uint8_t
{
  Confirmation,
  Retry,
  NavigationFailed,
  OrderReceived,
  Arrival,
  EnjoyMeal
};

inline const char * toString(Cue cue)
{
  switch (cue) {
    case Cue::Confirmation:     return "confirmation";
    case Cue::Retry:            return "retry";
    case Cue::NavigationFailed: return "navigation_failed";
    case Cue::OrderReceived:    return "order_received";
    case Cue::Arrival:          return "arrival";
    case Cue::EnjoyMeal:        return "enjoy_meal";
  }
  return "unknown";
}

enum class ApproachMode : std::uint8_t
{
  Near,
  On
};

struct NavigationRequest
{
  std::uint64_t id{0};
  std::string target_location;
  ApproachMode approach_mode{ApproachMode::On};
  int retry_budget{0};
  double timeout_s{0.0};
  double min_approach_distance{0.0};
};

/**
 * @brief Side effect requested by one state machine tick.
 *
 * The machine never talks to hardware or services itself; the control loop
 * executes the effects in order against the navigation client, localization
 * publisher, cue player and order gateway.
 */
struct Effect
{
  enum class Kind {
    RequestLocalization,
    RequestNavigation,
    CancelNavigation,
    PlayCue,
    ReportOrderResult
  };

  Kind kind{Kind::PlayCue};
  NavigationRequest navigation;
  Cue cue{Cue::Confirmation};
  bool success{false};
  std::string message;

  static Effect requestLocalization()
  {
    Effect e;
    e.kind = Kind::RequestLocalization;
    return e;
  }

  static Effect requestNavigation(const NavigationRequest & request)
  {
    Effect e;
    e.kind = Kind::RequestNavigation;
    e.navigation = request;
    return e;
  }

  static Effect cancelNavigation(const NavigationRequest & request)
  {
    Effect e;
    e.kind = Kind::CancelNavigation;
    e.navigation = request;
    return e;
  }

  static Effect playCue(Cue cue)
  {
    Effect e;
    e.kind = Kind::PlayCue;
    e.cue = cue;
    return e;
  }

  static Effect reportOrderResult(bool success, const std::string & message)
  {
    Effect e;
    e.kind = Kind::ReportOrderResult;
    e.success = success;
    e.message = message;
    return e;
  }
};
