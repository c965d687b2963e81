#include "delivery_controller/delivery_state_machine.hpp"

#include <rclcpp/logging.hpp>

#include "delivery_controller/feedback_pattern.hpp"

DeliveryStateMachine::DeliveryStateMachine(
  const DeliveryConfig & config, SharedEventState & events)
: config_(config),
  events_(events),
  logger_(rclcpp::get_logger("delivery_state_machine"))
{
  if (config_.require_operator_start) {
    // Hold until the operator presses green, as after a failure.
    state_ = RobotState::Error;
    RCLCPP_INFO(logger_, "Waiting for operator start (green button)");
  }
  events_.publishMachineView(state_, order_in_progress_);
}

// ============================================================
// Tick
// ============================================================

std::vector<Effect> DeliveryStateMachine::tick(const rclcpp::Time & now)
{
  std::vector<Effect> effects;

  drainNavigation(effects);
  checkWatchdog(now, effects);

  if (failure_pending_) {
    failure_pending_ = false;
    if (state_ != RobotState::Error) {
      enterError(effects);
    }
  } else if (state_ == RobotState::Error) {
    if (events_.takeReinitRequest()) {
      transitionTo(RobotState::Initialization);
    }
  } else {
    switch (state_) {
      case RobotState::Initialization:
        handleInitialization(now, effects);
        break;
      case RobotState::GotoPickup:
        handleGotoPickup(effects);
        break;
      case RobotState::AtPickup:
        handleAtPickup(now, effects);
        break;
      case RobotState::GotoDropoff:
        handleGotoDropoff(effects);
        break;
      case RobotState::AtDropoff:
        handleAtDropoff(now, effects);
        break;
      case RobotState::Error:
        break;
    }
  }

  events_.publishMachineView(state_, order_in_progress_);
  return effects;
}

void DeliveryStateMachine::transitionTo(RobotState next)
{
  RCLCPP_INFO(logger_, "State %s -> %s", toString(state_), toString(next));

  if (state_ == RobotState::Error) {
    navigation_failed_ = false;
    failure_reason_.clear();
  }
  if (next == RobotState::Initialization) {
    localization_requested_ = false;
  }
  state_ = next;
}

// ============================================================
// Navigation bookkeeping
// ============================================================

void DeliveryStateMachine::drainNavigation(std::vector<Effect> & effects)
{
  auto updates = events_.takeNavigationUpdates();

  const auto & feedback = updates.feedback;
  if (feedback && in_flight_ && !in_flight_->abandoned &&
      in_flight_->request.id == feedback->request_id)
  {
    last_feedback_ = formatNavigationProgress(feedback->distance, feedback->message);
    RCLCPP_DEBUG(logger_, "Navigator : %s", last_feedback_.c_str());

    if (feedback->retry) {
      RCLCPP_INFO(logger_, "Navigator is retrying");
      effects.push_back(Effect::playCue(Cue::Retry));
    }
  }

  for (const auto & outcome : updates.outcomes) {
    if (!in_flight_ || in_flight_->request.id != outcome.request_id) {
      RCLCPP_DEBUG(logger_, "Dropping outcome of stale navigation request %lu",
                   static_cast<unsigned long>(outcome.request_id));
      continue;
    }

    if (in_flight_->abandoned) {
      RCLCPP_INFO(logger_, "Abandoned navigation request %lu resolved: %s",
                  static_cast<unsigned long>(outcome.request_id), outcome.message.c_str());
      in_flight_.reset();
      continue;
    }

    RCLCPP_INFO(logger_, "Navigator result : %s, Message : %s",
                outcome.success ? "True" : "False", outcome.message.c_str());

    in_flight_.reset();
    if (outcome.success) {
      navigation_finished_ = true;
    } else {
      failure_pending_ = true;
      failure_reason_ = outcome.message;
    }
  }
}

void DeliveryStateMachine::checkWatchdog(
  const rclcpp::Time & now, std::vector<Effect> & effects)
{
  if (!in_flight_ || in_flight_->abandoned || config_.nav_watchdog_grace <= 0.0) {
    return;
  }

  const double limit_s = in_flight_->request.timeout_s + config_.nav_watchdog_grace;
  const double age_s = (now - in_flight_->issued_at).seconds();
  if (age_s <= limit_s) {
    return;
  }

  RCLCPP_ERROR(logger_, "Navigation to '%s' unresolved after %.1f s, cancelling request %lu",
               in_flight_->request.target_location.c_str(), age_s,
               static_cast<unsigned long>(in_flight_->request.id));

  failure_reason_ = "navigation to '" + in_flight_->request.target_location + "' timed out";
  failure_pending_ = true;
  in_flight_->abandoned = true;
  effects.push_back(Effect::cancelNavigation(in_flight_->request));
}

void DeliveryStateMachine::enterError(std::vector<Effect> & effects)
{
  RCLCPP_ERROR(logger_, "Navigation failed in %s: %s",
               toString(state_), failure_reason_.c_str());

  transitionTo(RobotState::Error);
  navigation_failed_ = true;
  navigation_finished_ = false;

  effects.push_back(Effect::playCue(Cue::NavigationFailed));

  if (order_in_progress_) {
    order_in_progress_ = false;
    destination_.clear();
    effects.push_back(
      Effect::reportOrderResult(false, "Delivery failed: " + failure_reason_));
  }
}

void DeliveryStateMachine::requestNavigation(
  const rclcpp::Time & now,
  const std::string & location,
  int retry_budget,
  double timeout_s,
  double min_distance,
  std::vector<Effect> & effects)
{
  NavigationRequest request;
  request.id = next_request_id_++;
  request.target_location = location;
  request.approach_mode = ApproachMode::On;
  request.retry_budget = retry_budget;
  request.timeout_s = timeout_s;
  request.min_approach_distance = min_distance;

  RCLCPP_INFO(logger_, "Navigation request %lu: '%s' retry=%d timeout=%.1f distance=%.2f",
              static_cast<unsigned long>(request.id), location.c_str(),
              retry_budget, timeout_s, min_distance);

  in_flight_ = InFlight{request, now};
  navigation_finished_ = false;
  last_feedback_.clear();

  effects.push_back(Effect::requestNavigation(request));
}

// ============================================================
// State handlers
// ============================================================

void DeliveryStateMachine::handleInitialization(
  const rclcpp::Time & now, std::vector<Effect> & effects)
{
  if (!localization_requested_) {
    // A localized signal from before this request does not count.
    events_.takeLocalized();
    localization_requested_ = true;

    effects.push_back(Effect::requestLocalization());
    effects.push_back(Effect::playCue(Cue::Confirmation));
    RCLCPP_INFO(logger_, "Localization request sent");
    return;
  }

  // Wait for a request abandoned before the last failure to resolve.
  if (in_flight_) {
    return;
  }

  if (!events_.takeLocalized()) {
    return;
  }

  RCLCPP_INFO(logger_, "Robot localized, moving to '%s'", config_.pickup_location.c_str());
  localization_requested_ = false;

  requestNavigation(
    now, config_.pickup_location, config_.nav_retry,
    config_.nav_pickup_timeout, 0.0, effects);
  transitionTo(RobotState::GotoPickup);
}

void DeliveryStateMachine::handleGotoPickup(std::vector<Effect> & effects)
{
  if (!navigation_finished_) {
    return;
  }
  navigation_finished_ = false;

  transitionTo(RobotState::AtPickup);

  if (order_in_progress_) {
    order_in_progress_ = false;
    destination_.clear();
    effects.push_back(
      Effect::reportOrderResult(config_.delivery_result_success, "Delivery Success!"));
  }

  effects.push_back(Effect::playCue(Cue::Arrival));
}

void DeliveryStateMachine::handleAtPickup(
  const rclcpp::Time & now, std::vector<Effect> & effects)
{
  auto order = events_.takeOrderRequest();
  if (!order) {
    return;
  }

  order_in_progress_ = true;
  destination_ = order->destination;

  requestNavigation(
    now, destination_, config_.nav_retry,
    config_.nav_dropoff_timeout, config_.nav_dropoff_distance, effects);
  transitionTo(RobotState::GotoDropoff);

  effects.push_back(Effect::playCue(Cue::OrderReceived));
}

void DeliveryStateMachine::handleGotoDropoff(std::vector<Effect> & effects)
{
  if (!navigation_finished_) {
    return;
  }
  navigation_finished_ = false;

  transitionTo(RobotState::AtDropoff);
  effects.push_back(Effect::playCue(Cue::Arrival));
}

void DeliveryStateMachine::handleAtDropoff(
  const rclcpp::Time & now, std::vector<Effect> & effects)
{
  if (!events_.takeConfirmationFlag()) {
    return;
  }

  RCLCPP_INFO(logger_, "Customer confirmed, moving to '%s'", config_.pickup_location.c_str());
  effects.push_back(Effect::playCue(Cue::EnjoyMeal));

  requestNavigation(
    now, config_.pickup_location, config_.nav_return_retry,
    config_.nav_return_timeout, 0.0, effects);
  transitionTo(RobotState::GotoPickup);
}
