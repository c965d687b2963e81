#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <rclcpp/logger.hpp>
#include <rclcpp/time.hpp>

#include "delivery_controller/delivery_config.hpp"
#include "delivery_controller/delivery_effects.hpp"
#include "delivery_controller/robot_state.hpp"
#include "delivery_controller/shared_event_state.hpp"

/**
 * @brief Tick-driven delivery state machine.
 *
 * Single-writer: only tick() mutates the robot state, the in-flight
 * navigation request and the order bookkeeping. Event callbacks reach the
 * machine through SharedEventState only.
 *
 * Per tick, in this order:
 *  1. drain navigation progress, then outcomes, for the request in flight
 *  2. watchdog on the request in flight
 *  3. navigation failure forces Error (global interrupt)
 *  4. green press while in Error forces Initialization
 *  5. otherwise run the handler of the current state
 * At most one transition happens per tick.
 *
 * A request abandoned by the watchdog is cancelled but stays in flight until
 * the navigator reports its terminal outcome; no new request is issued
 * before that.
 */
class DeliveryStateMachine
{
public:
  DeliveryStateMachine(const DeliveryConfig & config, SharedEventState & events);

  std::vector<Effect> tick(const rclcpp::Time & now);

  RobotState state() const { return state_; }
  bool orderInProgress() const { return order_in_progress_; }
  bool navigationInFlight() const { return in_flight_.has_value(); }
  bool navigationFailed() const { return navigation_failed_; }
  const std::string & lastNavigationFeedback() const { return last_feedback_; }
  const std::string & activeDestination() const { return destination_; }

private:
  struct InFlight
  {
    NavigationRequest request;
    rclcpp::Time issued_at;
    bool abandoned{false};
  };

  void transitionTo(RobotState next);

  void drainNavigation(std::vector<Effect> & effects);
  void checkWatchdog(const rclcpp::Time & now, std::vector<Effect> & effects);
  void enterError(std::vector<Effect> & effects);

  void handleInitialization(const rclcpp::Time & now, std::vector<Effect> & effects);
  void handleGotoPickup(std::vector<Effect> & effects);
  void handleAtPickup(const rclcpp::Time & now, std::vector<Effect> & effects);
  void handleGotoDropoff(std::vector<Effect> & effects);
  void handleAtDropoff(const rclcpp::Time & now, std::vector<Effect> & effects);

  void requestNavigation(
    const rclcpp::Time & now,
    const std::string & location,
    int retry_budget,
    double timeout_s,
    double min_distance,
    std::vector<Effect> & effects);

  const DeliveryConfig config_;
  SharedEventState & events_;
  rclcpp::Logger logger_;

  RobotState state_{RobotState::Initialization};

  bool localization_requested_{false};
  bool navigation_finished_{false};
  bool navigation_failed_{false};
  bool failure_pending_{false};
  std::string failure_reason_;

  bool order_in_progress_{false};
  std::string destination_;

  std::optional<InFlight> in_flight_;
  std::uint64_t next_request_id_{1};
  std::string last_feedback_;
};
