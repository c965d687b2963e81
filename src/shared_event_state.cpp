#include "delivery_controller/shared_event_state.hpp"

#include <utility>

#include <rclcpp/logging.hpp>

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("shared_event_state");
}

}  // namespace

void SharedEventState::setGreenEdge()
{
  std::lock_guard<std::mutex> lock(mutex_);

  switch (observed_state_) {
    case RobotState::Error:
      reinit_requested_ = true;
      RCLCPP_INFO(logger(), "Green button: re-initialization requested");
      break;
    case RobotState::AtDropoff:
      confirmation_ = true;
      RCLCPP_INFO(logger(), "Green button: customer confirmed");
      break;
    default:
      RCLCPP_DEBUG(logger(), "Green button ignored in %s", toString(observed_state_));
      break;
  }
}

bool SharedEventState::setOrderRequest(
  const std::string & destination,
  std::string * rejection_reason)
{
  std::lock_guard<std::mutex> lock(mutex_);

  std::string reason;
  if (observed_state_ != RobotState::AtPickup) {
    reason = "Robot is not at pickup. Ignore the order!";
  } else if (order_open_ || observed_order_in_progress_) {
    reason = "Another order is in progress. Ignore the order!";
  } else if (destination.empty()) {
    reason = "Order has no destination. Ignore the order!";
  }

  if (!reason.empty()) {
    RCLCPP_WARN(logger(), "Order to '%s' rejected: %s", destination.c_str(), reason.c_str());
    if (rejection_reason) {
      *rejection_reason = reason;
    }
    return false;
  }

  order_open_ = true;
  pending_order_ = PendingOrder{destination};
  RCLCPP_INFO(logger(), "Order to '%s' accepted", destination.c_str());
  return true;
}

void SharedEventState::closeOrder()
{
  std::lock_guard<std::mutex> lock(mutex_);
  order_open_ = false;
  pending_order_.reset();
}

void SharedEventState::setOrderPreempted()
{
  // Accepted orders run to completion.
  RCLCPP_INFO(logger(), "Order preemption requested, ignored");
}

void SharedEventState::setLocalized()
{
  std::lock_guard<std::mutex> lock(mutex_);
  localized_ = true;
}

void SharedEventState::setNavigationOutcome(
  std::uint64_t request_id, bool success, const std::string & message)
{
  std::lock_guard<std::mutex> lock(mutex_);
  outcomes_.push_back(NavigationOutcome{request_id, success, message});
}

void SharedEventState::setNavigationFeedback(
  std::uint64_t request_id, double distance, const std::string & message, bool retry)
{
  std::lock_guard<std::mutex> lock(mutex_);

  bool retry_pending = retry;
  if (feedback_ && feedback_->request_id == request_id) {
    retry_pending = retry_pending || feedback_->retry;
  }
  feedback_ = NavigationFeedback{request_id, distance, message, retry_pending};
}

bool SharedEventState::takeReinitRequest()
{
  std::lock_guard<std::mutex> lock(mutex_);
  return std::exchange(reinit_requested_, false);
}

bool SharedEventState::takeConfirmationFlag()
{
  std::lock_guard<std::mutex> lock(mutex_);
  return std::exchange(confirmation_, false);
}

bool SharedEventState::takeLocalized()
{
  std::lock_guard<std::mutex> lock(mutex_);
  return std::exchange(localized_, false);
}

std::optional<PendingOrder> SharedEventState::takeOrderRequest()
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<PendingOrder> order;
  order.swap(pending_order_);
  return order;
}

NavigationUpdates SharedEventState::takeNavigationUpdates()
{
  std::lock_guard<std::mutex> lock(mutex_);
  NavigationUpdates updates;
  updates.feedback.swap(feedback_);
  updates.outcomes.swap(outcomes_);
  return updates;
}

void SharedEventState::publishMachineView(RobotState state, bool order_in_progress)
{
  std::lock_guard<std::mutex> lock(mutex_);
  observed_state_ = state;
  observed_order_in_progress_ = order_in_progress;
}

RobotState SharedEventState::observedState() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return observed_state_;
}
