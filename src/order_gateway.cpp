#include "delivery_controller/order_gateway.hpp"

#include <utility>

#include <rclcpp/logging.hpp>

OrderGateway::OrderGateway(SharedEventState & events)
: events_(events)
{
}

bool OrderGateway::submitOrder(
  const std::string & destination, std::shared_ptr<OrderReporter> caller)
{
  std::string reason;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.setOrderRequest(destination, &reason)) {
      active_ = std::move(caller);
      return true;
    }
  }

  if (caller) {
    caller->reportResult(false, reason);
  }
  return false;
}

void OrderGateway::preemptOrder()
{
  events_.setOrderPreempted();
}

void OrderGateway::reportActiveProgress(const std::string & text)
{
  std::shared_ptr<OrderReporter> active;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active = active_;
  }

  if (active) {
    active->reportProgress(text);
  }
}

bool OrderGateway::completeActiveOrder(bool success, const std::string & message)
{
  std::shared_ptr<OrderReporter> active;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active.swap(active_);
    if (active) {
      // Reopen the order slot under the same lock as the reporter swap.
      events_.closeOrder();
    }
  }

  if (!active) {
    RCLCPP_WARN(rclcpp::get_logger("order_gateway"),
                "Order result '%s' without an active order", message.c_str());
    return false;
  }

  RCLCPP_INFO(rclcpp::get_logger("order_gateway"), "Order finished: success=%s, %s",
              success ? "true" : "false", message.c_str());
  active->reportResult(success, message);
  return true;
}

bool OrderGateway::hasActiveOrder() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ != nullptr;
}
