#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "delivery_controller/shared_event_state.hpp"

/**
 * @brief Reporting channel back to whoever submitted an order.
 */
class OrderReporter
{
public:
  virtual ~OrderReporter() = default;

  virtual void reportProgress(const std::string & text) = 0;
  virtual void reportResult(bool success, const std::string & message) = 0;
};

/**
 * @brief Order intake surface.
 *
 *  - submitOrder() accepts or rejects synchronously; rejections are reported
 *    to the caller's reporter before returning
 *  - the accepted order's reporter stays active until completeActiveOrder(),
 *    which also frees the order slot; until then every submission is rejected
 *  - preemptOrder() is a no-op, accepted orders are not cancelable
 */
class OrderGateway
{
public:
  explicit OrderGateway(SharedEventState & events);

  bool submitOrder(const std::string & destination, std::shared_ptr<OrderReporter> caller);

  void preemptOrder();

  // Progress of the active order; no-op without one.
  void reportActiveProgress(const std::string & text);

  // Terminal result of the active order; returns false without one.
  bool completeActiveOrder(bool success, const std::string & message);

  bool hasActiveOrder() const;

private:
  SharedEventState & events_;

  mutable std::mutex mutex_;
  std::shared_ptr<OrderReporter> active_;
};
