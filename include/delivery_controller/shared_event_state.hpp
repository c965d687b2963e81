#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "delivery_controller/robot_state.hpp"

struct PendingOrder
{
  std::string destination;
};

struct NavigationOutcome
{
  std::uint64_t request_id{0};
  bool success{false};
  std::string message;
};

struct NavigationFeedback
{
  std::uint64_t request_id{0};
  double distance{0.0};
  std::string message;
  bool retry{false};   // at least one retry marker since the last take
};

// Navigation notifications collected since the last take. Progress for a
// request always precedes its terminal outcome.
struct NavigationUpdates
{
  std::optional<NavigationFeedback> feedback;
  std::vector<NavigationOutcome> outcomes;
};

/**
 * @brief Mutex-guarded mailbox between event callbacks and the control loop.
 *
 * Callbacks (buttons, orders, navigation, localization) only call set*().
 * The control loop calls take*() once per tick; every take is read-and-clear
 * so each event is processed exactly once.
 *
 * The machine publishes a view of its state at the end of each tick. Events
 * whose meaning depends on the state (green press, order request) are
 * interpreted against that view when they arrive.
 */
class SharedEventState
{
public:
  // ---- Event-source side --------------------------------------------------

  // Green press: confirmation in AtDropoff, re-initialization in Error,
  // ignored otherwise.
  void setGreenEdge();

  // Accepts only in AtPickup while the order slot is free. An accepted order
  // holds the slot until closeOrder(), i.e. until its result is delivered.
  bool setOrderRequest(const std::string & destination,
                       std::string * rejection_reason = nullptr);

  // Frees the order slot and drops an order the machine has not taken yet.
  void closeOrder();

  // Orders cannot be cancelled once accepted; this only logs.
  void setOrderPreempted();

  void setLocalized();

  void setNavigationOutcome(std::uint64_t request_id, bool success,
                            const std::string & message);

  void setNavigationFeedback(std::uint64_t request_id, double distance,
                             const std::string & message, bool retry);

  // ---- Control-loop side --------------------------------------------------

  bool takeReinitRequest();
  bool takeConfirmationFlag();
  bool takeLocalized();
  std::optional<PendingOrder> takeOrderRequest();
  NavigationUpdates takeNavigationUpdates();

  void publishMachineView(RobotState state, bool order_in_progress);

  RobotState observedState() const;

private:
  mutable std::mutex mutex_;

  // Machine view, written only by the control loop
  RobotState observed_state_{RobotState::Initialization};
  bool observed_order_in_progress_{false};

  bool reinit_requested_{false};
  bool confirmation_{false};
  bool localized_{false};
  bool order_open_{false};
  std::optional<PendingOrder> pending_order_;
  std::vector<NavigationOutcome> outcomes_;
  std::optional<NavigationFeedback> feedback_;
};
