#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "rclcpp_action/rclcpp_action.hpp"
#include "rclcpp_lifecycle/lifecycle_node.hpp"

#include "delivery_controller/async_cue_player.hpp"
#include "delivery_controller/button_edge_detector.hpp"
#include "delivery_controller/delivery_config.hpp"
#include "delivery_controller/delivery_state_machine.hpp"
#include "delivery_controller/feedback_pattern.hpp"
#include "delivery_controller/order_gateway.hpp"
#include "delivery_controller/shared_event_state.hpp"

#include "action_msgs/srv/cancel_goal.hpp"
#include "delivery_controller/action/deliver_order.hpp"
#include "delivery_controller/action/navigate_to.hpp"
#include "diagnostic_msgs/msg/diagnostic_array.hpp"
#include "diagnostic_msgs/msg/diagnostic_status.hpp"
#include "diagnostic_msgs/msg/key_value.hpp"
#include "std_msgs/msg/empty.hpp"
#include "std_msgs/msg/string.hpp"
#include "std_msgs/msg/u_int8.hpp"
#include "std_msgs/msg/u_int8_multi_array.hpp"

using NavigateTo = delivery_controller::action::NavigateTo;
using DeliverOrder = delivery_controller::action::DeliverOrder;

// ============================================================
// Order reporting over the DeliverOrder action
// ============================================================

class DeliverOrderReporter : public OrderReporter
{
public:
  using GoalHandle = rclcpp_action::ServerGoalHandle<DeliverOrder>;

  explicit DeliverOrderReporter(std::shared_ptr<GoalHandle> goal)
  : goal_(std::move(goal))
  {}

  void reportProgress(const std::string & text) override
  {
    if (!goal_->is_active()) return;

    auto feedback = std::make_shared<DeliverOrder::Feedback>();
    feedback->status = text;
    goal_->publish_feedback(feedback);
  }

  void reportResult(bool success, const std::string & message) override
  {
    if (!goal_->is_active()) return;

    auto result = std::make_shared<DeliverOrder::Result>();
    result->success = success;
    result->message = message;
    goal_->succeed(result);
  }

private:
  std::shared_ptr<GoalHandle> goal_;
};

// ============================================================
// Navigation goals still running on the server
// ============================================================

class NavigationGoals
{
public:
  using GoalHandle = rclcpp_action::ClientGoalHandle<NavigateTo>;

  void sent(std::uint64_t id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[id] = Entry{};
  }

  // Returns true when the request was cancelled before the server accepted it.
  bool accepted(std::uint64_t id, GoalHandle::SharedPtr handle)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;

    it->second.handle = std::move(handle);
    return it->second.cancel_requested;
  }

  void resolved(std::uint64_t id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(id);
  }

  // Handle to cancel now; nullptr if the goal is resolved or not accepted yet
  // (then the cancel is sent on acceptance).
  GoalHandle::SharedPtr cancel(std::uint64_t id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return nullptr;

    it->second.cancel_requested = true;
    return it->second.handle;
  }

private:
  struct Entry
  {
    GoalHandle::SharedPtr handle;
    bool cancel_requested{false};
  };

  std::mutex mutex_;
  std::map<std::uint64_t, Entry> entries_;
};

inline void cancelNavigationGoal(
  const std::weak_ptr<rclcpp_action::Client<NavigateTo>> & weak_client,
  const NavigationGoals::GoalHandle::SharedPtr & handle,
  std::uint64_t id,
  const rclcpp::Logger & logger)
{
  auto client = weak_client.lock();
  if (!client || !handle) return;

  try {
    client->async_cancel_goal(
      handle,
      [logger, id](action_msgs::srv::CancelGoal::Response::SharedPtr response) {
        if (!response) return;
        if (response->return_code != action_msgs::srv::CancelGoal::Response::ERROR_NONE) {
          RCLCPP_WARN(logger, "Cancel of navigation request %lu refused (code %d)",
                      static_cast<unsigned long>(id), response->return_code);
        }
      });
  } catch (const rclcpp_action::exceptions::UnknownGoalHandleError &) {
    // Already resolved; its result callback reports the outcome.
    RCLCPP_DEBUG(logger, "Navigation request %lu already finished", static_cast<unsigned long>(id));
  }
}

class DeliveryControllerNode : public rclcpp_lifecycle::LifecycleNode
{
public:
  using CallbackReturn =
    rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;
  using NavigateGoalHandle = rclcpp_action::ClientGoalHandle<NavigateTo>;
  using OrderGoalHandle = rclcpp_action::ServerGoalHandle<DeliverOrder>;

  explicit DeliveryControllerNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions())
  : rclcpp_lifecycle::LifecycleNode("delivery_controller", options),
    ticker_(1)
  {}

  // ============================================================
  // Lifecycle
  // ============================================================

  CallbackReturn on_configure(const rclcpp_lifecycle::State &) override
  {
    try {
      config_ = loadConfig();
      config_.validate();
    } catch (const std::exception & e) {
      RCLCPP_ERROR(get_logger(), "Configuration rejected: %s", e.what());
      return CallbackReturn::FAILURE;
    }

    std::unique_lock<std::shared_mutex> lock(teardown_mutex_);

    events_  = std::make_shared<SharedEventState>();
    nav_goals_ = std::make_shared<NavigationGoals>();
    machine_ = std::make_unique<DeliveryStateMachine>(config_, *events_);
    gateway_ = std::make_unique<OrderGateway>(*events_);
    cue_player_ = std::make_unique<AsyncCuePlayer>(config_.sound_endpoint);
    ticker_ = FeedbackTicker(config_.feedback_divider);
    edge_detector_.reset();

    input_group_ = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);
    control_group_ = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);

    rclcpp::SubscriptionOptions input_options;
    input_options.callback_group = input_group_;

    buttons_sub_ = create_subscription<std_msgs::msg::UInt8MultiArray>(
      "~/digital_inputs", 10,
      std::bind(&DeliveryControllerNode::digitalInputsCallback, this, std::placeholders::_1),
      input_options);

    localized_sub_ = create_subscription<std_msgs::msg::Empty>(
      "~/localized", 1,
      [this](std_msgs::msg::Empty::SharedPtr) {
        std::shared_lock<std::shared_mutex> lock(teardown_mutex_);
        if (!events_) return;

        RCLCPP_INFO(get_logger(), "Localization completed");
        events_->setLocalized();
      },
      input_options);

    localize_pub_ = create_publisher<std_msgs::msg::Empty>("~/localize", 1);
    status_pub_   = create_publisher<std_msgs::msg::String>("robot_status", 2);
    led1_pub_     = create_publisher<std_msgs::msg::UInt8>("~/led1", 1);
    led2_pub_     = create_publisher<std_msgs::msg::UInt8>("~/led2", 1);
    diag_pub_     = create_publisher<diagnostic_msgs::msg::DiagnosticArray>("/diagnostics", 10);

    navigator_client_ = rclcpp_action::create_client<NavigateTo>(
      get_node_base_interface(),
      get_node_graph_interface(),
      get_node_logging_interface(),
      get_node_waitables_interface(),
      "navigate_to",
      input_group_);

    order_server_ = rclcpp_action::create_server<DeliverOrder>(
      get_node_base_interface(),
      get_node_clock_interface(),
      get_node_logging_interface(),
      get_node_waitables_interface(),
      "deliver_order",
      std::bind(&DeliveryControllerNode::handleOrderGoal, this,
                std::placeholders::_1, std::placeholders::_2),
      std::bind(&DeliveryControllerNode::handleOrderCancel, this, std::placeholders::_1),
      std::bind(&DeliveryControllerNode::handleOrderAccepted, this, std::placeholders::_1),
      rcl_action_server_get_default_options(),
      input_group_);

    RCLCPP_INFO(get_logger(), "Configured (pickup '%s', start in %s)",
                config_.pickup_location.c_str(), toString(machine_->state()));
    return CallbackReturn::SUCCESS;
  }

  CallbackReturn on_activate(const rclcpp_lifecycle::State &) override
  {
    localize_pub_->on_activate();
    status_pub_->on_activate();
    led1_pub_->on_activate();
    led2_pub_->on_activate();
    diag_pub_->on_activate();

    if (!navigator_client_->wait_for_action_server(
          std::chrono::duration<double>(config_.navigator_wait_s)))
    {
      RCLCPP_WARN(get_logger(),
                  "Navigation server not available yet, requests fail until it is up");
    }

    control_timer_ = create_wall_timer(
      std::chrono::duration<double>(1.0 / config_.control_rate_hz),
      std::bind(&DeliveryControllerNode::controlLoop, this),
      control_group_);

    RCLCPP_INFO(get_logger(), "Activated");
    return CallbackReturn::SUCCESS;
  }

  CallbackReturn on_deactivate(const rclcpp_lifecycle::State &) override
  {
    std::unique_lock<std::shared_mutex> lock(teardown_mutex_);
    control_timer_.reset();

    localize_pub_->on_deactivate();
    status_pub_->on_deactivate();
    led1_pub_->on_deactivate();
    led2_pub_->on_deactivate();
    diag_pub_->on_deactivate();

    RCLCPP_WARN(get_logger(), "Deactivated in %s", toString(machine_->state()));
    return CallbackReturn::SUCCESS;
  }

  CallbackReturn on_cleanup(const rclcpp_lifecycle::State &) override
  {
    releaseAll();
    RCLCPP_INFO(get_logger(), "Cleaned up");
    return CallbackReturn::SUCCESS;
  }

  CallbackReturn on_shutdown(const rclcpp_lifecycle::State &) override
  {
    releaseAll();
    RCLCPP_WARN(get_logger(), "Shutdown");
    return CallbackReturn::SUCCESS;
  }

private:
  template<typename T>
  T parameter(const std::string & name, const T & default_value)
  {
    if (!has_parameter(name)) {
      declare_parameter<T>(name, default_value);
    }
    return get_parameter(name).get_value<T>();
  }

  DeliveryConfig loadConfig()
  {
    DeliveryConfig c;

    c.control_rate_hz        = parameter<double>("control_rate_hz", c.control_rate_hz);
    c.feedback_divider       = parameter<int>("feedback_divider", c.feedback_divider);
    c.pickup_location        = parameter<std::string>("pickup_location", c.pickup_location);
    c.nav_pickup_timeout     = parameter<double>("nav_pickup_timeout", c.nav_pickup_timeout);
    c.nav_dropoff_timeout    = parameter<double>("nav_dropoff_timeout", c.nav_dropoff_timeout);
    c.nav_retry              = parameter<int>("nav_retry", c.nav_retry);
    c.nav_dropoff_distance   = parameter<double>("nav_dropoff_distance", c.nav_dropoff_distance);
    c.nav_return_retry       = parameter<int>("nav_return_retry", c.nav_return_retry);
    c.nav_return_timeout     = parameter<double>("nav_return_timeout", c.nav_return_timeout);
    c.nav_watchdog_grace     = parameter<double>("nav_watchdog_grace", c.nav_watchdog_grace);
    c.navigator_wait_s       = parameter<double>("navigator_wait_s", c.navigator_wait_s);
    c.require_operator_start = parameter<bool>("require_operator_start", c.require_operator_start);
    c.delivery_result_success =
      parameter<bool>("delivery_result_success", c.delivery_result_success);

    c.resource_path  = parameter<std::string>("resource_path", c.resource_path);
    c.sound_endpoint = parameter<std::string>("sound_endpoint", c.sound_endpoint);
    c.confirm_sound  = parameter<std::string>("confirm_sound", c.confirm_sound);
    c.retry_sound    = parameter<std::string>("retry_sound", c.retry_sound);
    c.navigation_failed_sound =
      parameter<std::string>("navigation_failed_sound", c.navigation_failed_sound);
    c.order_received_sound =
      parameter<std::string>("order_received_sound", c.order_received_sound);
    c.arrival_sound    = parameter<std::string>("arrival_sound", c.arrival_sound);
    c.enjoy_meal_sound = parameter<std::string>("enjoy_meal_sound", c.enjoy_meal_sound);

    return c;
  }

  // Lifecycle transitions run concurrently with the input and control
  // callbacks; they hold teardown_mutex_ shared, this holds it exclusively.
  void releaseAll()
  {
    std::unique_lock<std::shared_mutex> lock(teardown_mutex_);

    control_timer_.reset();
    buttons_sub_.reset();
    localized_sub_.reset();

    if (gateway_ && gateway_->hasActiveOrder()) {
      gateway_->completeActiveOrder(false, "Delivery controller stopped");
    }

    order_server_.reset();
    navigator_client_.reset();

    localize_pub_.reset();
    status_pub_.reset();
    led1_pub_.reset();
    led2_pub_.reset();
    diag_pub_.reset();

    cue_player_.reset();
    gateway_.reset();
    machine_.reset();
    nav_goals_.reset();
    events_.reset();
  }

  // ============================================================
  // Event sources
  // ============================================================

  void digitalInputsCallback(const std_msgs::msg::UInt8MultiArray::SharedPtr msg)
  {
    std::shared_lock<std::shared_mutex> lock(teardown_mutex_);
    if (!events_) return;

    if (msg->data.size() < 2) {
      RCLCPP_WARN_THROTTLE(
        get_logger(), *get_clock(), 5000,
        "Digital input sample with %zu channels dropped", msg->data.size());
      return;
    }

    // 0 = green, 1 = red
    const ButtonEdge edge = edge_detector_.update(msg->data[0] != 0, msg->data[1] != 0);

    if (edge.green_pressed) {
      events_->setGreenEdge();
    }
    if (edge.red_pressed) {
      RCLCPP_INFO(get_logger(), "Red button pressed");
    }
  }

  rclcpp_action::GoalResponse handleOrderGoal(
    const rclcpp_action::GoalUUID &,
    std::shared_ptr<const DeliverOrder::Goal> goal)
  {
    RCLCPP_INFO(get_logger(), "Received order to '%s'", goal->location.c_str());
    // Accept at the action layer; the gateway decides and reports a rejection
    // through the goal result.
    return rclcpp_action::GoalResponse::ACCEPT_AND_EXECUTE;
  }

  rclcpp_action::CancelResponse handleOrderCancel(const std::shared_ptr<OrderGoalHandle>)
  {
    std::shared_lock<std::shared_mutex> lock(teardown_mutex_);
    if (gateway_) {
      gateway_->preemptOrder();
    }
    return rclcpp_action::CancelResponse::REJECT;
  }

  void handleOrderAccepted(const std::shared_ptr<OrderGoalHandle> goal_handle)
  {
    auto reporter = std::make_shared<DeliverOrderReporter>(goal_handle);

    std::shared_lock<std::shared_mutex> lock(teardown_mutex_);
    if (!gateway_) {
      reporter->reportResult(false, "Delivery controller stopped");
      return;
    }
    gateway_->submitOrder(goal_handle->get_goal()->location, reporter);
  }

  // ============================================================
  // Navigation
  // ============================================================

  void sendNavigationGoal(const NavigationRequest & request)
  {
    const auto id = request.id;
    auto events = events_;
    auto goals = nav_goals_;
    std::weak_ptr<rclcpp_action::Client<NavigateTo>> weak_client = navigator_client_;
    const rclcpp::Logger logger = get_logger();

    if (!navigator_client_->action_server_is_ready()) {
      RCLCPP_ERROR(get_logger(), "Navigation server unavailable, request %lu failed",
                   static_cast<unsigned long>(id));
      events->setNavigationOutcome(id, false, "navigation server unavailable");
      return;
    }

    NavigateTo::Goal goal;
    goal.location = request.target_location;
    goal.approach_type = request.approach_mode == ApproachMode::On
      ? NavigateTo::Goal::APPROACH_ON
      : NavigateTo::Goal::APPROACH_NEAR;
    goal.num_retry = request.retry_budget;
    goal.timeout = static_cast<float>(request.timeout_s);
    goal.distance = static_cast<float>(request.min_approach_distance);

    rclcpp_action::Client<NavigateTo>::SendGoalOptions options;

    options.goal_response_callback =
      [events, goals, weak_client, logger, id](NavigateGoalHandle::SharedPtr handle) {
        if (!handle) {
          goals->resolved(id);
          events->setNavigationOutcome(id, false, "navigation goal rejected");
          return;
        }
        if (goals->accepted(id, handle)) {
          cancelNavigationGoal(weak_client, handle, id, logger);
        }
      };

    options.feedback_callback =
      [events, id](NavigateGoalHandle::SharedPtr,
                   const std::shared_ptr<const NavigateTo::Feedback> feedback) {
        events->setNavigationFeedback(
          id, feedback->distance, feedback->message,
          feedback->status == NavigateTo::Feedback::STATUS_RETRY);
      };

    options.result_callback =
      [events, goals, id](const NavigateGoalHandle::WrappedResult & result) {
        goals->resolved(id);

        const bool succeeded = result.code == rclcpp_action::ResultCode::SUCCEEDED;
        const bool success = succeeded && result.result && result.result->success;

        std::string message;
        if (result.result) {
          message = result.result->message;
        }
        if (!succeeded && message.empty()) {
          message = "navigation aborted";
        }
        events->setNavigationOutcome(id, success, message);
      };

    goals->sent(id);
    navigator_client_->async_send_goal(goal, options);
  }

  void cancelNavigation(const NavigationRequest & request)
  {
    RCLCPP_WARN(get_logger(), "Cancelling navigation request %lu to '%s'",
                static_cast<unsigned long>(request.id), request.target_location.c_str());
    cancelNavigationGoal(navigator_client_, nav_goals_->cancel(request.id), request.id,
                         get_logger());
  }

  // ============================================================
  // Control loop
  // ============================================================

  void controlLoop()
  {
    std::shared_lock<std::shared_mutex> lock(teardown_mutex_);
    if (!machine_) return;

    executeEffects(machine_->tick(now()));

    if (ticker_.advance()) {
      emitFeedback();
    }
  }

  void executeEffects(const std::vector<Effect> & effects)
  {
    for (const auto & effect : effects) {
      switch (effect.kind) {
        case Effect::Kind::RequestLocalization:
          localize_pub_->publish(std_msgs::msg::Empty());
          break;
        case Effect::Kind::RequestNavigation:
          sendNavigationGoal(effect.navigation);
          break;
        case Effect::Kind::CancelNavigation:
          cancelNavigation(effect.navigation);
          break;
        case Effect::Kind::PlayCue:
          RCLCPP_DEBUG(get_logger(), "Cue %s", toString(effect.cue));
          cue_player_->submit(config_.soundPath(effect.cue));
          break;
        case Effect::Kind::ReportOrderResult:
          gateway_->completeActiveOrder(effect.success, effect.message);
          break;
      }
    }
  }

  void emitFeedback()
  {
    const RobotState state = machine_->state();

    std_msgs::msg::String status;
    status.data = toString(state);
    status_pub_->publish(status);

    if (machine_->orderInProgress()) {
      gateway_->reportActiveProgress(
        formatOrderProgress(state, machine_->lastNavigationFeedback()));
    }

    const IndicatorFrame frame = computeIndicators(state, ticker_.phase());

    std_msgs::msg::UInt8 led;
    led.data = static_cast<std::uint8_t>(frame.led1);
    led1_pub_->publish(led);
    led.data = static_cast<std::uint8_t>(frame.led2);
    led2_pub_->publish(led);

    publishDiagnostics();
  }

  // ============================================================
  // Diagnostics
  // ============================================================

  void publishDiagnostics()
  {
    if (!diag_pub_) return;

    diagnostic_msgs::msg::DiagnosticArray array;
    array.header.stamp = now();

    diagnostic_msgs::msg::DiagnosticStatus status;
    status.name = "delivery_controller";
    status.hardware_id = "delivery_controller";
    status.message = toString(machine_->state());

    if (machine_->state() == RobotState::Error) {
      status.level = diagnostic_msgs::msg::DiagnosticStatus::ERROR;
    } else if (!cue_player_->isHealthy()) {
      status.level = diagnostic_msgs::msg::DiagnosticStatus::WARN;
    } else {
      status.level = diagnostic_msgs::msg::DiagnosticStatus::OK;
    }

    auto add = [&status](const std::string & key, const std::string & value) {
      diagnostic_msgs::msg::KeyValue kv;
      kv.key = key;
      kv.value = value;
      status.values.push_back(kv);
    };

    add("order_in_progress", machine_->orderInProgress() ? "true" : "false");
    add("destination", machine_->activeDestination());
    add("navigation_in_flight", machine_->navigationInFlight() ? "true" : "false");
    add("navigation", machine_->lastNavigationFeedback());
    add("audio", cue_player_->isHealthy() ? "ok" : "unreachable");

    array.status.push_back(status);
    diag_pub_->publish(array);
  }

private:
  // ROS
  rclcpp::CallbackGroup::SharedPtr input_group_;
  rclcpp::CallbackGroup::SharedPtr control_group_;
  rclcpp::Subscription<std_msgs::msg::UInt8MultiArray>::SharedPtr buttons_sub_;
  rclcpp::Subscription<std_msgs::msg::Empty>::SharedPtr localized_sub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Empty>::SharedPtr localize_pub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::String>::SharedPtr status_pub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::UInt8>::SharedPtr led1_pub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::UInt8>::SharedPtr led2_pub_;
  rclcpp_lifecycle::LifecyclePublisher<diagnostic_msgs::msg::DiagnosticArray>::SharedPtr diag_pub_;
  rclcpp_action::Client<NavigateTo>::SharedPtr navigator_client_;
  rclcpp_action::Server<DeliverOrder>::SharedPtr order_server_;
  rclcpp::TimerBase::SharedPtr control_timer_;

  DeliveryConfig config_;

  std::shared_mutex teardown_mutex_;
  std::shared_ptr<SharedEventState> events_;
  std::shared_ptr<NavigationGoals> nav_goals_;
  std::unique_ptr<DeliveryStateMachine> machine_;
  std::unique_ptr<OrderGateway> gateway_;
  std::unique_ptr<AsyncCuePlayer> cue_player_;

  ButtonEdgeDetector edge_detector_;
  FeedbackTicker ticker_;
};
