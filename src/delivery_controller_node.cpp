#include <memory>

#include "rclcpp/executors/multi_threaded_executor.hpp"

#include "delivery_controller/delivery_controller_node.hpp"

// ============================================================
// main
// ============================================================

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);

  auto node = std::make_shared<DeliveryControllerNode>();
  rclcpp::executors::MultiThreadedExecutor exec;
  exec.add_node(node->get_node_base_interface());
  exec.spin();

  rclcpp::shutdown();
  return 0;
}
