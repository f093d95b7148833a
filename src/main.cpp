#include <memory>
#include <rclcpp/rclcpp.hpp>

#include "proc_supervisor/process_supervisor_node.hpp"

int main(int argc, char* argv[]) {
  rclcpp::init(argc, argv);

  auto node = std::make_shared<ProcessSupervisorNode>(rclcpp::NodeOptions{});

  rclcpp::spin(node);

  node.reset();
  rclcpp::shutdown();
  return 0;
}
