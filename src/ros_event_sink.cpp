#include "proc_supervisor/ros_event_sink.hpp"

#include "proc_supervisor/msg_converters.hpp"

namespace {
// 输出行可能短时间内大量到达，日志话题使用更深的队列
constexpr size_t kLogQueueDepth = 100;
constexpr size_t kStateQueueDepth = 10;
}  // namespace

RosEventSink::RosEventSink(rclcpp::Node &node) : clock_(node.get_clock()) {
  log_publisher_ = node.create_publisher<proc_supervisor::msg::ProcessLog>(
      "~/log", kLogQueueDepth);
  status_publisher_ =
      node.create_publisher<proc_supervisor::msg::ProcessStatus>(
          "~/status", rclcpp::QoS(kStateQueueDepth).reliable());
  exit_publisher_ = node.create_publisher<proc_supervisor::msg::ProcessExit>(
      "~/exit", rclcpp::QoS(kStateQueueDepth).reliable());
}

void RosEventSink::onLog(const procTypes::LogEvent &event) {
  log_publisher_->publish(MsgConverters::convert(event, clock_->now()));
}

void RosEventSink::onStatus(const procTypes::StatusEvent &event) {
  status_publisher_->publish(MsgConverters::convert(event, clock_->now()));
}

void RosEventSink::onExit(const procTypes::ExitEvent &event) {
  exit_publisher_->publish(MsgConverters::convert(event, clock_->now()));
}
