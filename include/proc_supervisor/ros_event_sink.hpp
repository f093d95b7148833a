#pragma once
#include <proc_supervisor/msg/process_exit.hpp>
#include <proc_supervisor/msg/process_log.hpp>
#include <proc_supervisor/msg/process_status.hpp>
#include <rclcpp/rclcpp.hpp>

#include "proc_supervisor/process_event_sink.hpp"

/**
 * @class RosEventSink
 * @brief 将引擎事件发布到 ROS 话题，供图形界面订阅
 *
 * 话题相对于所属节点：~/log、~/status、~/exit
 *
 * @note 发布者创建于节点所在线程，publish 本身是线程安全的，
 * 引擎的各个线程可以直接调用
 */
class RosEventSink : public ProcessEventSink {
 public:
  /**
   * @brief 构造函数
   * @param node 用于创建发布者和获取时间，不允许为空
   */
  explicit RosEventSink(rclcpp::Node &node);

  void onLog(const procTypes::LogEvent &event) override;
  void onStatus(const procTypes::StatusEvent &event) override;
  void onExit(const procTypes::ExitEvent &event) override;

 private:
  rclcpp::Clock::SharedPtr clock_;
  rclcpp::Publisher<proc_supervisor::msg::ProcessLog>::SharedPtr
      log_publisher_;
  rclcpp::Publisher<proc_supervisor::msg::ProcessStatus>::SharedPtr
      status_publisher_;
  rclcpp::Publisher<proc_supervisor::msg::ProcessExit>::SharedPtr
      exit_publisher_;
};
