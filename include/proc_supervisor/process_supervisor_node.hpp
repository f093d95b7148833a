#pragma once
#include <memory>
#include <proc_supervisor/srv/launch_process.hpp>
#include <proc_supervisor/srv/list_running.hpp>
#include <proc_supervisor/srv/stop_process.hpp>
#include <rclcpp/rclcpp.hpp>
#include <string>
#include <thread>
#include <vector>

#include "proc_supervisor/proc_types.hpp"
#include "proc_supervisor/process_manager.hpp"
#include "proc_supervisor/ros_event_sink.hpp"

class ProcessSupervisorNode : public rclcpp::Node {
 public:
  /**
   * @brief 构造函数
   * @param options ROS2节点选项
   * 从参数读取引擎配置和自启动分组，创建引擎和对外服务；
   * 自启动分组在后台线程中执行，不阻塞构造
   * @throws std::invalid_argument 参数取值非法(例如 poll_interval_ms <= 0)
   */
  explicit ProcessSupervisorNode(const rclcpp::NodeOptions &options);
  /**
   * @brief 析构函数
   * 关闭引擎(结束所有受管进程)并等待自启动线程退出
   */
  ~ProcessSupervisorNode() override;

  //===============提供的API================
  ProcessManager &manager() { return *manager_; }

  /**
   * @brief 等待自启动分组执行完毕
   * @return 每个已尝试条目的结果，没有自启动条目时为空
   */
  std::vector<procTypes::GroupLaunchResult> waitForAutostart();

 private:
  //===============内部函数===============
  /**
   * @brief 初始化函数，在构造函数中调用，创建服务并启动自启动线程
   */
  void init();

  /**
   * @brief 声明并读取引擎参数
   */
  procTypes::SupervisorConfig loadConfig();

  /**
   * @brief 读取 autostart.* 参数，格式错误的条目输出告警后跳过
   */
  void loadAutostart();

  void handleLaunch(
      const std::shared_ptr<proc_supervisor::srv::LaunchProcess::Request>
          request,
      std::shared_ptr<proc_supervisor::srv::LaunchProcess::Response> response);
  void handleStop(
      const std::shared_ptr<proc_supervisor::srv::StopProcess::Request> request,
      std::shared_ptr<proc_supervisor::srv::StopProcess::Response> response);
  void handleListRunning(
      const std::shared_ptr<proc_supervisor::srv::ListRunning::Request>
          request,
      std::shared_ptr<proc_supervisor::srv::ListRunning::Response> response);

  //===============成员变量===============

  std::shared_ptr<RosEventSink> sink_;
  std::unique_ptr<ProcessManager> manager_;

  // 对外提供的服务
  rclcpp::Service<proc_supervisor::srv::LaunchProcess>::SharedPtr
      launch_service_;
  rclcpp::Service<proc_supervisor::srv::StopProcess>::SharedPtr stop_service_;
  rclcpp::Service<proc_supervisor::srv::ListRunning>::SharedPtr
      list_running_service_;

  // 自启动分组
  std::vector<procTypes::LaunchSpec> autostart_specs_;
  procTypes::ExecutionMode autostart_mode_ =
      procTypes::ExecutionMode::Sequential;
  bool autostart_stop_on_failure_ = true;
  std::vector<procTypes::GroupLaunchResult> autostart_results_;
  std::thread autostart_thread_;
};
