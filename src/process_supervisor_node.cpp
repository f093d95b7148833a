#include "proc_supervisor/process_supervisor_node.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <rclcpp/rclcpp.hpp>
#include <stdexcept>
#include <string>
#include <utility>

#include "proc_supervisor/msg_converters.hpp"
#include "proc_supervisor/process_errors.hpp"

namespace {
std::chrono::milliseconds millisParameter(rclcpp::Node &node,
                                          const std::string &name,
                                          int64_t default_ms) {
  return std::chrono::milliseconds(
      node.declare_parameter<int64_t>(name, default_ms));
}
}  // namespace

ProcessSupervisorNode::ProcessSupervisorNode(const rclcpp::NodeOptions &options)
    : Node("process_supervisor", options) {
  if (!rclcpp::ok()) {
    throw std::runtime_error("ROS2 is not initialized");
  }

  const auto config = loadConfig();
  sink_ = std::make_shared<RosEventSink>(*this);
  manager_ = std::make_unique<ProcessManager>(sink_, config);

  init();
  RCLCPP_INFO(this->get_logger(), "ProcessSupervisor node initialized");
}

ProcessSupervisorNode::~ProcessSupervisorNode() {
  // 先关闭引擎，顺序分组中正在等待的条目随之结束
  manager_->shutdown();
  if (autostart_thread_.joinable()) {
    autostart_thread_.join();
  }
}

procTypes::SupervisorConfig ProcessSupervisorNode::loadConfig() {
  const procTypes::SupervisorConfig defaults;
  procTypes::SupervisorConfig config;
  config.poll_interval = millisParameter(*this, "poll_interval_ms",
                                         defaults.poll_interval.count());
  config.shutdown_yield = millisParameter(*this, "shutdown_yield_ms",
                                          defaults.shutdown_yield.count());
  config.output_drain_timeout =
      millisParameter(*this, "output_drain_timeout_ms",
                      defaults.output_drain_timeout.count());
  config.event_drain_timeout =
      millisParameter(*this, "event_drain_timeout_ms",
                      defaults.event_drain_timeout.count());
  config.termination.term_grace = millisParameter(
      *this, "kill_grace_ms", defaults.termination.term_grace.count());
  config.termination.robust_settle = millisParameter(
      *this, "robust_settle_ms", defaults.termination.robust_settle.count());
  config.termination.robust_retry_delay =
      millisParameter(*this, "robust_retry_delay_ms",
                      defaults.termination.robust_retry_delay.count());
  return config;
}

void ProcessSupervisorNode::loadAutostart() {
  const auto entries = this->declare_parameter<std::vector<std::string>>(
      "autostart.entries", std::vector<std::string>{});
  const auto mode =
      this->declare_parameter<std::string>("autostart.mode", "sequential");
  autostart_stop_on_failure_ =
      this->declare_parameter<bool>("autostart.stop_on_failure", true);

  if (mode == "parallel") {
    autostart_mode_ = procTypes::ExecutionMode::Parallel;
  } else {
    if (mode != "sequential") {
      RCLCPP_WARN(this->get_logger(),
                  "Unknown autostart.mode '%s', using sequential",
                  mode.c_str());
    }
    autostart_mode_ = procTypes::ExecutionMode::Sequential;
  }

  for (const auto &entry : entries) {
    auto spec = procTypes::parseLaunchEntry(entry);
    if (!spec) {
      RCLCPP_WARN(this->get_logger(),
                  "Skipping malformed autostart entry '%s' (expected "
                  "category|id|working_dir|command)",
                  entry.c_str());
      continue;
    }
    autostart_specs_.push_back(std::move(*spec));
  }
}

void ProcessSupervisorNode::init() {
  using std::placeholders::_1;
  using std::placeholders::_2;

  launch_service_ = this->create_service<proc_supervisor::srv::LaunchProcess>(
      "~/launch",
      std::bind(&ProcessSupervisorNode::handleLaunch, this, _1, _2));
  stop_service_ = this->create_service<proc_supervisor::srv::StopProcess>(
      "~/stop", std::bind(&ProcessSupervisorNode::handleStop, this, _1, _2));
  list_running_service_ =
      this->create_service<proc_supervisor::srv::ListRunning>(
          "~/list_running",
          std::bind(&ProcessSupervisorNode::handleListRunning, this, _1, _2));

  loadAutostart();
  if (autostart_specs_.empty()) {
    return;
  }
  RCLCPP_INFO(this->get_logger(), "Running %zu autostart entries (%s)",
              autostart_specs_.size(),
              autostart_mode_ == procTypes::ExecutionMode::Parallel
                  ? "parallel"
                  : "sequential");
  autostart_thread_ = std::thread([this]() {
    autostart_results_ = manager_->run_group(
        autostart_specs_, autostart_mode_, autostart_stop_on_failure_);
    for (const auto &result : autostart_results_) {
      if (!result.ok()) {
        RCLCPP_WARN(this->get_logger(), "Autostart of %s failed: %s",
                    result.id.c_str(), result.message.c_str());
      }
    }
  });
}

std::vector<procTypes::GroupLaunchResult>
ProcessSupervisorNode::waitForAutostart() {
  if (autostart_thread_.joinable()) {
    autostart_thread_.join();
  }
  return autostart_results_;
}

void ProcessSupervisorNode::handleLaunch(
    const std::shared_ptr<proc_supervisor::srv::LaunchProcess::Request> request,
    std::shared_ptr<proc_supervisor::srv::LaunchProcess::Response> response) {
  response->success = false;
  response->pid = 0;
  try {
    const auto spec = MsgConverters::toLaunchSpec(*request);
    response->pid = manager_->launch(spec);
    response->success = true;
  } catch (const ProcessError &e) {
    response->error_kind = procTypes::toString(e.kind());
    response->message = e.what();
  } catch (const std::invalid_argument &e) {
    RCLCPP_WARN(this->get_logger(), "Rejected launch request: %s", e.what());
    response->error_kind = "invalid_request";
    response->message = e.what();
  }
}

void ProcessSupervisorNode::handleStop(
    const std::shared_ptr<proc_supervisor::srv::StopProcess::Request> request,
    std::shared_ptr<proc_supervisor::srv::StopProcess::Response> response) {
  response->success = false;
  const auto category = MsgConverters::categoryFromMsg(request->category);
  if (!category) {
    response->error_kind = "invalid_request";
    response->message =
        "Unknown category " + std::to_string(request->category);
    return;
  }
  try {
    manager_->stop(*category, request->entity_id);
    response->success = true;
  } catch (const ProcessError &e) {
    response->error_kind = procTypes::toString(e.kind());
    response->message = e.what();
  }
}

void ProcessSupervisorNode::handleListRunning(
    const std::shared_ptr<proc_supervisor::srv::ListRunning::Request> request,
    std::shared_ptr<proc_supervisor::srv::ListRunning::Response> response) {
  response->any_running = manager_->has_running_processes();
  const auto category = MsgConverters::categoryFromMsg(request->category);
  if (!category) {
    RCLCPP_WARN(this->get_logger(), "list_running: unknown category %u",
                static_cast<unsigned>(request->category));
    return;
  }
  response->entity_ids = manager_->list_running(*category);
}
