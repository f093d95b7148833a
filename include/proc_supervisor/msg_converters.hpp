#pragma once
#include <builtin_interfaces/msg/time.hpp>
#include <optional>
#include <rclcpp/rclcpp.hpp>
#include <stdexcept>
#include <string>

#include "proc_supervisor/msg/process_exit.hpp"
#include "proc_supervisor/msg/process_log.hpp"
#include "proc_supervisor/msg/process_status.hpp"
#include "proc_supervisor/srv/launch_process.hpp"
#include "proc_supervisor/proc_types.hpp"

namespace MsgConverters {

inline builtin_interfaces::msg::Time toRosTime(const rclcpp::Time &time) {
  builtin_interfaces::msg::Time ros_time;
  const auto nanoseconds = time.nanoseconds();
  ros_time.sec = static_cast<int32_t>(nanoseconds / 1000000000LL);
  ros_time.nanosec = static_cast<uint32_t>(nanoseconds % 1000000000LL);
  return ros_time;
}

// 消息中的类别编码与 procTypes::ProcessCategory 的取值一致
inline uint8_t toMsg(procTypes::ProcessCategory category) {
  return static_cast<uint8_t>(category);
}

inline std::optional<procTypes::ProcessCategory> categoryFromMsg(
    uint8_t category) {
  switch (category) {
    case proc_supervisor::msg::ProcessStatus::CATEGORY_SERVICE:
      return procTypes::ProcessCategory::Service;
    case proc_supervisor::msg::ProcessStatus::CATEGORY_PROJECT_SCRIPT:
      return procTypes::ProcessCategory::ProjectScript;
    case proc_supervisor::msg::ProcessStatus::CATEGORY_GLOBAL_SCRIPT:
      return procTypes::ProcessCategory::GlobalScript;
    default:
      return std::nullopt;
  }
}

// 将一行输出转换为 ROS 消息
inline proc_supervisor::msg::ProcessLog convert(
    const procTypes::LogEvent &event, const rclcpp::Time &stamp) {
  proc_supervisor::msg::ProcessLog msg;
  msg.stamp = toRosTime(stamp);
  msg.category = toMsg(event.category);
  msg.entity_id = event.id;
  msg.stream = event.stream == procTypes::LogStream::Stdout
                   ? proc_supervisor::msg::ProcessLog::STREAM_STDOUT
                   : proc_supervisor::msg::ProcessLog::STREAM_STDERR;
  msg.line = event.text;
  return msg;
}
// 将状态变化转换为 ROS 消息，未设置的元数据为空字符串
inline proc_supervisor::msg::ProcessStatus convert(
    const procTypes::StatusEvent &event, const rclcpp::Time &stamp) {
  proc_supervisor::msg::ProcessStatus msg;
  msg.stamp = toRosTime(stamp);
  msg.category = toMsg(event.category);
  msg.entity_id = event.id;
  msg.state = static_cast<uint8_t>(event.state);
  msg.has_pid = event.pid.has_value();
  msg.pid = event.pid.value_or(0);
  msg.active_mode = event.metadata.active_mode.value_or("");
  msg.active_arg_preset = event.metadata.active_arg_preset.value_or("");
  return msg;
}
// 将退出报告转换为 ROS 消息
inline proc_supervisor::msg::ProcessExit convert(
    const procTypes::ExitEvent &event, const rclcpp::Time &stamp) {
  proc_supervisor::msg::ProcessExit msg;
  msg.stamp = toRosTime(stamp);
  msg.category = toMsg(event.category);
  msg.entity_id = event.id;
  msg.has_exit_code = event.exit_code.has_value();
  msg.exit_code = event.exit_code.value_or(0);
  msg.success = event.success;
  return msg;
}

/**
 * @brief 将 launch 服务请求转换为 LaunchSpec
 * @throws std::invalid_argument 类别未知、env 条目缺少 '='，
 * 或 program 与 command 同时为空/同时给出
 */
inline procTypes::LaunchSpec toLaunchSpec(
    const proc_supervisor::srv::LaunchProcess::Request &request) {
  const auto category = categoryFromMsg(request.category);
  if (!category) {
    throw std::invalid_argument("Unknown category " +
                                std::to_string(request.category));
  }
  if (request.program.empty() == request.command.empty()) {
    throw std::invalid_argument(
        "Exactly one of program and command must be given");
  }

  procTypes::LaunchSpec spec;
  if (!request.command.empty()) {
    spec = procTypes::LaunchSpec::fromShellCommand(
        *category, request.entity_id, request.working_dir, request.command);
  } else {
    spec.category = *category;
    spec.id = request.entity_id;
    spec.working_dir = request.working_dir;
    spec.program = request.program;
    spec.args = request.args;
  }

  for (const auto &entry : request.env) {
    const auto eq = entry.find('=');
    if (eq == std::string::npos || eq == 0) {
      throw std::invalid_argument("Malformed env entry '" + entry + "'");
    }
    spec.env[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  if (!request.active_mode.empty()) {
    spec.metadata.active_mode = request.active_mode;
  }
  if (!request.active_arg_preset.empty()) {
    spec.metadata.active_arg_preset = request.active_arg_preset;
  }
  return spec;
}
}  // namespace MsgConverters
