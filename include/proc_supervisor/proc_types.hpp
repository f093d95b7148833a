// PROC_TYPES_HPP
#pragma once
#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace procTypes {

/**
 *@brief 进程所属的命名空间，不同类别之间的 id 互不冲突
 *@example Service "build" 与 GlobalScript "build" 可以同时运行
 */
enum class ProcessCategory : uint8_t {
  Service = 0,
  ProjectScript = 1,
  GlobalScript = 2,
};

constexpr std::size_t kCategoryCount = 3;

inline constexpr ProcessCategory kAllCategories[kCategoryCount] = {
    ProcessCategory::Service, ProcessCategory::ProjectScript,
    ProcessCategory::GlobalScript};

enum class LogStream : uint8_t { Stdout = 0, Stderr = 1 };

/**
 *@brief 生命周期状态
 * Service: Starting -> Running -> Stopped
 * Script:  Running -> Completed | Failed
 */
enum class LifecycleState : uint8_t {
  Starting = 0,
  Running = 1,
  Stopped = 2,
  Completed = 3,
  Failed = 4,
};

enum class ExecutionMode : uint8_t { Sequential = 0, Parallel = 1 };

enum class ErrorKind : uint8_t {
  AlreadyRunning = 0,
  NotRunning = 1,
  SpawnFailed = 2,
  ShuttingDown = 3,
};

inline const char *toString(ProcessCategory category) {
  switch (category) {
    case ProcessCategory::Service:
      return "service";
    case ProcessCategory::ProjectScript:
      return "script";
    case ProcessCategory::GlobalScript:
      return "global-script";
  }
  return "unknown";
}

inline const char *toString(LogStream stream) {
  return stream == LogStream::Stdout ? "stdout" : "stderr";
}

inline const char *toString(LifecycleState state) {
  switch (state) {
    case LifecycleState::Starting:
      return "starting";
    case LifecycleState::Running:
      return "running";
    case LifecycleState::Stopped:
      return "stopped";
    case LifecycleState::Completed:
      return "completed";
    case LifecycleState::Failed:
      return "failed";
  }
  return "unknown";
}

inline const char *toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::AlreadyRunning:
      return "already_running";
    case ErrorKind::NotRunning:
      return "not_running";
    case ErrorKind::SpawnFailed:
      return "spawn_failed";
    case ErrorKind::ShuttingDown:
      return "shutting_down";
  }
  return "unknown";
}

/**
 *@brief 解析类别名称，接受 toString 的输出以及 "project-script"
 */
[[nodiscard]] inline std::optional<ProcessCategory> categoryFromString(
    const std::string &name) {
  if (name == "service") {
    return ProcessCategory::Service;
  }
  if (name == "script" || name == "project-script") {
    return ProcessCategory::ProjectScript;
  }
  if (name == "global-script") {
    return ProcessCategory::GlobalScript;
  }
  return std::nullopt;
}

[[nodiscard]] inline bool isService(ProcessCategory category) {
  return category == ProcessCategory::Service;
}

/**
 *@brief 服务的附加信息，仅用于展示，随 stop/exit 事件原样带回
 */
struct ProcessMetadata {
  std::optional<std::string> active_mode;
  std::optional<std::string> active_arg_preset;

  bool operator==(const ProcessMetadata &other) const {
    return active_mode == other.active_mode &&
           active_arg_preset == other.active_arg_preset;
  }
};

using EnvOverrides = std::map<std::string, std::string>;

/**
 *@brief 将一条 shell 命令转换为 (program, args)
 * POSIX 下为 sh -c <command>，Windows 下为 cmd /C <command>
 */
[[nodiscard]] inline std::pair<std::string, std::vector<std::string>>
shellInvocation(const std::string &command) {
#ifdef _WIN32
  return {"cmd", {"/C", command}};
#else
  return {"sh", {"-c", command}};
#endif
}

/**
 *@brief 一次启动请求的完整描述
 */
struct LaunchSpec {
  ProcessCategory category = ProcessCategory::GlobalScript;
  std::string id;
  std::string working_dir;  // 为空时继承当前工作目录
  std::string program;
  std::vector<std::string> args;
  EnvOverrides env;
  ProcessMetadata metadata;

  /**
   *@brief 以 shell 形式构造启动请求
   */
  static LaunchSpec fromShellCommand(ProcessCategory category, std::string id,
                                     std::string working_dir,
                                     const std::string &command) {
    LaunchSpec spec;
    spec.category = category;
    spec.id = std::move(id);
    spec.working_dir = std::move(working_dir);
    auto invocation = shellInvocation(command);
    spec.program = std::move(invocation.first);
    spec.args = std::move(invocation.second);
    return spec;
  }

  std::string toString() const {
    std::stringstream ss;
    ss << "LaunchSpec(" << procTypes::toString(category) << ":" << id
       << ", program=" << program << ", args=[";
    for (std::size_t i = 0; i < args.size(); ++i) {
      ss << (i == 0 ? "" : ", ") << args[i];
    }
    ss << "], cwd=" << (working_dir.empty() ? "." : working_dir) << ")";
    return ss.str();
  }
};

/**
 *@brief 解析 "category|id|working_dir|shell command" 形式的启动条目
 *@return 格式错误或类别未知时返回 std::nullopt
 * 命令部分允许包含 '|'，只按前三个分隔符切分
 */
[[nodiscard]] std::optional<LaunchSpec> parseLaunchEntry(
    const std::string &entry);

//============事件============

struct LogEvent {
  ProcessCategory category = ProcessCategory::GlobalScript;
  std::string id;
  LogStream stream = LogStream::Stdout;
  std::string text;
};

struct StatusEvent {
  ProcessCategory category = ProcessCategory::GlobalScript;
  std::string id;
  LifecycleState state = LifecycleState::Running;
  std::optional<pid_t> pid;
  ProcessMetadata metadata;
};

struct ExitEvent {
  ProcessCategory category = ProcessCategory::GlobalScript;
  std::string id;
  std::optional<int> exit_code;
  bool success = false;
};

using ProcessEvent = std::variant<LogEvent, StatusEvent, ExitEvent>;

/**
 *@brief 脚本的终止状态由退出码决定，只有退出码恰好为 0 才算 Completed
 */
[[nodiscard]] inline bool exitSucceeded(const std::optional<int> &exit_code) {
  return exit_code.has_value() && *exit_code == 0;
}

[[nodiscard]] inline LifecycleState terminalStateForExit(
    ProcessCategory category, const std::optional<int> &exit_code) {
  if (isService(category)) {
    return LifecycleState::Stopped;
  }
  return exitSucceeded(exit_code) ? LifecycleState::Completed
                                  : LifecycleState::Failed;
}

/**
 *@brief 用户主动停止永远不会报告为成功
 */
[[nodiscard]] inline LifecycleState terminalStateForStop(
    ProcessCategory category) {
  return isService(category) ? LifecycleState::Stopped
                             : LifecycleState::Failed;
}

//============分组执行============

struct GroupLaunchResult {
  std::string id;
  std::optional<pid_t> pid;
  std::optional<ErrorKind> error_kind;
  std::string message;

  bool ok() const { return pid.has_value(); }
};

//============配置============

struct TerminationTimings {
  std::chrono::milliseconds term_grace{100};          // SIGTERM 与 SIGKILL 间隔
  std::chrono::milliseconds robust_settle{100};       // 强制结束后等待系统回收
  std::chrono::milliseconds robust_retry_delay{200};  // 重试前的额外等待
};

struct SupervisorConfig {
  std::chrono::milliseconds poll_interval{100};  // 退出检测的轮询间隔
  std::chrono::milliseconds shutdown_yield{50};  // 设置关闭标志后的让步时间
  std::chrono::milliseconds output_drain_timeout{500};  // 退出后等待输出读完的上限
  std::chrono::milliseconds event_drain_timeout{500};  // 关闭时等待进行中的事件回调的上限
  TerminationTimings termination;
};

}  // namespace procTypes
