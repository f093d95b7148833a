#include <cctype>
#include <cstdio>
#include <memory>
#include <rclcpp/rclcpp.hpp>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <sys/wait.h>
#endif

#include "proc_supervisor/termination_strategy.hpp"

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("proc_supervisor.termination");
}

std::string quoteArgument(const std::string &arg) {
  if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
    return arg;
  }
  std::string quoted = "\"";
  for (const char c : arg) {
    if (c == '"') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

}  // namespace

CommandOutput runCommand(const std::vector<std::string> &argv) {
  CommandOutput result;
  if (argv.empty()) {
    return result;
  }

  std::string command_line;
  for (const auto &arg : argv) {
    if (!command_line.empty()) {
      command_line += ' ';
    }
    command_line += quoteArgument(arg);
  }
  command_line += " 2>&1";

#ifdef _WIN32
  FILE *pipe = _popen(command_line.c_str(), "r");
#else
  FILE *pipe = popen(command_line.c_str(), "r");
#endif
  if (pipe == nullptr) {
    return result;
  }
  result.launched = true;

  char buffer[512];
  while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    result.output += buffer;
  }

#ifdef _WIN32
  result.exit_status = _pclose(pipe);
#else
  const int status = pclose(pipe);
  result.exit_status =
      (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
#endif
  return result;
}

TreeKillUtilityStrategy::TreeKillUtilityStrategy(
    procTypes::TerminationTimings timings, CommandRunner runner)
    : timings_(timings), runner_(std::move(runner)) {
  if (!runner_) {
    throw std::invalid_argument("CommandRunner cannot be empty");
  }
}

CommandOutput TreeKillUtilityStrategy::taskkill(pid_t pid) const {
  return runner_({"taskkill", "/F", "/T", "/PID", std::to_string(pid)});
}

bool TreeKillUtilityStrategy::reportsNotFound(const std::string &output) {
  return output.find("not found") != std::string::npos ||
         output.find("No tasks") != std::string::npos;
}

bool TreeKillUtilityStrategy::listsPid(const std::string &output, pid_t pid) {
  // Whole-number match so that PID 12 is not found inside 4123.
  const std::string needle = std::to_string(pid);
  std::size_t pos = output.find(needle);
  while (pos != std::string::npos) {
    const bool left_ok =
        pos == 0 ||
        !std::isdigit(static_cast<unsigned char>(output[pos - 1]));
    const std::size_t end = pos + needle.size();
    const bool right_ok =
        end >= output.size() ||
        !std::isdigit(static_cast<unsigned char>(output[end]));
    if (left_ok && right_ok) {
      return true;
    }
    pos = output.find(needle, pos + 1);
  }
  return false;
}

bool TreeKillUtilityStrategy::killTree(pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  const auto result = taskkill(pid);
  if (!result.launched) {
    RCLCPP_ERROR(logger(), "Failed to execute taskkill for PID %d",
                 static_cast<int>(pid));
    return false;
  }
  return result.exit_status == 0 || reportsNotFound(result.output);
}

bool TreeKillUtilityStrategy::killTreeRobust(pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  const std::string pid_str = std::to_string(pid);

  const auto first = taskkill(pid);
  if (!first.launched) {
    RCLCPP_ERROR(logger(), "Failed to execute taskkill for PID %d",
                 static_cast<int>(pid));
    return false;
  }

  std::this_thread::sleep_for(timings_.robust_settle);

  const auto check = runner_({"tasklist", "/FI", "PID eq " + pid_str, "/NH"});
  if (check.launched && listsPid(check.output, pid)) {
    RCLCPP_WARN(logger(),
                "Process %d still running after first kill attempt, "
                "retrying...",
                static_cast<int>(pid));
    std::this_thread::sleep_for(timings_.robust_retry_delay);
    (void)taskkill(pid);
    std::this_thread::sleep_for(timings_.robust_settle);
  }

  // Children whose parent link survived the tree kill.
  const auto sweep = runner_(
      {"wmic", "process", "where", "ParentProcessId=" + pid_str, "delete"});
  if (!sweep.launched) {
    RCLCPP_DEBUG(logger(), "wmic sweep for PID %d could not be started",
                 static_cast<int>(pid));
  }

  // An already exited process is not an error.
  if (first.exit_status != 0 && !reportsNotFound(first.output)) {
    RCLCPP_ERROR(logger(), "taskkill failed for PID %d: %s",
                 static_cast<int>(pid), first.output.c_str());
    return false;
  }
  return true;
}

bool TreeKillUtilityStrategy::killGroupRemnants(pid_t pid) {
  return pid > 0;
}

std::shared_ptr<TerminationStrategy> makeDefaultTerminationStrategy(
    const procTypes::TerminationTimings &timings) {
#ifdef _WIN32
  return std::make_shared<TreeKillUtilityStrategy>(timings);
#else
  return std::make_shared<ProcessGroupStrategy>(timings);
#endif
}
