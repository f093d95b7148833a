#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <optional>
#include <rclcpp/rclcpp.hpp>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "proc_supervisor/termination_strategy.hpp"

namespace {

namespace fs = std::filesystem;

rclcpp::Logger logger() {
  return rclcpp::get_logger("proc_supervisor.termination");
}

struct ProcStat {
  pid_t pid;
  char state;
  pid_t ppid;
};

// /proc/<pid>/stat: "pid (comm) state ppid ..."; comm may contain spaces and
// parentheses, so parsing starts after the last ')'.
std::optional<ProcStat> readProcStat(const fs::path &stat_path) {
  std::ifstream file(stat_path);
  if (!file) {
    return std::nullopt;
  }
  std::string content;
  std::getline(file, content);

  const auto open = content.find('(');
  const auto close = content.rfind(')');
  if (open == std::string::npos || close == std::string::npos ||
      close < open) {
    return std::nullopt;
  }

  ProcStat stat{};
  try {
    stat.pid = static_cast<pid_t>(std::stol(content.substr(0, open)));
  } catch (const std::exception &) {
    return std::nullopt;
  }

  std::istringstream rest(content.substr(close + 1));
  long ppid = 0;
  if (!(rest >> stat.state >> ppid)) {
    return std::nullopt;
  }
  stat.ppid = static_cast<pid_t>(ppid);
  return stat;
}

bool procAvailable() {
  std::error_code ec;
  return fs::exists("/proc/self/stat", ec);
}

bool isZombie(char state) { return state == 'Z' || state == 'X'; }

}  // namespace

ProcessGroupStrategy::ProcessGroupStrategy(
    procTypes::TerminationTimings timings)
    : timings_(timings) {}

bool ProcessGroupStrategy::isAlive(pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  if (procAvailable()) {
    const auto stat =
        readProcStat(fs::path("/proc") / std::to_string(pid) / "stat");
    return stat.has_value() && !isZombie(stat->state);
  }
  // kill(pid,0) checks existence/permission without sending a signal.
  if (::kill(pid, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

std::vector<pid_t> ProcessGroupStrategy::childrenOf(pid_t ppid) {
  std::vector<pid_t> children;
  if (ppid <= 0) {
    return children;
  }

  std::error_code ec;
  fs::directory_iterator it("/proc", ec);
  if (ec) {
    return children;
  }
  for (const auto &entry : it) {
    const auto name = entry.path().filename().string();
    if (name.empty() ||
        name.find_first_not_of("0123456789") != std::string::npos) {
      continue;
    }
    const auto stat = readProcStat(entry.path() / "stat");
    if (stat && stat->ppid == ppid && !isZombie(stat->state)) {
      children.push_back(stat->pid);
    }
  }
  return children;
}

std::vector<pid_t> ProcessGroupStrategy::descendantsOf(pid_t pid) {
  std::vector<pid_t> out;
  std::set<pid_t> seen{pid};
  std::deque<pid_t> queue{pid};
  while (!queue.empty()) {
    const pid_t current = queue.front();
    queue.pop_front();
    for (const pid_t child : childrenOf(current)) {
      if (seen.insert(child).second) {
        out.push_back(child);
        queue.push_back(child);
      }
    }
  }
  return out;
}

bool ProcessGroupStrategy::signalGroup(pid_t pid, int sig) const {
  if (::kill(-pid, sig) == 0 || errno == ESRCH) {
    return true;
  }
  // Group not signalable (e.g. the child left its group); fall back to the
  // process itself.
  const int group_error = errno;
  if (::kill(pid, sig) == 0 || errno == ESRCH) {
    return true;
  }
  RCLCPP_ERROR(logger(), "Failed to send signal %d to PID %d: %s", sig,
               static_cast<int>(pid), std::strerror(group_error));
  return false;
}

bool ProcessGroupStrategy::killTree(pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  const bool term_sent = signalGroup(pid, SIGTERM);
  std::this_thread::sleep_for(timings_.term_grace);
  const bool kill_sent = signalGroup(pid, SIGKILL);
  return term_sent || kill_sent;
}

bool ProcessGroupStrategy::killTreeRobust(pid_t pid) {
  if (pid <= 0) {
    return false;
  }

  // Recorded up front: once the parent dies its children are reparented and
  // can no longer be found by parent pid.
  const std::vector<pid_t> descendants = descendantsOf(pid);

  signalGroup(pid, SIGTERM);
  std::this_thread::sleep_for(timings_.robust_settle);

  if (isAlive(pid)) {
    RCLCPP_WARN(logger(),
                "Process %d still running after SIGTERM, sending SIGKILL...",
                static_cast<int>(pid));
    signalGroup(pid, SIGKILL);
    ::kill(pid, SIGKILL);
    std::this_thread::sleep_for(timings_.robust_settle);

    if (isAlive(pid)) {
      RCLCPP_WARN(logger(), "Process %d survived SIGKILL, retrying...",
                  static_cast<int>(pid));
      std::this_thread::sleep_for(timings_.robust_retry_delay);
      signalGroup(pid, SIGKILL);
      ::kill(pid, SIGKILL);
      std::this_thread::sleep_for(timings_.robust_settle);
    }
  }

  // Sweep children that escaped the group.
  for (const pid_t child : childrenOf(pid)) {
    ::kill(child, SIGKILL);
  }
  for (const pid_t descendant : descendants) {
    if (isAlive(descendant)) {
      RCLCPP_DEBUG(logger(), "Sweeping leftover descendant %d of %d",
                   static_cast<int>(descendant), static_cast<int>(pid));
      ::kill(descendant, SIGKILL);
    }
  }

  if (isAlive(pid)) {
    RCLCPP_ERROR(logger(), "Process %d is still alive after robust kill",
                 static_cast<int>(pid));
    return false;
  }
  return true;
}

bool ProcessGroupStrategy::killGroupRemnants(pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  // A pid is not handed out again while a group with that id still exists,
  // so signalling the group cannot reach an unrelated process.
  if (::kill(-pid, 0) != 0) {
    return errno == ESRCH;
  }
  RCLCPP_WARN(logger(), "Process group %d outlived its leader, sending SIGKILL",
              static_cast<int>(pid));
  if (::kill(-pid, SIGKILL) == 0 || errno == ESRCH) {
    return true;
  }
  RCLCPP_ERROR(logger(), "Failed to kill process group %d: %s",
               static_cast<int>(pid), std::strerror(errno));
  return false;
}
