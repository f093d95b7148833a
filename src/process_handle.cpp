#include "proc_supervisor/process_handle.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <rclcpp/rclcpp.hpp>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "proc_supervisor/process_errors.hpp"

extern char **environ;

namespace {

// 子进程在 exec 之前失败时，通过错误管道回传的失败阶段
enum class ChildStage : int { Chdir = 1, Exec = 2, Stdio = 3 };

struct ChildFailure {
  int stage;
  int error;
};

rclcpp::Logger logger() { return rclcpp::get_logger("proc_supervisor.spawn"); }

const char *stageName(int stage) {
  switch (static_cast<ChildStage>(stage)) {
    case ChildStage::Chdir:
      return "cannot change to working directory";
    case ChildStage::Exec:
      return "cannot execute program";
    case ChildStage::Stdio:
      return "cannot redirect standard streams";
  }
  return "child setup failed";
}

std::string errnoMessage(int error) { return std::strerror(error); }

/**
 * Ambient environment with the overrides applied on top; same-keyed ambient
 * variables are replaced, all others inherited.
 */
std::vector<std::string> buildEnvironment(
    const procTypes::EnvOverrides &overrides) {
  procTypes::EnvOverrides merged;
  for (char **entry = environ; entry != nullptr && *entry != nullptr;
       ++entry) {
    const std::string kv(*entry);
    const auto eq = kv.find('=');
    if (eq == std::string::npos || eq == 0) {
      continue;
    }
    merged[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  for (const auto &kv : overrides) {
    merged[kv.first] = kv.second;
  }

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto &kv : merged) {
    out.push_back(kv.first + "=" + kv.second);
  }
  return out;
}

// Only async-signal-safe calls below: this runs between fork and exec.
[[noreturn]] void failChild(int report_fd, ChildStage stage) {
  const ChildFailure failure{static_cast<int>(stage), errno};
  ssize_t ignored = ::write(report_fd, &failure, sizeof(failure));
  (void)ignored;
  _exit(127);
}

void closePair(int fds[2]) {
  if (fds[0] >= 0) {
    ::close(fds[0]);
  }
  if (fds[1] >= 0) {
    ::close(fds[1]);
  }
}

}  // namespace

void UniqueFd::reset(int fd) {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

ProcessHandle::ProcessHandle(const procTypes::LaunchSpec &spec, pid_t pid,
                             UniqueFd stdout_fd, UniqueFd stderr_fd)
    : id_(spec.id),
      category_(spec.category),
      metadata_(spec.metadata),
      pid_(pid),
      stdout_fd_(std::move(stdout_fd)),
      stderr_fd_(std::move(stderr_fd)) {}

ProcessHandle::~ProcessHandle() {
  if (!reaped_ && pid_ > 0) {
    ::kill(pid_, SIGKILL);
    (void)wait();
  }
}

std::unique_ptr<ProcessHandle> ProcessHandle::spawn(
    const procTypes::LaunchSpec &spec) {
  if (spec.program.empty()) {
    throw SpawnFailedError(spec.id, "empty program");
  }

  // 所有数据在 fork 之前准备好，子进程中不再分配内存
  std::vector<std::string> env_storage = buildEnvironment(spec.env);
  std::vector<char *> envp;
  envp.reserve(env_storage.size() + 1);
  for (auto &entry : env_storage) {
    envp.push_back(const_cast<char *>(entry.c_str()));
  }
  envp.push_back(nullptr);

  std::vector<char *> argv;
  argv.reserve(spec.args.size() + 2);
  argv.push_back(const_cast<char *>(spec.program.c_str()));
  for (const auto &arg : spec.args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int report_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(report_pipe, O_CLOEXEC) != 0) {
    const int error = errno;
    closePair(out_pipe);
    closePair(err_pipe);
    closePair(report_pipe);
    throw SpawnFailedError(spec.id, "pipe() failed: " + errnoMessage(error));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int error = errno;
    closePair(out_pipe);
    closePair(err_pipe);
    closePair(report_pipe);
    throw SpawnFailedError(spec.id, "fork() failed: " + errnoMessage(error));
  }

  if (pid == 0) {
    // Child: own process group so the tree can be signalled as -pid.
    ::setpgid(0, 0);

    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      ::dup2(null_fd, STDIN_FILENO);
    }
    if (::dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
        ::dup2(err_pipe[1], STDERR_FILENO) < 0) {
      failChild(report_pipe[1], ChildStage::Stdio);
    }

    if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
      failChild(report_pipe[1], ChildStage::Chdir);
    }

    environ = envp.data();
    ::execvp(argv[0], argv.data());
    failChild(report_pipe[1], ChildStage::Exec);
  }

  // Parent. Repeat setpgid to close the race with the child's own call; it
  // fails harmlessly once the child has exec'd.
  ::setpgid(pid, pid);
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  ::close(report_pipe[1]);
  UniqueFd stdout_fd(out_pipe[0]);
  UniqueFd stderr_fd(err_pipe[0]);
  UniqueFd report_fd(report_pipe[0]);

  ChildFailure failure{0, 0};
  ssize_t n = 0;
  do {
    n = ::read(report_fd.get(), &failure, sizeof(failure));
  } while (n < 0 && errno == EINTR);

  if (n > 0) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    const std::string reason = std::string(stageName(failure.stage)) + " '" +
                               (failure.stage ==
                                        static_cast<int>(ChildStage::Chdir)
                                    ? spec.working_dir
                                    : spec.program) +
                               "': " + errnoMessage(failure.error);
    RCLCPP_DEBUG(logger(), "Spawn of %s failed: %s", spec.id.c_str(),
                 reason.c_str());
    throw SpawnFailedError(spec.id, reason);
  }

  RCLCPP_DEBUG(logger(), "Spawned %s (PID: %d)", spec.toString().c_str(),
               static_cast<int>(pid));
  return std::unique_ptr<ProcessHandle>(new ProcessHandle(
      spec, pid, std::move(stdout_fd), std::move(stderr_fd)));
}

UniqueFd ProcessHandle::takeStdout() { return std::move(stdout_fd_); }

UniqueFd ProcessHandle::takeStderr() { return std::move(stderr_fd_); }

void ProcessHandle::recordStatus(int status) {
  reaped_ = true;
  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else {
    exit_code_.reset();
  }
}

ProcessHandle::WaitStatus ProcessHandle::tryWait() {
  if (reaped_) {
    return WaitStatus{true, exit_code_};
  }

  int status = 0;
  const pid_t r = ::waitpid(pid_, &status, WNOHANG);
  if (r == 0) {
    return WaitStatus{};
  }
  if (r == pid_) {
    recordStatus(status);
    return WaitStatus{true, exit_code_};
  }
  if (errno == EINTR) {
    return WaitStatus{};
  }
  const int error = errno;
  if (error == ECHILD) {
    reaped_ = true;
  }
  throw std::system_error(error, std::generic_category(),
                          "waitpid(" + std::to_string(pid_) + ")");
}

std::optional<int> ProcessHandle::wait() {
  if (reaped_) {
    return exit_code_;
  }

  int status = 0;
  pid_t r = 0;
  do {
    r = ::waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);

  if (r == pid_) {
    recordStatus(status);
  } else {
    RCLCPP_WARN(logger(), "waitpid(%d) failed: %s", static_cast<int>(pid_),
                std::strerror(errno));
    reaped_ = true;
    exit_code_.reset();
  }
  return exit_code_;
}

bool ProcessHandle::kill() {
  if (reaped_) {
    return true;
  }
  if (::kill(pid_, SIGKILL) == 0) {
    return true;
  }
  return errno == ESRCH;
}
