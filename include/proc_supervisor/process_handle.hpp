/**
 * @file process_handle.hpp
 * @brief Owner of one supervised OS child process.
 *
 * A ProcessHandle is created by spawn(), which forks and executes the
 * requested program with stdout and stderr captured as pipes, stdin bound to
 * /dev/null, the working directory changed and the environment merged with
 * the caller's overrides. The child is placed in its own process group so
 * the whole tree can be signalled through the negated pid.
 *
 * @note POSIX only. The handle is the exclusive owner of the child: nothing
 * else may wait on it. Destroying a handle whose child was never reaped kills
 * and reaps it.
 */
#pragma once

#include <sys/types.h>

#include <memory>
#include <optional>
#include <string>

#include "proc_supervisor/proc_types.hpp"

/**
 * @class UniqueFd
 * @brief Move-only owner of a file descriptor, closed on destruction.
 */
class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(UniqueFd &&other) noexcept : fd_(other.release()) {}
  UniqueFd &operator=(UniqueFd &&other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  int release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(int fd = -1);

 private:
  int fd_{-1};
};

class ProcessHandle {
 public:
  /**
   * @brief Result of a wait on the child.
   */
  struct WaitStatus {
    bool exited = false;
    std::optional<int> exit_code;  ///< Empty when killed by a signal.
  };

  /**
   * @brief Spawns the process described by @p spec.
   *
   * Failures that happen inside the child before exec (chdir, exec itself)
   * are sent back through a close-on-exec pipe, so this call fails
   * synchronously instead of producing a child that exits with 127.
   *
   * @param spec Launch description; category, id and metadata are recorded.
   * @return The handle owning the running child.
   * @throws SpawnFailedError if the process could not be started.
   */
  static std::unique_ptr<ProcessHandle> spawn(const procTypes::LaunchSpec &spec);

  ~ProcessHandle();

  ProcessHandle(const ProcessHandle &) = delete;
  ProcessHandle &operator=(const ProcessHandle &) = delete;

  pid_t pid() const { return pid_; }
  const std::string &id() const { return id_; }
  procTypes::ProcessCategory category() const { return category_; }
  const procTypes::ProcessMetadata &metadata() const { return metadata_; }

  /**
   * @brief Hands the read end of the stdout pipe to the caller. Subsequent
   * calls return an invalid fd.
   */
  UniqueFd takeStdout();
  UniqueFd takeStderr();

  /**
   * @brief Non-blocking wait.
   * @throws std::system_error if waitpid fails for a reason other than EINTR.
   */
  WaitStatus tryWait();

  /**
   * @brief Blocks until the child has been reaped.
   * @return Exit code, empty if the child was terminated by a signal or had
   * already been reaped elsewhere.
   */
  std::optional<int> wait();

  /**
   * @brief Sends SIGKILL to the child itself (not its group).
   * @return true if the signal was delivered or the child is already gone.
   */
  bool kill();

  bool reaped() const { return reaped_; }

 private:
  ProcessHandle(const procTypes::LaunchSpec &spec, pid_t pid,
                UniqueFd stdout_fd, UniqueFd stderr_fd);

  void recordStatus(int status);

  std::string id_;
  procTypes::ProcessCategory category_;
  procTypes::ProcessMetadata metadata_;
  pid_t pid_{-1};
  UniqueFd stdout_fd_;
  UniqueFd stderr_fd_;
  bool reaped_ = false;
  std::optional<int> exit_code_;
};
