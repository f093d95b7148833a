/**
 * @file termination_strategy.hpp
 * @brief Platform-specific routines that kill a process and its descendants.
 *
 * Two tiers are offered by every strategy:
 *   - killTree(): best effort, used for an ordinary user-initiated stop where
 *     latency matters more than certainty.
 *   - killTreeRobust(): kill, verify through a process listing, retry once and
 *     sweep leftover children. Used during full shutdown, when the host is
 *     about to exit and orphans would outlive it.
 *
 * Neither tier throws. A process that is already gone is not a failure; other
 * failures are logged and reported through the return value only.
 */
#pragma once

#include <sys/types.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "proc_supervisor/proc_types.hpp"

class TerminationStrategy {
 public:
  virtual ~TerminationStrategy() = default;

  /**
   * @brief Best-effort kill of @p pid and its descendants.
   * @return false if the kill could not be issued.
   */
  virtual bool killTree(pid_t pid) = 0;

  /**
   * @brief Kill with verification and one retry.
   * @return false if the process is still alive afterwards or the kill
   * could not be issued.
   */
  virtual bool killTreeRobust(pid_t pid) = 0;

  /**
   * @brief Kills what is left of the group led by an already reaped @p pid.
   *
   * Never signals @p pid itself or looks up its children, since the pid may
   * have been reused once the leader was reaped.
   * @return false if a surviving group could not be signalled.
   */
  virtual bool killGroupRemnants(pid_t pid) = 0;

  virtual const char *name() const = 0;
};

/**
 * @class ProcessGroupStrategy
 * @brief POSIX strategy: signals the process group (negated pid).
 *
 * Stop behavior:
 *   - SIGTERM to the group, wait term_grace
 *   - SIGKILL to the group
 *
 * The robust tier re-checks liveness through /proc (zombies count as dead),
 * falls back to kill(pid, 0) where /proc is unavailable, and sweeps the
 * descendants recorded before the first signal.
 */
class ProcessGroupStrategy : public TerminationStrategy {
 public:
  explicit ProcessGroupStrategy(procTypes::TerminationTimings timings = {});

  bool killTree(pid_t pid) override;
  bool killTreeRobust(pid_t pid) override;
  bool killGroupRemnants(pid_t pid) override;
  const char *name() const override { return "process-group"; }

  /**
   * @brief true if @p pid exists and is not a zombie.
   */
  static bool isAlive(pid_t pid);

  /**
   * @brief Live processes whose parent is @p ppid. Empty without /proc.
   */
  static std::vector<pid_t> childrenOf(pid_t ppid);

  /**
   * @brief Transitive children of @p pid, breadth first.
   */
  static std::vector<pid_t> descendantsOf(pid_t pid);

 private:
  bool signalGroup(pid_t pid, int sig) const;

  procTypes::TerminationTimings timings_;
};

/**
 * @brief Output of an external utility run by TreeKillUtilityStrategy.
 */
struct CommandOutput {
  bool launched = false;  ///< false if the utility could not be started
  int exit_status = -1;
  std::string output;     ///< stdout and stderr combined
};

using CommandRunner =
    std::function<CommandOutput(const std::vector<std::string> &argv)>;

/**
 * @brief Runs @p argv through the platform shell and captures its output.
 */
CommandOutput runCommand(const std::vector<std::string> &argv);

/**
 * @class TreeKillUtilityStrategy
 * @brief Strategy for platforms without POSIX process groups.
 *
 * Delegates to the forceful tree-kill utility (taskkill /F /T), checks
 * liveness with the process lister (tasklist) and sweeps children by parent
 * pid (wmic). The runner is injectable so the retry protocol can be driven
 * without those utilities.
 */
class TreeKillUtilityStrategy : public TerminationStrategy {
 public:
  explicit TreeKillUtilityStrategy(procTypes::TerminationTimings timings = {},
                                   CommandRunner runner = runCommand);

  bool killTree(pid_t pid) override;
  bool killTreeRobust(pid_t pid) override;
  /// Without process groups a reaped pid identifies nothing; no-op.
  bool killGroupRemnants(pid_t pid) override;
  const char *name() const override { return "tree-kill-utility"; }

 private:
  CommandOutput taskkill(pid_t pid) const;
  static bool reportsNotFound(const std::string &output);
  static bool listsPid(const std::string &output, pid_t pid);

  procTypes::TerminationTimings timings_;
  CommandRunner runner_;
};

/**
 * @brief The strategy for the platform this was built for.
 */
std::shared_ptr<TerminationStrategy> makeDefaultTerminationStrategy(
    const procTypes::TerminationTimings &timings = {});
