/**
 * @file process_manager.hpp
 * @brief Header file for the ProcessManager class, which supervises the
 * lifecycle of external processes.
 *
 * This file defines the ProcessManager class, providing methods to launch,
 * stop, group-run and shut down supervised services and scripts. Output and
 * lifecycle transitions are reported through a ProcessEventSink.
 *
 * @note Processes are created with fork and exec and placed in their own
 * process group; see ProcessHandle and TerminationStrategy for the platform
 * details.
 *
 * @see ProcessManager
 */
#pragma once

#include <sys/types.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "proc_supervisor/proc_types.hpp"
#include "proc_supervisor/process_errors.hpp"
#include "proc_supervisor/process_handle.hpp"
#include "proc_supervisor/process_event_sink.hpp"
#include "proc_supervisor/termination_strategy.hpp"

/**
 * @class ProcessManager
 * @brief Supervision engine for services, project scripts and global scripts.
 *
 * Every launched process gets two output-pump threads (stdout, stderr) and
 * one exit-watch thread that polls for natural termination. A process is
 * listed as running exactly while it is registered; either stop() or the
 * exit-watch thread removes it, and whichever does reports the single
 * terminal Status/Exit pair.
 *
 * Threads started by the manager only hold shared state, so they may outlive
 * the manager itself; after shutdown() they end at their next poll.
 *
 * @note No operation has a timeout: a child that never exits is terminated
 * only by stop() or shutdown().
 */
class ProcessManager {
 public:
  /**
   * @brief Constructs a ProcessManager using the platform's default
   * termination strategy.
   *
   * @param sink Receiver of every event, must not be null.
   * @param config Poll intervals and termination timings.
   * @throws std::invalid_argument if @p sink is null or the config is invalid.
   */
  explicit ProcessManager(std::shared_ptr<ProcessEventSink> sink,
                          procTypes::SupervisorConfig config = {});

  /**
   * @brief Constructs a ProcessManager with an explicit termination strategy.
   *
   * @throws std::invalid_argument if @p sink or @p strategy is null.
   */
  ProcessManager(std::shared_ptr<ProcessEventSink> sink,
                 procTypes::SupervisorConfig config,
                 std::shared_ptr<TerminationStrategy> strategy);

  /**
   * @brief Destructor for ProcessManager.
   *
   * Runs shutdown() unless it already happened.
   */
  ~ProcessManager();

  ProcessManager(const ProcessManager &) = delete;
  ProcessManager &operator=(const ProcessManager &) = delete;

  /**
   * @brief Launches a process.
   *
   * Reserves (category, id), emits Starting (services) or Running (scripts),
   * spawns the process, registers it and emits Running with the pid.
   *
   * @return The OS process id of the new process.
   * @throws AlreadyRunningError if (category, id) is running or starting;
   * nothing is spawned.
   * @throws SpawnFailedError if the OS refused; the id is immediately
   * launchable again.
   * @throws ShuttingDownError once shutdown() has begun.
   * @throws std::invalid_argument if the id is empty.
   */
  pid_t launch(const procTypes::LaunchSpec &spec);

  /**
   * @brief Stops a running process and its descendants.
   *
   * Removes the entry first, kills the process tree, reaps the child and
   * reports Stopped (services) or Failed (scripts) followed by an Exit with
   * success == false.
   *
   * @throws NotRunningError if (category, id) is not registered.
   */
  void stop(procTypes::ProcessCategory category, const std::string &id);

  /**
   * @brief Checks if (category, id) is currently registered.
   */
  bool is_running(procTypes::ProcessCategory category,
                  const std::string &id) const;

  /**
   * @brief Snapshot of the running ids of one category.
   */
  std::vector<std::string> list_running(
      procTypes::ProcessCategory category) const;

  /**
   * @brief true if any category has a running process.
   */
  bool has_running_processes() const;

  /**
   * @brief Runs a group of launch specs.
   *
   * Parallel launches every entry without waiting. Sequential launches in
   * order and waits for each successful launch to finish before the next; a
   * failed launch ends the group when @p stop_on_failure is set, and the
   * remaining entries are neither attempted nor reported.
   *
   * @return One result per attempted entry, in order.
   */
  std::vector<procTypes::GroupLaunchResult> run_group(
      const std::vector<procTypes::LaunchSpec> &specs,
      procTypes::ExecutionMode mode, bool stop_on_failure);

  /**
   * @brief Stops everything and suppresses further events.
   *
   * Sets the shutdown signal, force-kills every registered process tree
   * (robust tier), drains the registry and reaps every child, then kills
   * any group members that outlived their leader. Sink callbacks already
   * running get at most event_drain_timeout to finish. Safe to call more
   * than once.
   */
  void shutdown();

  bool is_shutting_down() const;

  const procTypes::SupervisorConfig &config() const;

 private:
  struct Shared;
  struct OutputDrain;

  void startPump(UniqueFd fd, procTypes::LogStream stream,
                 procTypes::ProcessCategory category, const std::string &id,
                 std::shared_ptr<OutputDrain> drain);
  void waitUntilFinished(procTypes::ProcessCategory category,
                         const std::string &id) const;

  static void watchExit(std::shared_ptr<Shared> shared,
                        std::shared_ptr<OutputDrain> drain,
                        procTypes::ProcessCategory category, std::string id,
                        procTypes::ProcessMetadata metadata);

  std::shared_ptr<Shared> shared_;
  std::mutex shutdown_mutex_;
};
