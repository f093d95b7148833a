#include "proc_supervisor/process_manager.hpp"

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <rclcpp/rclcpp.hpp>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "proc_supervisor/event_dispatcher.hpp"
#include "proc_supervisor/output_pump.hpp"
#include "proc_supervisor/process_registry.hpp"

namespace {

rclcpp::Logger logger() { return rclcpp::get_logger("proc_supervisor.engine"); }

void validateConfig(const procTypes::SupervisorConfig &config) {
  if (config.poll_interval.count() <= 0) {
    throw std::invalid_argument("poll_interval must be positive");
  }
  if (config.shutdown_yield.count() < 0 ||
      config.output_drain_timeout.count() < 0 ||
      config.event_drain_timeout.count() < 0) {
    throw std::invalid_argument("shutdown_yield, output_drain_timeout and "
                                "event_drain_timeout cannot be negative");
  }
}

}  // namespace

// State shared with the pump and exit-watch threads; they keep it alive
// after the manager is gone.
struct ProcessManager::Shared {
  Shared(std::shared_ptr<ProcessEventSink> sink,
         procTypes::SupervisorConfig cfg,
         std::shared_ptr<TerminationStrategy> strategy)
      : events(std::move(sink)),
        termination(std::move(strategy)),
        config(cfg) {}

  ProcessRegistry registry;
  EventDispatcher events;
  std::shared_ptr<TerminationStrategy> termination;
  const procTypes::SupervisorConfig config;
  // Held shared by launch() around spawn and registration, exclusively by
  // shutdown() to wait out launches that are spawning but not registered yet.
  std::shared_mutex launch_gate;
};

// Counts the pumps of one launch still reading, so the exit report can wait
// for the last lines of output.
struct ProcessManager::OutputDrain {
  std::mutex mutex;
  std::condition_variable cv;
  int active = 0;

  void add() {
    std::lock_guard<std::mutex> lock(mutex);
    ++active;
  }

  void done() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      --active;
    }
    cv.notify_all();
  }

  bool waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [this] { return active == 0; });
  }
};

ProcessManager::ProcessManager(std::shared_ptr<ProcessEventSink> sink,
                               procTypes::SupervisorConfig config)
    : ProcessManager(std::move(sink), config,
                     makeDefaultTerminationStrategy(config.termination)) {}

ProcessManager::ProcessManager(std::shared_ptr<ProcessEventSink> sink,
                               procTypes::SupervisorConfig config,
                               std::shared_ptr<TerminationStrategy> strategy) {
  if (strategy == nullptr) {
    throw std::invalid_argument("TerminationStrategy pointer cannot be null");
  }
  validateConfig(config);
  shared_ = std::make_shared<Shared>(std::move(sink), config,
                                     std::move(strategy));
  RCLCPP_DEBUG(logger(), "ProcessManager created (poll %lld ms, %s strategy)",
               static_cast<long long>(config.poll_interval.count()),
               shared_->termination->name());
}

ProcessManager::~ProcessManager() {
  if (!shared_->events.shuttingDown()) {
    shutdown();
  }
}

const procTypes::SupervisorConfig &ProcessManager::config() const {
  return shared_->config;
}

pid_t ProcessManager::launch(const procTypes::LaunchSpec &spec) {
  if (spec.id.empty()) {
    throw std::invalid_argument("Entity id cannot be empty");
  }
  Shared &s = *shared_;
  const auto category = spec.category;
  const std::string &id = spec.id;

  if (s.events.shuttingDown()) {
    throw ShuttingDownError(id);
  }
  if (!s.registry.reserve(category, id)) {
    RCLCPP_WARN(logger(), "%s %s is already running",
                procTypes::toString(category), id.c_str());
    throw AlreadyRunningError(id);
  }

  // Observers see the attempt even if the spawn fails.
  procTypes::StatusEvent announce;
  announce.category = category;
  announce.id = id;
  announce.state = procTypes::isService(category)
                       ? procTypes::LifecycleState::Starting
                       : procTypes::LifecycleState::Running;
  announce.metadata = spec.metadata;
  s.events.emit(announce);

  pid_t pid = 0;
  UniqueFd stdout_fd;
  UniqueFd stderr_fd;
  {
    // Spawn and registration only; no sink is called under the gate.
    std::shared_lock<std::shared_mutex> launching(s.launch_gate);
    if (s.events.shuttingDown()) {
      s.registry.release(category, id);
      throw ShuttingDownError(id);
    }

    std::unique_ptr<ProcessHandle> handle;
    try {
      handle = ProcessHandle::spawn(spec);
    } catch (const SpawnFailedError &e) {
      s.registry.release(category, id);
      launching.unlock();
      RCLCPP_ERROR(logger(), "%s", e.what());
      procTypes::StatusEvent failed = announce;
      failed.state = procTypes::terminalStateForStop(category);
      s.events.emit(failed);
      throw;
    }

    pid = handle->pid();
    stdout_fd = handle->takeStdout();
    stderr_fd = handle->takeStderr();
    s.registry.commit(category, id, std::move(handle));
  }
  RCLCPP_INFO(logger(), "Started %s %s (PID: %d)",
              procTypes::toString(category), id.c_str(),
              static_cast<int>(pid));

  procTypes::StatusEvent running = announce;
  running.state = procTypes::LifecycleState::Running;
  running.pid = pid;
  s.events.emit(running);

  auto drain = std::make_shared<OutputDrain>();
  startPump(std::move(stdout_fd), procTypes::LogStream::Stdout, category, id,
            drain);
  startPump(std::move(stderr_fd), procTypes::LogStream::Stderr, category, id,
            drain);

  std::thread(&ProcessManager::watchExit, shared_, drain, category, id,
              spec.metadata)
      .detach();
  return pid;
}

void ProcessManager::startPump(UniqueFd fd, procTypes::LogStream stream,
                               procTypes::ProcessCategory category,
                               const std::string &id,
                               std::shared_ptr<OutputDrain> drain) {
  drain->add();
  auto shared = shared_;
  std::thread([shared, drain, stream, category, id,
               fd = std::move(fd)]() mutable {
    RCLCPP_DEBUG(logger(), "%s pump for %s started",
                 procTypes::toString(stream), id.c_str());
    pumpLines(
        std::move(fd),
        [&](std::string line) {
          procTypes::LogEvent event;
          event.category = category;
          event.id = id;
          event.stream = stream;
          event.text = std::move(line);
          shared->events.emit(event);
        },
        [&]() { return shared->events.shuttingDown(); },
        shared->config.poll_interval);
    RCLCPP_DEBUG(logger(), "%s pump for %s finished",
                 procTypes::toString(stream), id.c_str());
    drain->done();
  }).detach();
}

void ProcessManager::watchExit(std::shared_ptr<Shared> shared,
                               std::shared_ptr<OutputDrain> drain,
                               procTypes::ProcessCategory category,
                               std::string id,
                               procTypes::ProcessMetadata metadata) {
  for (;;) {
    // The shutdown path force-kills and reaps instead.
    if (shared->events.shuttingDown()) {
      return;
    }

    std::this_thread::sleep_for(shared->config.poll_interval);

    auto result = shared->registry.pollExit(category, id);
    if (result.outcome == ProcessRegistry::PollOutcome::Absent) {
      // Removed by stop() or shutdown(), which report on their own.
      return;
    }
    if (result.outcome == ProcessRegistry::PollOutcome::Running) {
      continue;
    }

    result.handle.reset();
    if (result.wait_failed) {
      RCLCPP_WARN(logger(), "%s %s could not be waited on, reporting it as "
                  "terminated abnormally",
                  procTypes::toString(category), id.c_str());
    } else if (result.exit_code) {
      RCLCPP_INFO(logger(), "%s %s exited with code %d",
                  procTypes::toString(category), id.c_str(),
                  *result.exit_code);
    } else {
      RCLCPP_INFO(logger(), "%s %s terminated abnormally",
                  procTypes::toString(category), id.c_str());
    }

    // Let the pumps deliver the last lines before the terminal events.
    if (!drain->waitIdle(shared->config.output_drain_timeout)) {
      RCLCPP_DEBUG(logger(), "Output of %s still open after exit, reporting",
                   id.c_str());
    }

    procTypes::StatusEvent status;
    status.category = category;
    status.id = id;
    status.state = procTypes::terminalStateForExit(category, result.exit_code);
    status.metadata = metadata;
    shared->events.emit(status);

    procTypes::ExitEvent exit;
    exit.category = category;
    exit.id = id;
    exit.exit_code = result.exit_code;
    exit.success = procTypes::exitSucceeded(result.exit_code);
    shared->events.emit(exit);
    return;
  }
}

void ProcessManager::stop(procTypes::ProcessCategory category,
                          const std::string &id) {
  Shared &s = *shared_;

  // Removing first keeps a concurrent exit-watch tick from reporting too.
  auto handle = s.registry.remove(category, id);
  if (handle == nullptr) {
    throw NotRunningError(id);
  }

  const pid_t pid = handle->pid();
  const procTypes::ProcessMetadata metadata = handle->metadata();
  RCLCPP_INFO(logger(), "Stopping %s %s (PID: %d)",
              procTypes::toString(category), id.c_str(),
              static_cast<int>(pid));

  if (!s.termination->killTree(pid)) {
    RCLCPP_ERROR(logger(), "Failed to kill process tree for PID %d",
                 static_cast<int>(pid));
  }
  if (!handle->kill()) {
    RCLCPP_ERROR(logger(), "Failed to kill PID %d directly",
                 static_cast<int>(pid));
  }
  const std::optional<int> exit_code = handle->wait();
  handle.reset();

  procTypes::StatusEvent status;
  status.category = category;
  status.id = id;
  status.state = procTypes::terminalStateForStop(category);
  status.metadata = metadata;
  s.events.emit(status);

  procTypes::ExitEvent exit;
  exit.category = category;
  exit.id = id;
  exit.exit_code = exit_code;
  exit.success = false;
  s.events.emit(exit);
}

bool ProcessManager::is_running(procTypes::ProcessCategory category,
                                const std::string &id) const {
  return shared_->registry.contains(category, id);
}

std::vector<std::string> ProcessManager::list_running(
    procTypes::ProcessCategory category) const {
  return shared_->registry.list(category);
}

bool ProcessManager::has_running_processes() const {
  return !shared_->registry.empty();
}

void ProcessManager::waitUntilFinished(procTypes::ProcessCategory category,
                                       const std::string &id) const {
  while (is_running(category, id)) {
    std::this_thread::sleep_for(shared_->config.poll_interval);
  }
}

std::vector<procTypes::GroupLaunchResult> ProcessManager::run_group(
    const std::vector<procTypes::LaunchSpec> &specs,
    procTypes::ExecutionMode mode, bool stop_on_failure) {
  const bool sequential = mode == procTypes::ExecutionMode::Sequential;
  std::vector<procTypes::GroupLaunchResult> results;
  results.reserve(specs.size());

  for (const auto &spec : specs) {
    procTypes::GroupLaunchResult result;
    result.id = spec.id;
    try {
      result.pid = launch(spec);
    } catch (const ProcessError &e) {
      result.error_kind = e.kind();
      result.message = e.what();
    } catch (const std::invalid_argument &e) {
      result.error_kind = procTypes::ErrorKind::SpawnFailed;
      result.message = e.what();
    }

    const bool failed = !result.ok();
    results.push_back(std::move(result));

    if (!sequential) {
      continue;
    }
    if (failed) {
      if (stop_on_failure) {
        RCLCPP_INFO(logger(), "Group stopped after %s failed to start",
                    spec.id.c_str());
        break;
      }
      continue;
    }
    waitUntilFinished(spec.category, spec.id);
  }
  return results;
}

bool ProcessManager::is_shutting_down() const {
  return shared_->events.shuttingDown();
}

void ProcessManager::shutdown() {
  std::lock_guard<std::mutex> guard(shutdown_mutex_);
  Shared &s = *shared_;

  const bool first = s.events.beginShutdown();
  { std::unique_lock<std::shared_mutex> no_launch_in_flight(s.launch_gate); }

  if (first) {
    RCLCPP_INFO(logger(), "Shutting down, stopping all services and scripts");
    // Give watch loops a moment to see the flag.
    std::this_thread::sleep_for(s.config.shutdown_yield);
  }

  const auto entries = s.registry.snapshot();
  for (const auto &entry : entries) {
    RCLCPP_INFO(logger(), "Stopping %s %s (PID: %d)",
                procTypes::toString(entry.category), entry.id.c_str(),
                static_cast<int>(entry.pid));
    if (!s.termination->killTreeRobust(entry.pid)) {
      RCLCPP_ERROR(logger(), "Failed to kill process tree for PID %d",
                   static_cast<int>(entry.pid));
    }
  }

  for (auto &handle : s.registry.drain()) {
    if (!handle->kill()) {
      RCLCPP_ERROR(logger(), "Failed to kill PID %d directly",
                   static_cast<int>(handle->pid()));
    }
    handle->wait();
  }

  // Final net for group members that outlived their reaped leader.
  for (const auto &entry : entries) {
    if (!s.termination->killGroupRemnants(entry.pid)) {
      RCLCPP_WARN(logger(), "Process group %d still reported alive after "
                  "shutdown", static_cast<int>(entry.pid));
    }
  }

  // Sink callbacks that started before the flag was set may still be
  // running; they get a bounded wait so a stuck sink cannot hold up exit.
  if (!s.events.waitIdle(s.config.event_drain_timeout)) {
    RCLCPP_WARN(logger(), "Event sink still busy after %lld ms, not waiting",
                static_cast<long long>(s.config.event_drain_timeout.count()));
  }

  if (first) {
    RCLCPP_INFO(logger(), "All services and scripts stopped");
  }
}
