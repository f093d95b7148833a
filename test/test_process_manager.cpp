#include <gtest/gtest.h>
#include <signal.h>
#include <sys/types.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "proc_supervisor/channel_event_sink.hpp"
#include "proc_supervisor/process_manager.hpp"

using procTypes::ExitEvent;
using procTypes::LifecycleState;
using procTypes::LogEvent;
using procTypes::ProcessCategory;
using procTypes::ProcessEvent;
using procTypes::StatusEvent;

namespace {

constexpr std::chrono::milliseconds kShortWait{20};

void wait_for_state(
    const std::function<bool()> &predicate,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  const auto start_time = std::chrono::steady_clock::now();
  while (!predicate()) {
    if (std::chrono::steady_clock::now() - start_time >= timeout) {
      break;
    }
    std::this_thread::sleep_for(kShortWait);
  }
}

procTypes::SupervisorConfig fast_config() {
  procTypes::SupervisorConfig config;
  config.poll_interval = std::chrono::milliseconds(20);
  config.shutdown_yield = std::chrono::milliseconds(10);
  config.output_drain_timeout = std::chrono::milliseconds(500);
  config.event_drain_timeout = std::chrono::milliseconds(200);
  config.termination.term_grace = std::chrono::milliseconds(50);
  config.termination.robust_settle = std::chrono::milliseconds(30);
  config.termination.robust_retry_delay = std::chrono::milliseconds(30);
  return config;
}

procTypes::LaunchSpec shell(ProcessCategory category, const std::string &id,
                            const std::string &command) {
  return procTypes::LaunchSpec::fromShellCommand(category, id, "", command);
}

procTypes::LaunchSpec program(ProcessCategory category, const std::string &id,
                              const std::string &path,
                              std::vector<std::string> args = {}) {
  procTypes::LaunchSpec spec;
  spec.category = category;
  spec.id = id;
  spec.program = path;
  spec.args = std::move(args);
  return spec;
}

bool process_gone(pid_t pid) { return kill(pid, 0) != 0 && errno == ESRCH; }

template <typename Event>
std::vector<Event> of_type(const std::vector<ProcessEvent> &events,
                           const std::string &id) {
  std::vector<Event> out;
  for (const auto &event : events) {
    if (const auto *e = std::get_if<Event>(&event)) {
      if (e->id == id) {
        out.push_back(*e);
      }
    }
  }
  return out;
}

std::vector<LifecycleState> states_of(const std::vector<ProcessEvent> &events,
                                      const std::string &id) {
  std::vector<LifecycleState> states;
  for (const auto &status : of_type<StatusEvent>(events, id)) {
    states.push_back(status.state);
  }
  return states;
}

std::vector<std::string> lines_of(const std::vector<ProcessEvent> &events,
                                  const std::string &id) {
  std::vector<std::string> lines;
  for (const auto &log : of_type<LogEvent>(events, id)) {
    lines.push_back(log.text);
  }
  return lines;
}

// 只对 stdout/stderr 抛异常的接收者，状态与退出事件照常记录
class ThrowingLogSink : public ChannelEventSink {
 public:
  void onLog(const LogEvent &) override {
    throw std::runtime_error("log view closed");
  }
};

// onLog 阻塞数秒，模拟卡住的日志视图
class SlowLogSink : public ChannelEventSink {
 public:
  void onLog(const LogEvent &event) override {
    std::this_thread::sleep_for(std::chrono::seconds(4));
    ChannelEventSink::onLog(event);
  }
};

// 记录调用次数后委托给真实策略
class CountingStrategy : public TerminationStrategy {
 public:
  explicit CountingStrategy(procTypes::TerminationTimings timings)
      : inner_(timings) {}

  bool killTree(pid_t pid) override {
    ++tree_calls;
    return inner_.killTree(pid);
  }
  bool killTreeRobust(pid_t pid) override {
    ++robust_calls;
    return inner_.killTreeRobust(pid);
  }
  bool killGroupRemnants(pid_t pid) override {
    ++remnant_calls;
    return inner_.killGroupRemnants(pid);
  }
  const char *name() const override { return "counting"; }

  std::atomic<int> tree_calls{0};
  std::atomic<int> robust_calls{0};
  std::atomic<int> remnant_calls{0};

 private:
  ProcessGroupStrategy inner_;
};

}  // namespace

class ProcessManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sink_ = std::make_shared<ChannelEventSink>();
    manager_ = std::make_unique<ProcessManager>(sink_, fast_config());
  }

  void TearDown() override { manager_.reset(); }

  /**
   * @brief 收集事件直到 id 的 Exit 事件到达(或超时)
   */
  std::vector<ProcessEvent> collect_until_exit(
      const std::string &id,
      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      auto event = sink_->waitPop(std::chrono::milliseconds(50));
      if (!event) {
        continue;
      }
      events_.push_back(*event);
      if (const auto *exit = std::get_if<ExitEvent>(&*event)) {
        if (exit->id == id) {
          break;
        }
      }
    }
    return events_;
  }

  std::vector<ProcessEvent> collect_for(std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
      if (auto event = sink_->waitPop(std::chrono::milliseconds(20))) {
        events_.push_back(*event);
      }
    }
    return events_;
  }

  std::shared_ptr<ChannelEventSink> sink_;
  std::unique_ptr<ProcessManager> manager_;
  std::vector<ProcessEvent> events_;
};

TEST_F(ProcessManagerTest, ConstructorRejectsInvalidArguments) {
  EXPECT_THROW(ProcessManager(nullptr, fast_config()), std::invalid_argument);
  EXPECT_THROW(ProcessManager(sink_, fast_config(), nullptr),
               std::invalid_argument);

  auto config = fast_config();
  config.poll_interval = std::chrono::milliseconds(0);
  EXPECT_THROW(ProcessManager(sink_, config), std::invalid_argument);
}

TEST_F(ProcessManagerTest, ScriptOutputThenCompletedThenSuccessfulExit) {
  const pid_t pid =
      manager_->launch(shell(ProcessCategory::GlobalScript, "hello",
                             "echo hello"));
  EXPECT_GT(pid, 0);

  const auto events = collect_until_exit("hello");

  const auto statuses = of_type<StatusEvent>(events, "hello");
  ASSERT_EQ(statuses.size(), 3u);
  EXPECT_EQ(statuses[0].state, LifecycleState::Running);
  EXPECT_FALSE(statuses[0].pid.has_value());
  EXPECT_EQ(statuses[1].state, LifecycleState::Running);
  EXPECT_EQ(statuses[1].pid, std::optional<pid_t>(pid));
  EXPECT_EQ(statuses[2].state, LifecycleState::Completed);
  EXPECT_EQ(statuses[2].category, ProcessCategory::GlobalScript);

  const std::vector<std::string> expected_lines = {"hello"};
  EXPECT_EQ(lines_of(events, "hello"), expected_lines);

  const auto exits = of_type<ExitEvent>(events, "hello");
  ASSERT_EQ(exits.size(), 1u);
  EXPECT_EQ(exits[0].exit_code, std::optional<int>(0));
  EXPECT_TRUE(exits[0].success);

  // 输出行先于终止事件
  std::size_t log_index = 0;
  std::size_t completed_index = 0;
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (std::holds_alternative<LogEvent>(events[i])) {
      log_index = i;
    }
    if (const auto *s = std::get_if<StatusEvent>(&events[i])) {
      if (s->state == LifecycleState::Completed) {
        completed_index = i;
      }
    }
  }
  EXPECT_LT(log_index, completed_index);
  EXPECT_FALSE(manager_->is_running(ProcessCategory::GlobalScript, "hello"));
}

TEST_F(ProcessManagerTest, NonZeroExitMarksScriptFailed) {
  manager_->launch(shell(ProcessCategory::ProjectScript, "lint", "exit 2"));

  const auto events = collect_until_exit("lint");
  const auto states = states_of(events, "lint");
  ASSERT_FALSE(states.empty());
  EXPECT_EQ(states.back(), LifecycleState::Failed);

  const auto exits = of_type<ExitEvent>(events, "lint");
  ASSERT_EQ(exits.size(), 1u);
  EXPECT_EQ(exits[0].exit_code, std::optional<int>(2));
  EXPECT_FALSE(exits[0].success);
}

TEST_F(ProcessManagerTest, ServiceExitReportsStoppedWithMetadata) {
  auto spec = shell(ProcessCategory::Service, "api", "exit 0");
  spec.metadata.active_mode = "dev";
  spec.metadata.active_arg_preset = "verbose";
  manager_->launch(spec);

  const auto events = collect_until_exit("api");
  const auto statuses = of_type<StatusEvent>(events, "api");
  ASSERT_EQ(statuses.size(), 3u);
  EXPECT_EQ(statuses[0].state, LifecycleState::Starting);
  EXPECT_EQ(statuses[1].state, LifecycleState::Running);
  EXPECT_EQ(statuses[2].state, LifecycleState::Stopped);
  for (const auto &status : statuses) {
    EXPECT_TRUE(status.metadata == spec.metadata);
  }

  const auto exits = of_type<ExitEvent>(events, "api");
  ASSERT_EQ(exits.size(), 1u);
  EXPECT_TRUE(exits[0].success);
}

TEST_F(ProcessManagerTest, StderrAndUnterminatedLinesAreDelivered) {
  manager_->launch(shell(ProcessCategory::GlobalScript, "mixed",
                         "echo out; echo err 1>&2; printf 'tail'"));

  const auto events = collect_until_exit("mixed");
  const auto logs = of_type<LogEvent>(events, "mixed");
  ASSERT_EQ(logs.size(), 3u);

  bool saw_err = false;
  bool saw_tail = false;
  for (const auto &log : logs) {
    if (log.text == "err") {
      saw_err = true;
      EXPECT_EQ(log.stream, procTypes::LogStream::Stderr);
    }
    if (log.text == "tail") {
      saw_tail = true;
      EXPECT_EQ(log.stream, procTypes::LogStream::Stdout);
    }
  }
  EXPECT_TRUE(saw_err);
  EXPECT_TRUE(saw_tail);
}

TEST_F(ProcessManagerTest, EnvironmentAndWorkingDirectoryApply) {
  auto spec = shell(ProcessCategory::GlobalScript, "env", "echo \"$GREETING\"; pwd");
  spec.env["GREETING"] = "hi there";
  spec.working_dir = "/";
  manager_->launch(spec);

  const auto events = collect_until_exit("env");
  const std::vector<std::string> expected = {"hi there", "/"};
  EXPECT_EQ(lines_of(events, "env"), expected);
}

TEST_F(ProcessManagerTest, SpawnFailureThrowsAndLeavesIdLaunchable) {
  EXPECT_THROW(manager_->launch(program(ProcessCategory::GlobalScript, "bad",
                                        "/nonexistent/binary")),
               SpawnFailedError);
  EXPECT_FALSE(manager_->is_running(ProcessCategory::GlobalScript, "bad"));

  // 同一 id 再次启动得到相同的错误，而不是 AlreadyRunning
  EXPECT_THROW(manager_->launch(program(ProcessCategory::GlobalScript, "bad",
                                        "/nonexistent/binary")),
               SpawnFailedError);

  const auto events = collect_for(std::chrono::milliseconds(100));
  const std::vector<LifecycleState> expected = {
      LifecycleState::Running, LifecycleState::Failed,
      LifecycleState::Running, LifecycleState::Failed};
  EXPECT_EQ(states_of(events, "bad"), expected);
  EXPECT_TRUE(of_type<ExitEvent>(events, "bad").empty());
}

TEST_F(ProcessManagerTest, EmptyIdIsRejected) {
  EXPECT_THROW(manager_->launch(shell(ProcessCategory::Service, "", "true")),
               std::invalid_argument);
}

TEST_F(ProcessManagerTest, SecondLaunchOfRunningIdIsRejected) {
  const pid_t pid =
      manager_->launch(program(ProcessCategory::Service, "db", "/bin/sleep",
                               {"5"}));

  try {
    manager_->launch(
        program(ProcessCategory::Service, "db", "/bin/sleep", {"5"}));
    FAIL() << "second launch should have thrown";
  } catch (const AlreadyRunningError &e) {
    EXPECT_EQ(e.kind(), procTypes::ErrorKind::AlreadyRunning);
    EXPECT_EQ(e.id(), "db");
  }

  const auto running = manager_->list_running(ProcessCategory::Service);
  ASSERT_EQ(running.size(), 1u);
  EXPECT_EQ(running[0], "db");

  manager_->stop(ProcessCategory::Service, "db");
  EXPECT_TRUE(process_gone(pid));
}

TEST_F(ProcessManagerTest, ConcurrentLaunchesOfSameIdSpawnOnce) {
  std::atomic<int> launched{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      try {
        manager_->launch(
            program(ProcessCategory::Service, "racy", "/bin/sleep", {"5"}));
        ++launched;
      } catch (const AlreadyRunningError &) {
        ++rejected;
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(launched.load(), 1);
  EXPECT_EQ(rejected.load(), 7);
  manager_->stop(ProcessCategory::Service, "racy");
}

TEST_F(ProcessManagerTest, StopReportsTerminalStateWithoutSuccess) {
  const pid_t service_pid = manager_->launch(
      program(ProcessCategory::Service, "web", "/bin/sleep", {"10"}));
  const pid_t script_pid = manager_->launch(
      program(ProcessCategory::ProjectScript, "watch", "/bin/sleep", {"10"}));

  manager_->stop(ProcessCategory::Service, "web");
  manager_->stop(ProcessCategory::ProjectScript, "watch");

  EXPECT_FALSE(manager_->is_running(ProcessCategory::Service, "web"));
  EXPECT_FALSE(manager_->is_running(ProcessCategory::ProjectScript, "watch"));
  EXPECT_TRUE(process_gone(service_pid));
  EXPECT_TRUE(process_gone(script_pid));

  // 等待足够多个轮询周期，确认退出监视线程不会重复报告
  const auto events = collect_for(std::chrono::milliseconds(200));

  EXPECT_EQ(states_of(events, "web").back(), LifecycleState::Stopped);
  EXPECT_EQ(states_of(events, "watch").back(), LifecycleState::Failed);

  const auto web_exits = of_type<ExitEvent>(events, "web");
  ASSERT_EQ(web_exits.size(), 1u);
  EXPECT_FALSE(web_exits[0].success);
  const auto watch_exits = of_type<ExitEvent>(events, "watch");
  ASSERT_EQ(watch_exits.size(), 1u);
  EXPECT_FALSE(watch_exits[0].success);
}

TEST_F(ProcessManagerTest, StopOfUnknownOrStoppedIdThrowsNotRunning) {
  EXPECT_THROW(manager_->stop(ProcessCategory::Service, "ghost"),
               NotRunningError);

  manager_->launch(program(ProcessCategory::Service, "once", "/bin/sleep",
                           {"10"}));
  manager_->stop(ProcessCategory::Service, "once");
  EXPECT_THROW(manager_->stop(ProcessCategory::Service, "once"),
               NotRunningError);
}

TEST_F(ProcessManagerTest, StopKillsTheWholeProcessTree) {
  const pid_t root = manager_->launch(
      shell(ProcessCategory::Service, "tree", "sleep 30 & sleep 30 & wait"));

  std::vector<pid_t> descendants;
  wait_for_state([&]() {
    descendants = ProcessGroupStrategy::descendantsOf(root);
    return descendants.size() >= 2;
  });
  ASSERT_GE(descendants.size(), 2u);

  manager_->stop(ProcessCategory::Service, "tree");

  for (const pid_t pid : descendants) {
    wait_for_state([&]() { return !ProcessGroupStrategy::isAlive(pid); });
    EXPECT_FALSE(ProcessGroupStrategy::isAlive(pid)) << "pid " << pid;
  }
}

TEST_F(ProcessManagerTest, CategoriesDoNotCollide) {
  manager_->launch(program(ProcessCategory::Service, "build", "/bin/sleep",
                           {"5"}));
  manager_->launch(program(ProcessCategory::GlobalScript, "build",
                           "/bin/sleep", {"5"}));

  EXPECT_TRUE(manager_->is_running(ProcessCategory::Service, "build"));
  EXPECT_TRUE(manager_->is_running(ProcessCategory::GlobalScript, "build"));
  EXPECT_FALSE(manager_->is_running(ProcessCategory::ProjectScript, "build"));

  manager_->stop(ProcessCategory::Service, "build");
  EXPECT_FALSE(manager_->is_running(ProcessCategory::Service, "build"));
  EXPECT_TRUE(manager_->is_running(ProcessCategory::GlobalScript, "build"));
}

TEST_F(ProcessManagerTest, HasRunningProcessesFollowsRegistry) {
  EXPECT_FALSE(manager_->has_running_processes());

  manager_->launch(shell(ProcessCategory::ProjectScript, "short", "sleep 0.2"));
  EXPECT_TRUE(manager_->has_running_processes());

  collect_until_exit("short");
  EXPECT_FALSE(manager_->has_running_processes());
}

TEST_F(ProcessManagerTest, SequentialGroupWaitsForEachEntry) {
  const std::vector<procTypes::LaunchSpec> specs = {
      shell(ProcessCategory::GlobalScript, "first", "sleep 0.3"),
      shell(ProcessCategory::GlobalScript, "second", "sleep 0.3"),
  };

  const auto start = std::chrono::steady_clock::now();
  const auto results =
      manager_->run_group(specs, procTypes::ExecutionMode::Sequential, true);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].ok());
  EXPECT_TRUE(results[1].ok());
  EXPECT_GE(elapsed, std::chrono::milliseconds(600));
  EXPECT_FALSE(manager_->has_running_processes());
}

TEST_F(ProcessManagerTest, SequentialGroupStopsAtFirstFailure) {
  const std::vector<procTypes::LaunchSpec> specs = {
      shell(ProcessCategory::GlobalScript, "ok", "true"),
      program(ProcessCategory::GlobalScript, "broken", "/nonexistent/binary"),
      shell(ProcessCategory::GlobalScript, "never", "true"),
  };

  const auto results =
      manager_->run_group(specs, procTypes::ExecutionMode::Sequential, true);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].ok());
  EXPECT_FALSE(results[1].ok());
  EXPECT_EQ(results[1].id, "broken");
  EXPECT_EQ(results[1].error_kind,
            std::optional<procTypes::ErrorKind>(
                procTypes::ErrorKind::SpawnFailed));
  EXPECT_FALSE(results[1].message.empty());

  const auto events = collect_for(std::chrono::milliseconds(100));
  EXPECT_TRUE(states_of(events, "never").empty());
}

TEST_F(ProcessManagerTest, SequentialGroupCanContinuePastFailure) {
  const std::vector<procTypes::LaunchSpec> specs = {
      program(ProcessCategory::GlobalScript, "broken", "/nonexistent/binary"),
      shell(ProcessCategory::GlobalScript, "after", "true"),
  };

  const auto results =
      manager_->run_group(specs, procTypes::ExecutionMode::Sequential, false);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_FALSE(results[0].ok());
  EXPECT_TRUE(results[1].ok());
}

TEST_F(ProcessManagerTest, ParallelGroupLaunchesWithoutWaiting) {
  const std::vector<procTypes::LaunchSpec> specs = {
      program(ProcessCategory::Service, "a", "/bin/sleep", {"5"}),
      program(ProcessCategory::Service, "b", "/bin/sleep", {"5"}),
      program(ProcessCategory::Service, "a", "/bin/sleep", {"5"}),
  };

  const auto start = std::chrono::steady_clock::now();
  const auto results =
      manager_->run_group(specs, procTypes::ExecutionMode::Parallel, true);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));

  ASSERT_EQ(results.size(), 3u);
  EXPECT_TRUE(results[0].ok());
  EXPECT_TRUE(results[1].ok());
  EXPECT_FALSE(results[2].ok());
  EXPECT_EQ(results[2].error_kind,
            std::optional<procTypes::ErrorKind>(
                procTypes::ErrorKind::AlreadyRunning));

  const std::vector<std::string> expected = {"a", "b"};
  EXPECT_EQ(manager_->list_running(ProcessCategory::Service), expected);
}

TEST_F(ProcessManagerTest, ShutdownKillsEverythingAndSilencesEvents) {
  const pid_t service_pid = manager_->launch(
      program(ProcessCategory::Service, "svc", "/bin/sleep", {"30"}));
  const pid_t script_pid = manager_->launch(shell(
      ProcessCategory::ProjectScript, "chatty",
      "while true; do echo tick; sleep 0.01; done"));

  collect_for(std::chrono::milliseconds(100));
  manager_->shutdown();

  EXPECT_TRUE(manager_->is_shutting_down());
  EXPECT_FALSE(manager_->has_running_processes());
  EXPECT_TRUE(process_gone(service_pid));
  EXPECT_TRUE(process_gone(script_pid));

  sink_->drain();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_EQ(sink_->size(), 0u);

  EXPECT_THROW(
      manager_->launch(shell(ProcessCategory::Service, "late", "true")),
      ShuttingDownError);
  EXPECT_EQ(sink_->size(), 0u);

  EXPECT_NO_THROW(manager_->shutdown());
}

TEST_F(ProcessManagerTest, DestructorShutsDown) {
  const pid_t pid = manager_->launch(
      program(ProcessCategory::Service, "svc", "/bin/sleep", {"30"}));

  manager_.reset();

  EXPECT_TRUE(process_gone(pid));
}

TEST_F(ProcessManagerTest, FailingSinkDoesNotStopSupervision) {
  auto sink = std::make_shared<ThrowingLogSink>();
  ProcessManager manager(sink, fast_config());

  manager.launch(shell(ProcessCategory::GlobalScript, "noisy",
                       "echo one; echo two; exit 0"));

  std::optional<ExitEvent> exit;
  wait_for_state([&]() {
    while (auto event = sink->tryPop()) {
      if (const auto *e = std::get_if<ExitEvent>(&*event)) {
        exit = *e;
      }
    }
    return exit.has_value();
  });
  ASSERT_TRUE(exit.has_value());
  EXPECT_TRUE(exit->success);
}

TEST_F(ProcessManagerTest, StopUsesOrdinaryTierAndShutdownUsesRobustTier) {
  auto strategy =
      std::make_shared<CountingStrategy>(fast_config().termination);
  ProcessManager manager(sink_, fast_config(), strategy);

  manager.launch(program(ProcessCategory::Service, "x", "/bin/sleep", {"30"}));
  manager.launch(program(ProcessCategory::Service, "y", "/bin/sleep", {"30"}));

  manager.stop(ProcessCategory::Service, "x");
  EXPECT_EQ(strategy->tree_calls.load(), 1);
  EXPECT_EQ(strategy->robust_calls.load(), 0);

  manager.shutdown();
  EXPECT_EQ(strategy->tree_calls.load(), 1);
  // 回收之后只清理进程组残余，不再按 pid 强杀
  EXPECT_EQ(strategy->robust_calls.load(), 1);
  EXPECT_EQ(strategy->remnant_calls.load(), 1);
}

TEST_F(ProcessManagerTest, ShutdownIsNotHeldUpBySlowSink) {
  auto sink = std::make_shared<SlowLogSink>();
  ProcessManager manager(sink, fast_config());

  const pid_t pid = manager.launch(
      shell(ProcessCategory::Service, "svc", "echo hi; sleep 30"));
  // 等输出线程进入 onLog
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  const auto start = std::chrono::steady_clock::now();
  manager.shutdown();
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  EXPECT_LT(elapsed.count(), 1500);
  EXPECT_FALSE(manager.has_running_processes());
  EXPECT_TRUE(process_gone(pid));
}

TEST_F(ProcessManagerTest, StopRacingNaturalExitReportsOnce) {
  for (int i = 0; i < 30; ++i) {
    const std::string id = "race-" + std::to_string(i);
    manager_->launch(program(ProcessCategory::GlobalScript, id, "/bin/sleep",
                             {"0.02"}));
    std::this_thread::sleep_for(std::chrono::milliseconds(15 + i % 11));
    try {
      manager_->stop(ProcessCategory::GlobalScript, id);
    } catch (const NotRunningError &) {
      // 退出监视线程先完成了报告
    }
    collect_until_exit(id);
  }
  // 再等几个轮询周期，捕获可能的重复报告
  const auto events = collect_for(std::chrono::milliseconds(150));

  for (int i = 0; i < 30; ++i) {
    const std::string id = "race-" + std::to_string(i);
    int terminal = 0;
    for (const auto state : states_of(events, id)) {
      terminal += state != LifecycleState::Running ? 1 : 0;
    }
    EXPECT_EQ(terminal, 1) << id;
    EXPECT_EQ(of_type<ExitEvent>(events, id).size(), 1u) << id;
  }
}
