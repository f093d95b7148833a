#include <gtest/gtest.h>
#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "proc_supervisor/output_pump.hpp"
#include "proc_supervisor/process_handle.hpp"
#include "proc_supervisor/termination_strategy.hpp"

namespace {

constexpr std::chrono::milliseconds kShortWait{20};

void wait_for_state(
    const std::function<bool()> &predicate,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  const auto start_time = std::chrono::steady_clock::now();
  while (!predicate()) {
    if (std::chrono::steady_clock::now() - start_time >= timeout) {
      break;
    }
    std::this_thread::sleep_for(kShortWait);
  }
}

procTypes::TerminationTimings fast_timings() {
  procTypes::TerminationTimings timings;
  timings.term_grace = std::chrono::milliseconds(20);
  timings.robust_settle = std::chrono::milliseconds(20);
  timings.robust_retry_delay = std::chrono::milliseconds(0);
  return timings;
}

std::unique_ptr<ProcessHandle> spawn_shell(const std::string &command) {
  return ProcessHandle::spawn(procTypes::LaunchSpec::fromShellCommand(
      procTypes::ProcessCategory::Service, "tree", "", command));
}

// 记录调用并按命令名返回预设结果
class FakeRunner {
 public:
  CommandOutput operator()(const std::vector<std::string> &argv) {
    calls.push_back(argv);
    if (argv.empty()) {
      return {};
    }
    if (argv[0] == "taskkill") {
      return taskkill_results.empty() ? taskkill_default
                                      : next(taskkill_results);
    }
    if (argv[0] == "tasklist") {
      return tasklist_result;
    }
    return CommandOutput{true, 0, ""};
  }

  std::size_t count(const std::string &program) const {
    std::size_t n = 0;
    for (const auto &call : calls) {
      n += (!call.empty() && call[0] == program) ? 1 : 0;
    }
    return n;
  }

  std::vector<std::vector<std::string>> calls;
  std::vector<CommandOutput> taskkill_results;
  CommandOutput taskkill_default{true, 0, "SUCCESS"};
  CommandOutput tasklist_result{true, 0, "INFO: No tasks are running"};

 private:
  static CommandOutput next(std::vector<CommandOutput> &queue) {
    CommandOutput out = queue.front();
    queue.erase(queue.begin());
    return out;
  }
};

}  // namespace

class ProcessGroupStrategyTest : public ::testing::Test {
 protected:
  ProcessGroupStrategy strategy_{fast_timings()};
};

TEST_F(ProcessGroupStrategyTest, IsAliveTracksLifetime) {
  auto handle = spawn_shell("sleep 5");
  EXPECT_TRUE(ProcessGroupStrategy::isAlive(handle->pid()));

  ASSERT_EQ(kill(handle->pid(), SIGKILL), 0);
  // 僵尸进程视为已结束
  wait_for_state([&]() { return !ProcessGroupStrategy::isAlive(handle->pid()); });
  EXPECT_FALSE(ProcessGroupStrategy::isAlive(handle->pid()));
  handle->wait();
}

TEST_F(ProcessGroupStrategyTest, KillTreeTerminatesDescendants) {
  auto handle = spawn_shell("sleep 30 & sleep 30 & wait");

  std::vector<pid_t> descendants;
  wait_for_state([&]() {
    descendants = ProcessGroupStrategy::descendantsOf(handle->pid());
    return descendants.size() >= 2;
  });
  ASSERT_GE(descendants.size(), 2u);

  EXPECT_TRUE(strategy_.killTree(handle->pid()));
  handle->wait();

  for (const pid_t pid : descendants) {
    wait_for_state([&]() { return !ProcessGroupStrategy::isAlive(pid); });
    EXPECT_FALSE(ProcessGroupStrategy::isAlive(pid)) << "pid " << pid;
  }
}

TEST_F(ProcessGroupStrategyTest, RobustKillHandlesTermIgnoringTree) {
  auto handle = spawn_shell("trap '' TERM; sleep 30 & wait");

  std::vector<pid_t> descendants;
  wait_for_state([&]() {
    descendants = ProcessGroupStrategy::descendantsOf(handle->pid());
    return !descendants.empty();
  });

  EXPECT_TRUE(strategy_.killTreeRobust(handle->pid()));
  EXPECT_FALSE(handle->wait().has_value());
  for (const pid_t pid : descendants) {
    wait_for_state([&]() { return !ProcessGroupStrategy::isAlive(pid); });
    EXPECT_FALSE(ProcessGroupStrategy::isAlive(pid));
  }
}

TEST_F(ProcessGroupStrategyTest, AlreadyExitedProcessIsNotAnError) {
  auto handle = spawn_shell("exit 0");
  handle->wait();

  EXPECT_TRUE(strategy_.killTreeRobust(handle->pid()));
}

TEST_F(ProcessGroupStrategyTest, InvalidPidIsRejected) {
  EXPECT_FALSE(strategy_.killTree(0));
  EXPECT_FALSE(strategy_.killTreeRobust(-1));
  EXPECT_FALSE(strategy_.killGroupRemnants(0));
}

TEST_F(ProcessGroupStrategyTest, RemnantKillReachesMembersOfReapedLeader) {
  // 组长立即退出，后台 sleep 留在同一进程组中
  auto handle = spawn_shell("sleep 30 >/dev/null 2>&1 & echo $!");
  std::vector<std::string> lines;
  pumpLines(
      handle->takeStdout(), [&](std::string line) { lines.push_back(line); },
      []() { return false; }, kShortWait);
  EXPECT_EQ(handle->wait(), std::optional<int>(0));
  ASSERT_EQ(lines.size(), 1u);
  const pid_t orphan = static_cast<pid_t>(std::stol(lines[0]));
  ASSERT_EQ(getpgid(orphan), handle->pid());

  EXPECT_TRUE(strategy_.killGroupRemnants(handle->pid()));
  wait_for_state([&]() { return !ProcessGroupStrategy::isAlive(orphan); });
  EXPECT_FALSE(ProcessGroupStrategy::isAlive(orphan));
}

TEST_F(ProcessGroupStrategyTest, RemnantKillOfVanishedGroupIsNotAnError) {
  auto handle = spawn_shell("exit 0");
  handle->wait();

  EXPECT_TRUE(strategy_.killGroupRemnants(handle->pid()));
}

TEST(TreeKillUtilityStrategyTest, EmptyRunnerIsRejected) {
  EXPECT_THROW(TreeKillUtilityStrategy(fast_timings(), CommandRunner{}),
               std::invalid_argument);
}

TEST(TreeKillUtilityStrategyTest, KillTreeUsesForcefulTreeKill) {
  auto runner = std::make_shared<FakeRunner>();
  TreeKillUtilityStrategy strategy(
      fast_timings(), [runner](const std::vector<std::string> &argv) {
        return (*runner)(argv);
      });

  EXPECT_TRUE(strategy.killTree(4123));
  ASSERT_EQ(runner->calls.size(), 1u);
  const std::vector<std::string> expected = {"taskkill", "/F", "/T", "/PID",
                                             "4123"};
  EXPECT_EQ(runner->calls[0], expected);
}

TEST(TreeKillUtilityStrategyTest, RemnantKillRunsNoUtility) {
  auto runner = std::make_shared<FakeRunner>();
  TreeKillUtilityStrategy strategy(
      fast_timings(), [runner](const std::vector<std::string> &argv) {
        return (*runner)(argv);
      });

  EXPECT_TRUE(strategy.killGroupRemnants(4123));
  EXPECT_TRUE(runner->calls.empty());
}

TEST(TreeKillUtilityStrategyTest, RobustKillRetriesWhileListed) {
  auto runner = std::make_shared<FakeRunner>();
  runner->tasklist_result = {true, 0, "sleep.exe   4123 Console  1  1,024 K"};
  TreeKillUtilityStrategy strategy(
      fast_timings(), [runner](const std::vector<std::string> &argv) {
        return (*runner)(argv);
      });

  EXPECT_TRUE(strategy.killTreeRobust(4123));
  EXPECT_EQ(runner->count("taskkill"), 2u);
  EXPECT_EQ(runner->count("tasklist"), 1u);
  EXPECT_EQ(runner->count("wmic"), 1u);
}

TEST(TreeKillUtilityStrategyTest, PidInsideAnotherNumberIsNotAMatch) {
  auto runner = std::make_shared<FakeRunner>();
  runner->tasklist_result = {true, 0, "other.exe   4123 Console  1  1,024 K"};
  TreeKillUtilityStrategy strategy(
      fast_timings(), [runner](const std::vector<std::string> &argv) {
        return (*runner)(argv);
      });

  EXPECT_TRUE(strategy.killTreeRobust(12));
  EXPECT_EQ(runner->count("taskkill"), 1u);
}

TEST(TreeKillUtilityStrategyTest, NotFoundCountsAsSuccess) {
  auto runner = std::make_shared<FakeRunner>();
  runner->taskkill_default = {true, 128,
                              "ERROR: The process \"77\" not found."};
  TreeKillUtilityStrategy strategy(
      fast_timings(), [runner](const std::vector<std::string> &argv) {
        return (*runner)(argv);
      });

  EXPECT_TRUE(strategy.killTree(77));
  EXPECT_TRUE(strategy.killTreeRobust(77));
}

TEST(TreeKillUtilityStrategyTest, FailuresAreReported) {
  auto runner = std::make_shared<FakeRunner>();
  runner->taskkill_default = {true, 1, "ERROR: Access is denied."};
  TreeKillUtilityStrategy strategy(
      fast_timings(), [runner](const std::vector<std::string> &argv) {
        return (*runner)(argv);
      });
  EXPECT_FALSE(strategy.killTree(55));
  EXPECT_FALSE(strategy.killTreeRobust(55));

  runner->taskkill_default = CommandOutput{};
  EXPECT_FALSE(strategy.killTree(55));
  EXPECT_FALSE(strategy.killTreeRobust(55));
}

TEST(TerminationStrategyFactoryTest, DefaultStrategyMatchesPlatform) {
  const auto strategy = makeDefaultTerminationStrategy(fast_timings());
  ASSERT_NE(strategy, nullptr);
  EXPECT_STREQ(strategy->name(), "process-group");
}

TEST(RunCommandTest, CapturesOutputAndExitStatus) {
  const auto ok = runCommand({"echo", "hello world"});
  EXPECT_TRUE(ok.launched);
  EXPECT_EQ(ok.exit_status, 0);
  EXPECT_EQ(ok.output, "hello world\n");

  const auto failing = runCommand({"sh", "-c", "exit 3"});
  EXPECT_TRUE(failing.launched);
  EXPECT_EQ(failing.exit_status, 3);
}
