/**
 * @file process_registry.hpp
 * @brief 按类别划分的运行中进程表
 */

#pragma once

#include <sys/types.h>

#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "proc_supervisor/proc_types.hpp"
#include "proc_supervisor/process_handle.hpp"

/**
 * @class ProcessRegistry
 * @brief 运行中进程的登记表
 *
 * 每个类别(Service / ProjectScript / GlobalScript)各有一张 id -> ProcessHandle
 * 的映射，同一个 id 可以同时出现在不同类别中。
 *
 * @details
 * - 一个 id 在某类别中存在，当且仅当该进程被认为仍然存活
 * - 启动分两步：reserve() 原子地占位(检查 + 占用)，spawn 成功后 commit()，
 *   失败则 release()；占位中的 id 不算 "运行中"，但会阻止第二次启动
 * - 所有操作共用一把互斥锁，锁内不回调事件接收者
 *
 * @note 所有的数据访问操作都是线程安全的
 */
class ProcessRegistry {
 public:
  /**
   * @brief 快照中的一条记录
   */
  struct Entry {
    procTypes::ProcessCategory category;
    std::string id;
    pid_t pid;
  };

  /**
   * @brief pollExit() 的结果
   */
  enum class PollOutcome { Absent, Running, Exited };

  struct PollResult {
    PollOutcome outcome = PollOutcome::Absent;
    std::optional<int> exit_code;
    bool wait_failed = false;  ///< 非阻塞等待本身出错，按异常退出处理
    std::unique_ptr<ProcessHandle> handle;  ///< 仅在 Exited 时有效
  };

  ProcessRegistry() = default;

  ProcessRegistry(const ProcessRegistry &) = delete;
  ProcessRegistry &operator=(const ProcessRegistry &) = delete;

  /**
   * @brief 原子地检查并占位
   * @return false 表示该 id 已在运行或正在启动
   */
  [[nodiscard]] bool reserve(procTypes::ProcessCategory category,
                             const std::string &id);

  /**
   * @brief 释放 reserve() 的占位(启动失败时调用)
   */
  void release(procTypes::ProcessCategory category, const std::string &id);

  /**
   * @brief 将已占位的 id 替换为完整的进程句柄
   */
  void commit(procTypes::ProcessCategory category, const std::string &id,
              std::unique_ptr<ProcessHandle> handle);

  /**
   * @brief 一步完成登记
   * @throws AlreadyRunningError id 已存在(包括正在启动中)
   */
  void add(procTypes::ProcessCategory category, const std::string &id,
           std::unique_ptr<ProcessHandle> handle);

  /**
   * @brief 移除并返回进程句柄，不存在时返回 nullptr
   */
  std::unique_ptr<ProcessHandle> remove(procTypes::ProcessCategory category,
                                        const std::string &id);

  bool contains(procTypes::ProcessCategory category,
                const std::string &id) const;

  /**
   * @brief 某类别中所有运行中 id 的快照(按字典序)
   */
  std::vector<std::string> list(procTypes::ProcessCategory category) const;

  /**
   * @brief 所有类别中运行中进程的 (category, id, pid) 快照
   */
  std::vector<Entry> snapshot() const;

  bool empty() const;

  /**
   * @brief 清空所有映射，返回被移除的句柄
   */
  std::vector<std::unique_ptr<ProcessHandle>> drain();

  /**
   * @brief 在同一临界区内完成非阻塞等待和移除
   * @details 进程已退出时条目被移除，句柄随结果返回；
   *          与并发的 remove() 之间只有一方能拿到句柄
   */
  PollResult pollExit(procTypes::ProcessCategory category,
                      const std::string &id);

 private:
  static std::size_t index(procTypes::ProcessCategory category) {
    return static_cast<std::size_t>(category);
  }

  using HandleMap = std::map<std::string, std::unique_ptr<ProcessHandle>>;

  std::array<HandleMap, procTypes::kCategoryCount> maps_;
  std::array<std::set<std::string>, procTypes::kCategoryCount> reserved_;
  mutable std::mutex mutex_;
};
