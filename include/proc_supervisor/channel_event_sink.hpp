/**
 * @file channel_event_sink.hpp
 * @brief 进程内事件通道，供终端界面的主循环读取
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "proc_supervisor/proc_types.hpp"
#include "proc_supervisor/process_event_sink.hpp"

/**
 * @class ChannelEventSink
 * @brief 线程安全的先进先出事件队列
 *
 * 引擎的各个线程调用 onLog/onStatus/onExit 入队，界面线程通过
 * tryPop/waitPop/drain 取出 procTypes::ProcessEvent。
 *
 * @details
 * - 事件按入队顺序取出，同一线程产生的事件保持先后关系
 * - close() 之后新的事件被丢弃(相当于接收端已断开)，已入队的仍可取出
 *
 * @note 所有的数据访问操作都是线程安全的
 */
class ChannelEventSink : public ProcessEventSink {
 public:
  ChannelEventSink() = default;

  ChannelEventSink(const ChannelEventSink &) = delete;
  ChannelEventSink &operator=(const ChannelEventSink &) = delete;

  void onLog(const procTypes::LogEvent &event) override;
  void onStatus(const procTypes::StatusEvent &event) override;
  void onExit(const procTypes::ExitEvent &event) override;

  /**
   * @brief 非阻塞取出一个事件
   */
  std::optional<procTypes::ProcessEvent> tryPop();

  /**
   * @brief 等待最多 timeout 取出一个事件
   */
  std::optional<procTypes::ProcessEvent> waitPop(
      std::chrono::milliseconds timeout);

  /**
   * @brief 取出当前队列中的全部事件
   */
  std::vector<procTypes::ProcessEvent> drain();

  std::size_t size() const;

  /**
   * @brief 断开通道，唤醒所有等待者
   */
  void close();

  bool closed() const;

 private:
  void push(procTypes::ProcessEvent event);

  std::deque<procTypes::ProcessEvent> queue_;
  bool closed_ = false;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};
