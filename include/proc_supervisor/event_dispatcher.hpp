/**
 * @file event_dispatcher.hpp
 * @brief The engine's single path to its ProcessEventSink.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "proc_supervisor/proc_types.hpp"
#include "proc_supervisor/process_event_sink.hpp"

/**
 * @class EventDispatcher
 * @brief Owns the shutdown signal and gates every emission on it.
 *
 * No event starts once beginShutdown() has returned. Sink callbacks run
 * without any lock held, so a slow sink never blocks beginShutdown();
 * callbacks already in flight are counted and can be waited for with
 * waitIdle(). Sink exceptions are logged and dropped.
 */
class EventDispatcher {
 public:
  /**
   * @throws std::invalid_argument if @p sink is null.
   */
  explicit EventDispatcher(std::shared_ptr<ProcessEventSink> sink);

  EventDispatcher(const EventDispatcher &) = delete;
  EventDispatcher &operator=(const EventDispatcher &) = delete;

  /**
   * @return false if the event was suppressed because shutdown began.
   */
  bool emit(const procTypes::LogEvent &event);
  bool emit(const procTypes::StatusEvent &event);
  bool emit(const procTypes::ExitEvent &event);

  /**
   * @brief Sets the shutdown signal (write-once).
   * @return true for the call that performed the transition.
   */
  bool beginShutdown();

  /**
   * @brief Waits until no sink callback is running, at most @p timeout.
   * @return false if a callback was still running when the timeout expired.
   */
  bool waitIdle(std::chrono::milliseconds timeout);

  bool shuttingDown() const { return shutdown_.load(); }

 private:
  template <typename Fn>
  bool deliver(const char *kind, const std::string &id, Fn &&fn);

  std::shared_ptr<ProcessEventSink> sink_;
  std::atomic<bool> shutdown_{false};
  std::mutex mutex_;
  std::condition_variable idle_;
  int in_flight_ = 0;
};
