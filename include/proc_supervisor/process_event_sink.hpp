/**
 * @file process_event_sink.hpp
 * @brief Observer interface the supervision engine reports to.
 */
#pragma once

#include "proc_supervisor/proc_types.hpp"

/**
 * @class ProcessEventSink
 * @brief Receives log lines and lifecycle transitions of supervised processes.
 *
 * One implementation feeds the GUI event bus (RosEventSink), another an
 * in-process channel read by a terminal UI (ChannelEventSink).
 *
 * @note Called concurrently from pump and exit-watch threads: implementations
 * must be thread safe. Exceptions thrown here are logged and dropped by the
 * engine. A sink must not call ProcessManager::shutdown() from a callback.
 */
class ProcessEventSink {
 public:
  virtual ~ProcessEventSink() = default;

  virtual void onLog(const procTypes::LogEvent &event) = 0;
  virtual void onStatus(const procTypes::StatusEvent &event) = 0;
  virtual void onExit(const procTypes::ExitEvent &event) = 0;
};
