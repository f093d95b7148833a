/**
 * @file process_errors.hpp
 * @brief Exception types raised by the supervision engine.
 *
 * Launch and stop failures are reported synchronously to the caller by
 * throwing one of these. Failures that have no synchronous caller (exit
 * watching, shutdown, termination) are logged instead and never thrown.
 */
#pragma once

#include <stdexcept>
#include <string>

#include "proc_supervisor/proc_types.hpp"

/**
 * @class ProcessError
 * @brief Base class of every engine error, carries a procTypes::ErrorKind.
 */
class ProcessError : public std::runtime_error {
 public:
  ProcessError(procTypes::ErrorKind kind, const std::string &id,
               const std::string &message)
      : std::runtime_error(message), kind_(kind), id_(id) {}

  procTypes::ErrorKind kind() const noexcept { return kind_; }
  const std::string &id() const noexcept { return id_; }

 private:
  procTypes::ErrorKind kind_;
  std::string id_;
};

class AlreadyRunningError : public ProcessError {
 public:
  explicit AlreadyRunningError(const std::string &id)
      : ProcessError(procTypes::ErrorKind::AlreadyRunning, id,
                     "'" + id + "' is already running") {}
};

class NotRunningError : public ProcessError {
 public:
  explicit NotRunningError(const std::string &id)
      : ProcessError(procTypes::ErrorKind::NotRunning, id,
                     "'" + id + "' is not running") {}
};

/**
 * @brief The OS refused to start the process: program not found, permission
 * denied, bad working directory, or a failing fork/pipe.
 */
class SpawnFailedError : public ProcessError {
 public:
  SpawnFailedError(const std::string &id, const std::string &reason)
      : ProcessError(procTypes::ErrorKind::SpawnFailed, id,
                     "Failed to start '" + id + "': " + reason),
        reason_(reason) {}

  const std::string &reason() const noexcept { return reason_; }

 private:
  std::string reason_;
};

/**
 * @brief Launch requested after shutdown began; the process would never be
 * watched or reaped, so it is not started.
 */
class ShuttingDownError : public ProcessError {
 public:
  explicit ShuttingDownError(const std::string &id)
      : ProcessError(procTypes::ErrorKind::ShuttingDown, id,
                     "Cannot start '" + id + "': supervisor is shutting down") {
  }
};
