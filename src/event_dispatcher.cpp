#include "proc_supervisor/event_dispatcher.hpp"

#include <exception>
#include <mutex>
#include <rclcpp/rclcpp.hpp>
#include <stdexcept>
#include <utility>

EventDispatcher::EventDispatcher(std::shared_ptr<ProcessEventSink> sink)
    : sink_(std::move(sink)) {
  if (sink_ == nullptr) {
    throw std::invalid_argument("ProcessEventSink pointer cannot be null");
  }
}

template <typename Fn>
bool EventDispatcher::deliver(const char *kind, const std::string &id,
                              Fn &&fn) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_.load()) {
      return false;
    }
    ++in_flight_;
  }
  // Decrements on every exit path, including exceptions not derived from
  // std::exception that propagate to the caller.
  struct InFlight {
    EventDispatcher &self;
    ~InFlight() {
      {
        std::lock_guard<std::mutex> lock(self.mutex_);
        --self.in_flight_;
      }
      self.idle_.notify_all();
    }
  } in_flight{*this};

  try {
    fn();
  } catch (const std::exception &e) {
    // A failing observer must never take the supervised process down.
    RCLCPP_ERROR(rclcpp::get_logger("proc_supervisor.events"),
                 "Event sink failed on %s event for %s: %s", kind, id.c_str(),
                 e.what());
  }
  return true;
}

bool EventDispatcher::emit(const procTypes::LogEvent &event) {
  return deliver("log", event.id, [&]() { sink_->onLog(event); });
}

bool EventDispatcher::emit(const procTypes::StatusEvent &event) {
  return deliver("status", event.id, [&]() { sink_->onStatus(event); });
}

bool EventDispatcher::emit(const procTypes::ExitEvent &event) {
  return deliver("exit", event.id, [&]() { sink_->onExit(event); });
}

bool EventDispatcher::beginShutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  return !shutdown_.exchange(true);
}

bool EventDispatcher::waitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}
