#include "proc_supervisor/channel_event_sink.hpp"

#include <iterator>
#include <utility>

void ChannelEventSink::onLog(const procTypes::LogEvent &event) {
  push(event);
}

void ChannelEventSink::onStatus(const procTypes::StatusEvent &event) {
  push(event);
}

void ChannelEventSink::onExit(const procTypes::ExitEvent &event) {
  push(event);
}

void ChannelEventSink::push(procTypes::ProcessEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
}

std::optional<procTypes::ProcessEvent> ChannelEventSink::tryPop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

std::optional<procTypes::ProcessEvent> ChannelEventSink::waitPop(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

std::vector<procTypes::ProcessEvent> ChannelEventSink::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<procTypes::ProcessEvent> out(
      std::make_move_iterator(queue_.begin()),
      std::make_move_iterator(queue_.end()));
  queue_.clear();
  return out;
}

std::size_t ChannelEventSink::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void ChannelEventSink::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool ChannelEventSink::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}
