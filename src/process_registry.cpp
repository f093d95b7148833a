#include "proc_supervisor/process_registry.hpp"

#include <rclcpp/rclcpp.hpp>
#include <system_error>

#include "proc_supervisor/process_errors.hpp"

bool ProcessRegistry::reserve(procTypes::ProcessCategory category,
                              const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto i = index(category);
  if (maps_[i].count(id) != 0 || reserved_[i].count(id) != 0) {
    return false;
  }
  reserved_[i].insert(id);
  return true;
}

void ProcessRegistry::release(procTypes::ProcessCategory category,
                              const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  reserved_[index(category)].erase(id);
}

void ProcessRegistry::commit(procTypes::ProcessCategory category,
                             const std::string &id,
                             std::unique_ptr<ProcessHandle> handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto i = index(category);
  reserved_[i].erase(id);
  maps_[i][id] = std::move(handle);
}

void ProcessRegistry::add(procTypes::ProcessCategory category,
                          const std::string &id,
                          std::unique_ptr<ProcessHandle> handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto i = index(category);
  if (maps_[i].count(id) != 0 || reserved_[i].count(id) != 0) {
    throw AlreadyRunningError(id);
  }
  maps_[i].emplace(id, std::move(handle));
}

std::unique_ptr<ProcessHandle> ProcessRegistry::remove(
    procTypes::ProcessCategory category, const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &map = maps_[index(category)];
  auto it = map.find(id);
  if (it == map.end()) {
    return nullptr;
  }
  auto handle = std::move(it->second);
  map.erase(it);
  return handle;
}

bool ProcessRegistry::contains(procTypes::ProcessCategory category,
                               const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return maps_[index(category)].count(id) != 0;
}

std::vector<std::string> ProcessRegistry::list(
    procTypes::ProcessCategory category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto &map = maps_[index(category)];
  std::vector<std::string> ids;
  ids.reserve(map.size());
  for (const auto &kv : map) {
    ids.push_back(kv.first);
  }
  return ids;
}

std::vector<ProcessRegistry::Entry> ProcessRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Entry> out;
  for (const auto category : procTypes::kAllCategories) {
    for (const auto &kv : maps_[index(category)]) {
      out.push_back(Entry{category, kv.first, kv.second->pid()});
    }
  }
  return out;
}

bool ProcessRegistry::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &map : maps_) {
    if (!map.empty()) {
      return false;
    }
  }
  return true;
}

std::vector<std::unique_ptr<ProcessHandle>> ProcessRegistry::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::unique_ptr<ProcessHandle>> out;
  for (auto &map : maps_) {
    for (auto &kv : map) {
      out.push_back(std::move(kv.second));
    }
    map.clear();
  }
  return out;
}

ProcessRegistry::PollResult ProcessRegistry::pollExit(
    procTypes::ProcessCategory category, const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &map = maps_[index(category)];
  auto it = map.find(id);
  if (it == map.end()) {
    return PollResult{};
  }

  PollResult result;
  try {
    const auto status = it->second->tryWait();
    if (!status.exited) {
      result.outcome = PollOutcome::Running;
      return result;
    }
    result.exit_code = status.exit_code;
  } catch (const std::system_error &e) {
    RCLCPP_ERROR(rclcpp::get_logger("proc_supervisor.registry"),
                 "Waiting on %s %s failed, treating as exited: %s",
                 procTypes::toString(category), id.c_str(), e.what());
    result.wait_failed = true;
  }

  result.outcome = PollOutcome::Exited;
  result.handle = std::move(it->second);
  map.erase(it);
  return result;
}
