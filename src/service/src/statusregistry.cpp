#include "../include/statusregistry.hpp"

StatusRegistry::StatusRegistry(StatusCallbacks callbacks)
    : callbacks_(std::make_shared<const StatusCallbacks>(std::move(callbacks))) {}

std::shared_ptr<WorkerStatus> StatusRegistry::createStatus(
    const std::string &name, const std::set<std::string> &tags) {
  {
    std::lock_guard lock(mutex_);
    if (auto it = statuses_.find(name); it != statuses_.end()) {
      return it->second;
    }
  }

  // Конструктор рассылает событие: создаём вне блокировки реестра, чтобы
  // обратные вызовы могли обращаться к snapshot()
  auto status = std::make_shared<WorkerStatus>(name, callbacks_, tags);

  std::lock_guard lock(mutex_);
  auto [it, inserted] = statuses_.emplace(name, status);
  return it->second;
}

std::shared_ptr<WorkerStatus> StatusRegistry::find(
    const std::string &name) const {
  std::lock_guard lock(mutex_);
  if (auto it = statuses_.find(name); it != statuses_.end()) {
    return it->second;
  }
  return nullptr;
}

void StatusRegistry::remove(const std::string &name) {
  std::lock_guard lock(mutex_);
  statuses_.erase(name);
}

std::map<std::string, StatusSnapshot> StatusRegistry::snapshot() const {
  std::map<std::string, std::shared_ptr<WorkerStatus>> copy;
  {
    std::lock_guard lock(mutex_);
    copy = statuses_;
  }
  std::map<std::string, StatusSnapshot> result;
  for (const auto &[name, status] : copy) {
    result.emplace(name, status->snapshot());
  }
  return result;
}

std::size_t StatusRegistry::size() const {
  std::lock_guard lock(mutex_);
  return statuses_.size();
}
