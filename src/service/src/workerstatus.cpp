#include "../include/workerstatus.hpp"

#include <algorithm>
#include <ctime>

#include "sky/compositelogger.hpp"

namespace {

std::string isoTime(const std::chrono::system_clock::time_point &tp) {
  const auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buffer;
}

}  // namespace

std::string toString(WorkerState state) {
  switch (state) {
    case WorkerState::Starting:
      return "starting";
    case WorkerState::Running:
      return "running";
    case WorkerState::Off:
      return "off";
    case WorkerState::Failure:
      return "failure";
  }
  return "unknown";
}

std::string toString(FailureKind kind) {
  switch (kind) {
    case FailureKind::None:
      return "none";
    case FailureKind::Step:
      return "step";
    case FailureKind::Authentication:
      return "authentication";
  }
  return "unknown";
}

int severity(WorkerState state) {
  switch (state) {
    case WorkerState::Running:
      return 0;
    case WorkerState::Starting:
      return 1;
    case WorkerState::Off:
      return 2;
    case WorkerState::Failure:
      return 3;
  }
  return 3;
}

std::optional<std::string> StatusSnapshot::miscValue(
    const std::string &key) const {
  for (const auto &[k, v] : misc) {
    if (k == key) return v;
  }
  return std::nullopt;
}

nlohmann::json StatusSnapshot::toJson() const {
  nlohmann::json j;
  j["name"] = name;
  j["state"] = toString(state);
  j["previous_state"] =
      previousState ? nlohmann::json(toString(*previousState)) : nlohmann::json();
  j["failure_kind"] = toString(failureKind);
  j["error"] = error ? nlohmann::json(*error) : nlohmann::json();
  j["started_running"] =
      startedRunning ? nlohmann::json(isoTime(*startedRunning)) : nlohmann::json();
  j["last_time_running"] = lastTimeRunning
                               ? nlohmann::json(isoTime(*lastTimeRunning))
                               : nlohmann::json();
  j["misc"] = nlohmann::json::array();
  for (const auto &[k, v] : misc) {
    j["misc"].push_back({{"key", k}, {"value", v}});
  }
  j["tags"] = tags;
  return j;
}

// ---------------------------------------------------------------------------

WorkerStatus::WorkerStatus(std::string name,
                           std::shared_ptr<const StatusCallbacks> callbacks,
                           std::set<std::string> tags)
    : name_(std::move(name)),
      callbacks_(std::move(callbacks)),
      tags_(std::move(tags)) {
  std::lock_guard dispatchLock(dispatchMutex_);
  StatusSnapshot event;
  {
    std::lock_guard lock(mutex_);
    event = snapshotLocked();
  }
  dispatch(event);
}

void WorkerStatus::setStarting() {
  transition(WorkerState::Starting, std::nullopt, FailureKind::None);
}

void WorkerStatus::setRunning() {
  transition(WorkerState::Running, std::nullopt, FailureKind::None);
}

void WorkerStatus::setOff() {
  transition(WorkerState::Off, std::nullopt, FailureKind::None);
}

void WorkerStatus::setFailure(const std::string &error, FailureKind kind) {
  transition(WorkerState::Failure, error,
             kind == FailureKind::None ? FailureKind::Step : kind);
}

void WorkerStatus::transition(WorkerState next,
                              std::optional<std::string> error,
                              FailureKind kind) {
  std::lock_guard dispatchLock(dispatchMutex_);
  StatusSnapshot event;
  {
    std::lock_guard lock(mutex_);
    const WorkerState previous = state_;

    switch (next) {
      case WorkerState::Running:
        error_.reset();
        failureKind_ = FailureKind::None;
        if (!startedRunning_) startedRunning_ = Clock::now();
        break;
      case WorkerState::Failure:
        error_ = std::move(error);
        failureKind_ = kind;
        break;
      case WorkerState::Starting:
      case WorkerState::Off:
        break;
    }

    if (previous == next) return;

    if (previous == WorkerState::Running) {
      lastTimeRunning_ = Clock::now();
      startedRunning_.reset();
    }
    state_ = next;

    event = snapshotLocked();
    event.previousState = previous;
  }
  dispatch(event);
}

void WorkerStatus::dispatch(const StatusSnapshot &event) {
  if (!callbacks_) return;
  for (const auto &callback : *callbacks_) {
    if (!callback) continue;
    try {
      callback->onStatusChange(event);
    } catch (const std::exception &e) {
      sky::CompositeLogger::instance().error(
          "Status callback failed for " + name_ + ": " + e.what());
    } catch (...) {
      sky::CompositeLogger::instance().error(
          "Status callback failed for " + name_ + ": unknown exception");
    }
  }
}

void WorkerStatus::setMisc(const std::string &key, const std::string &value) {
  std::lock_guard lock(mutex_);
  for (auto &[k, v] : misc_) {
    if (k == key) {
      v = value;
      return;
    }
  }
  misc_.emplace_back(key, value);
}

void WorkerStatus::removeMisc(const std::string &key) {
  std::lock_guard lock(mutex_);
  misc_.erase(std::remove_if(misc_.begin(), misc_.end(),
                             [&](const auto &entry) { return entry.first == key; }),
              misc_.end());
}

void WorkerStatus::addTag(const std::string &tag) {
  std::lock_guard lock(mutex_);
  tags_.insert(tag);
}

void WorkerStatus::removeTag(const std::string &tag) {
  std::lock_guard lock(mutex_);
  tags_.erase(tag);
}

WorkerState WorkerStatus::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::optional<WorkerStatus::Clock::duration> WorkerStatus::runningFor() const {
  std::lock_guard lock(mutex_);
  if (!startedRunning_) return std::nullopt;
  return Clock::now() - *startedRunning_;
}

std::optional<WorkerStatus::Clock::duration> WorkerStatus::notRunningFor()
    const {
  std::lock_guard lock(mutex_);
  if (state_ == WorkerState::Running || !lastTimeRunning_) return std::nullopt;
  return Clock::now() - *lastTimeRunning_;
}

StatusSnapshot WorkerStatus::snapshot() const {
  std::lock_guard lock(mutex_);
  return snapshotLocked();
}

StatusSnapshot WorkerStatus::snapshotLocked() const {
  StatusSnapshot s;
  s.name = name_;
  s.state = state_;
  s.failureKind = failureKind_;
  s.error = error_;
  s.startedRunning = startedRunning_;
  s.lastTimeRunning = lastTimeRunning_;
  s.misc = misc_;
  s.tags = tags_;
  return s;
}
