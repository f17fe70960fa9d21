/**
 * @file workerstatus.hpp
 * @brief Состояние воркера и уведомления о его изменениях
 *
 * @details
 * Один объект WorkerStatus на имя воркера. Изменяется только воркером-
 * владельцем, читается StatusRegistry и воркерами отчётности.
 *
 * Правила переходов:
 *  - обратные вызовы срабатывают только при смене состояния;
 *  - при уходе из Running сбрасывается startedRunning и фиксируется
 *    lastTimeRunning;
 *  - startedRunning задан тогда и только тогда, когда состояние Running;
 *  - при создании записи рассылается синтетическое событие Starting.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

enum class WorkerState { Starting, Running, Off, Failure };

// Категория отказа: операторам важно отличать неверные учётные данные
// от обычного сбоя шага
enum class FailureKind { None, Step, Authentication };

std::string toString(WorkerState state);
std::string toString(FailureKind kind);

/// Порядок "тяжести" состояния: Running < Starting < Off < Failure
int severity(WorkerState state);

/**
 * @struct StatusSnapshot
 * @brief Копия записи состояния на момент события или запроса
 */
struct StatusSnapshot {
  using Clock = std::chrono::system_clock;

  std::string name;
  WorkerState state = WorkerState::Starting;
  std::optional<WorkerState> previousState;
  FailureKind failureKind = FailureKind::None;
  std::optional<std::string> error;
  std::optional<Clock::time_point> startedRunning;
  std::optional<Clock::time_point> lastTimeRunning;
  std::vector<std::pair<std::string, std::string>> misc;  ///< в порядке добавления
  std::set<std::string> tags;

  std::optional<std::string> miscValue(const std::string &key) const;

  nlohmann::json toJson() const;
};

/**
 * @class StatusChangeCallback
 * @brief Приёмник событий смены состояния (уведомления, выгрузка статуса)
 *
 * @note Исключения из onStatusChange() перехватываются и журналируются,
 * воркер-источник события их не видит.
 */
class StatusChangeCallback {
 public:
  virtual ~StatusChangeCallback() = default;
  virtual void onStatusChange(const StatusSnapshot &event) = 0;
};

/// Адаптер для лямбд
class FunctionStatusCallback : public StatusChangeCallback {
 public:
  explicit FunctionStatusCallback(
      std::function<void(const StatusSnapshot &)> func)
      : func_(std::move(func)) {}

  void onStatusChange(const StatusSnapshot &event) override { func_(event); }

 private:
  std::function<void(const StatusSnapshot &)> func_;
};

using StatusCallbacks = std::vector<std::shared_ptr<StatusChangeCallback>>;

/**
 * @class WorkerStatus
 * @brief Запись состояния одного воркера с собственной блокировкой
 *
 * @warning Обратный вызов не должен менять состояние той же записи:
 * рассылка событий одной записи сериализована.
 */
class WorkerStatus {
 public:
  using Clock = StatusSnapshot::Clock;

  WorkerStatus(std::string name,
               std::shared_ptr<const StatusCallbacks> callbacks,
               std::set<std::string> tags = {});

  WorkerStatus(const WorkerStatus &) = delete;
  WorkerStatus &operator=(const WorkerStatus &) = delete;

  void setStarting();
  void setRunning();
  void setOff();
  void setFailure(const std::string &error,
                  FailureKind kind = FailureKind::Step);

  void setMisc(const std::string &key, const std::string &value);
  void removeMisc(const std::string &key);
  void addTag(const std::string &tag);
  void removeTag(const std::string &tag);

  WorkerState state() const;
  const std::string &name() const noexcept { return name_; }

  /// Время в Running (nullopt вне Running)
  std::optional<Clock::duration> runningFor() const;
  /// Время с последнего выхода из Running (nullopt, если не был в Running)
  std::optional<Clock::duration> notRunningFor() const;

  StatusSnapshot snapshot() const;

 private:
  void transition(WorkerState next, std::optional<std::string> error,
                  FailureKind kind);
  void dispatch(const StatusSnapshot &event);
  StatusSnapshot snapshotLocked() const;

  const std::string name_;
  std::shared_ptr<const StatusCallbacks> callbacks_;

  mutable std::mutex mutex_;
  std::mutex dispatchMutex_;

  WorkerState state_ = WorkerState::Starting;
  FailureKind failureKind_ = FailureKind::None;
  std::optional<std::string> error_;
  std::optional<Clock::time_point> startedRunning_;
  std::optional<Clock::time_point> lastTimeRunning_;
  std::vector<std::pair<std::string, std::string>> misc_;
  std::set<std::string> tags_;
};
