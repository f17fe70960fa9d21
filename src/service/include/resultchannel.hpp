/**
 * @file resultchannel.hpp
 * @brief Канал результата между управляющим потоком воркера и его
 *        вспомогательной задачей (поток или дочерний процесс)
 *
 * @details Задача публикует heartbeat, текст ошибки и итоговый результат;
 * владелец опрашивает (tryResult) или ждёт (waitResult). Всё состояние
 * защищено одним мьютексом.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

template <typename Result>
class ResultChannel {
 public:
  using Clock = std::chrono::system_clock;

  void heartbeat() {
    std::lock_guard lock(mutex_);
    heartbeat_ = Clock::now();
  }

  std::optional<Clock::time_point> lastHeartbeat() const {
    std::lock_guard lock(mutex_);
    return heartbeat_;
  }

  void setError(std::string error) {
    {
      std::lock_guard lock(mutex_);
      error_ = std::move(error);
    }
    cv_.notify_all();
  }

  void setResult(Result result) {
    {
      std::lock_guard lock(mutex_);
      result_ = std::move(result);
    }
    cv_.notify_all();
  }

  std::optional<std::string> error() const {
    std::lock_guard lock(mutex_);
    return error_;
  }

  std::optional<Result> tryResult() const {
    std::lock_guard lock(mutex_);
    return result_;
  }

  /// Ожидание результата или ошибки; nullopt, если результата нет
  std::optional<Result> waitResult(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return result_ || error_; });
    return result_;
  }

  /// Задача завершилась (результатом или ошибкой)
  bool finished() const {
    std::lock_guard lock(mutex_);
    return result_.has_value() || error_.has_value();
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::optional<Clock::time_point> heartbeat_;
  std::optional<std::string> error_;
  std::optional<Result> result_;
};
