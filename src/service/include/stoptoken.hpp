/**
 * @file stoptoken.hpp
 * @brief Токен кооперативной отмены с прерываемым ожиданием
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

/**
 * @class StopToken
 * @brief Флаг остановки + condition_variable
 *
 * @details Каждый воркер владеет собственным токеном; Supervisor использует
 * свой токен для ожидания между циклами сверки. waitFor() возвращается
 * досрочно при requestStop() или при срабатывании predicate.
 */
class StopToken {
 public:
  void requestStop();

  bool stopRequested() const;

  // Сброс флага перед повторным запуском (revive)
  void reset();

  // Разбудить ожидающих без установки флага остановки
  void notify();

  /**
   * @brief Ожидание с прерыванием
   * @param timeout Максимальная длительность ожидания
   * @param wakeIf Дополнительное условие досрочного пробуждения
   *               (проверяется не реже poll)
   * @param poll Период проверки wakeIf
   * @return true, если ожидание прервано (остановка или wakeIf), false по таймауту
   */
  bool waitFor(std::chrono::milliseconds timeout,
               const std::function<bool()> &wakeIf = nullptr,
               std::chrono::milliseconds poll = std::chrono::milliseconds(200));

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopRequested_ = false;
  unsigned long notifications_ = 0;
};
