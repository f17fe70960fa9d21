/**
 * @file supervisor.hpp
 * @brief Цикл сверки желаемого и фактического набора воркеров
 *
 * @details
 * Каждый цикл:
 *  1. разрешение желаемого набора дескрипторов из ConfigSource::getGlobal()
 *     (ошибки отдельных ключей журналируются, цикл продолжается);
 *  2. остановка и удаление воркеров, которых больше нет в желаемом наборе;
 *  3. создание и запуск недостающих воркеров;
 *  4. revive() для всех остальных живых воркеров;
 *  5. сон на период `main.period`, прерываемый остановкой или wake().
 *
 * Завершение: stop() всех воркеров параллельно с ожиданием не дольше
 * `main.stop_timeout` секунд.
 */

#pragma once

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "../include/stoptoken.hpp"
#include "../include/workercontainer.hpp"
#include "../include/workercontext.hpp"
#include "../include/workerregistry.hpp"

class Supervisor {
 public:
  /// Итог одного цикла сверки
  struct CycleReport {
    std::vector<std::string> started;
    std::vector<std::string> stopped;
    std::vector<std::string> revived;
    std::vector<std::string> unresolved;
    std::vector<std::string> failedToStart;

    bool hasActions() const {
      return !started.empty() || !stopped.empty() || !revived.empty();
    }
  };

  static constexpr std::chrono::seconds kDefaultStopTimeout{30};

  /**
   * @param context Зависимости воркеров (источник конфигурации, реестр состояний...)
   * @param registry Реестр видов воркеров
   * @throw ConfigurationError Если `main.period` отсутствует или не число
   */
  Supervisor(WorkerContext context, const WorkerRegistry &registry);
  ~Supervisor();

  Supervisor(const Supervisor &) = delete;
  Supervisor &operator=(const Supervisor &) = delete;

  /**
   * @brief Один цикл сверки
   * @throw ConfigurationError Если документ конфигурации не читается
   */
  CycleReport reconcile();

  /// Цикл сверки до requestStop(); исключения отдельных циклов журналируются
  void run();

  void requestStop();

  /// Внеочередной цикл (SIGHUP)
  void wake();

  /**
   * @brief Параллельная остановка всех воркеров
   * @param timeout Максимальное ожидание
   * @return false, если какой-либо воркер не остановился за timeout
   */
  bool shutdown(std::chrono::milliseconds timeout);
  bool shutdown() { return shutdown(stopTimeout_); }

  std::set<std::string> liveWorkers() const;
  std::shared_ptr<Worker> worker(const std::string &name) const;

  std::chrono::milliseconds period() const noexcept { return period_; }
  std::chrono::milliseconds stopTimeout() const noexcept { return stopTimeout_; }

 private:
  WorkerContext context_;
  const WorkerRegistry &registry_;
  WorkersContainer workers_;
  StopToken token_;
  std::chrono::milliseconds period_{0};
  std::chrono::milliseconds stopTimeout_{kDefaultStopTimeout};
};
