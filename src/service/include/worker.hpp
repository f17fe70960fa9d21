/**
 * @file worker.hpp
 * @brief Базовый класс контролируемого воркера
 *
 * @details
 * Worker: автономная единица работы с собственным потоком выполнения:
 *  - start(): новый поток, состояние Starting, в цикле Running;
 *  - один шаг цикла: step(); исключение из шага переводит состояние в
 *    Failure и завершает поток (шаг не повторяется в этом потоке);
 *  - stop(): кооперативная остановка, ожидание завершения потока, Off;
 *  - revive(): новый поток, если старый завершился без stop().
 *
 * Сон внутри шага прерывается остановкой воркера и, по запросу, изменением
 * файла конфигурации.
 *
 * Каждый конкретный воркер дополнительно предоставляет статический метод
 * `static std::optional<std::string> checkConfig(ConfigSource&)`,
 * используемый WorkerRegistry.
 *
 * @warning Производный класс обязан вызвать stop() в своём деструкторе:
 * поток вызывает виртуальные методы.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

#include "../include/configsource.hpp"
#include "../include/stoptoken.hpp"
#include "../include/workercontext.hpp"
#include "../include/workerstatus.hpp"

/**
 * @defgroup Core Основные компоненты агента
 */

/**
 * @class Worker
 * @ingroup Core
 */
class Worker {
 public:
  enum class WakeReason { Timeout, Stop, ConfigChange };

  Worker(std::string name, WorkerContext context,
         std::set<std::string> tags = {});
  virtual ~Worker();

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;

  /**
   * @brief Запуск нового потока выполнения
   * @throw std::system_error Если поток не удалось создать
   * @note Повторный вызов для работающего воркера игнорируется
   */
  void start();

  /**
   * @brief Кооперативная остановка с ожиданием завершения потока
   * @note Безопасен, если поток уже завершился (в том числе с ошибкой)
   */
  void stop();

  /**
   * @brief Перезапуск упавшего воркера
   * @return true, если запущен новый поток
   * @note Ошибки запуска журналируются и не пробрасываются
   */
  bool revive();

  bool isAlive() const noexcept;
  bool isRunning() const noexcept;

  /**
   * @brief Разовая проверка реальных побочных эффектов (deploy test)
   * @return Текст ошибки или nullopt
   */
  virtual std::optional<std::string> deployTest() = 0;

  const std::string &name() const noexcept { return name_; }
  std::shared_ptr<WorkerStatus> status() const { return status_; }

 protected:
  /// Один шаг работы; исключение переводит воркер в Failure
  virtual void step() = 0;

  /// Вызывается при кооперативном завершении потока перед переходом в Off
  virtual void onExit() {}

  /**
   * @brief Прерываемый сон
   * @param duration Длительность
   * @param interruptOnConfigChange Проснуться при изменении конфигурации
   */
  WakeReason sleep(std::chrono::milliseconds duration,
                   bool interruptOnConfigChange = false);
  WakeReason sleepSeconds(double seconds, bool interruptOnConfigChange = false);

  ConfigSource &config() { return *context_.configSource; }
  const WorkerContext &context() const noexcept { return context_; }
  StopToken &stopToken() noexcept { return token_; }

 private:
  void run();

  const std::string name_;
  WorkerContext context_;
  std::shared_ptr<WorkerStatus> status_;

  std::mutex lifecycleMutex_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> alive_{false};
  std::atomic<bool> stopped_{false};  ///< был явный stop()
  StopToken token_;
};
