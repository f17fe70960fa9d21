/**
 * @file service_controller.hpp
 * @brief Класс управления жизненным циклом агента станции
 *
 * @details
 * ServiceController объединяет разбор аргументов, поиск каталога
 * конфигурации, настройку логирования, регистрацию сигналов и запуск
 * Supervisor в главном потоке.
 *
 * @note Не потокобезопасен при параллельном вызове run()
 * @warning Ошибки инициализации завершают процесс с кодом EXIT_FAILURE
 */
#pragma once

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "../include/argumentparser.hpp"
#include "../include/supervisor.hpp"
#include "../include/workercontext.hpp"
#include "../include/workerregistry.hpp"
#include "../include/workerstatus.hpp"

/**
 * @defgroup MainAPI Основные методы
 */

/**
 * @defgroup SignalHandlers Методы обработки системных сигналов
 */

/**
 * @class ServiceController
 * @brief Управляет запуском, конфигурацией и жизненным циклом агента
 * @ingroup Core
 *
 * @details
 * Этапы:
 * 1. Парсинг и валидация CLI аргументов
 * 2. Проверка каталога конфигурации и файла-псевдонима
 * 3. Инициализация логгера (секция `main` или CLI)
 * 4. Регистрация SIGTERM/SIGINT (остановка) и SIGHUP (внеочередной цикл)
 *    до создания любых рабочих потоков
 * 5. Цикл Supervisor и ограниченная по времени остановка воркеров
 *
 * @see ArgumentParser, Supervisor, sky::SignalRouter
 */
class ServiceController {
 public:
  ServiceController();

  /**
   * @brief Основная точка входа
   * @ingroup MainAPI
   *
   * @return EXIT_SUCCESS или EXIT_FAILURE. Если воркеры не остановились за
   *         `main.stop_timeout`, процесс завершается через std::_Exit.
   *
   * @code
   int main(int argc, char** argv) {
       ServiceController controller;
       return controller.run(argc, argv);
   }
   @endcode
   */
  int run(int argc, char **argv);

  /// Дополнительные приёмники событий (до run())
  void addStatusCallback(std::shared_ptr<StatusChangeCallback> callback);
  void addCommandCallback(std::shared_ptr<CommandCallback> callback);
  void addStatusReportCallback(std::shared_ptr<StatusReportCallback> callback);
  void addConfigChangeCallback(std::shared_ptr<ConfigChangeCallback> callback);
  void setCommandChannelFactory(CommandChannelFactory factory);

 private:
  /**
   * @brief Логирование по CLI или секции `main`
   *
   * @details Приоритет: `--log-type`/`--log-level`, затем массив
   * `main.logging` (`{"type", "level", "file"}`), затем консоль плюс
   * `main.local_log_file` с ротацией по размеру (1 MiB, 3 копии).
   */
  void initLogger(const ParsedArgs &args, const nlohmann::json &main);

  /**
   * @brief Регистрация обработчиков сигналов и запуск SignalRouter
   * @ingroup SignalHandlers
   * @warning Вызывать до создания потоков воркеров: маска сигналов
   * наследуется потоками
   */
  void initSignals();

  /// @ingroup SignalHandlers
  void handleShutdown(int signum);
  /// @ingroup SignalHandlers
  void handleWake();

  int runDeployTests(ConfigSource &source, const WorkerContext &context);

  void printHelp();
  void printVersion();

  WorkerRegistry registry_;
  ConfigLayout layout_;
  StatusCallbacks statusCallbacks_;
  WorkerContext context_;

  std::mutex mtx_;  ///< защищает supervisor_ и shutdown_requested_
  std::unique_ptr<Supervisor> supervisor_;
  bool shutdown_requested_ = false;
};
