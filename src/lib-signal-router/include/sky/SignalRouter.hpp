/**
 * @file SignalRouter.hpp
 * @brief Асинхронный маршрутизатор POSIX-сигналов
 *
 * @details Сигналы блокируются во всех потоках процесса и читаются из
 * signalfd отдельным потоком, поэтому обработчики выполняются в обычном
 * контексте и могут захватывать мьютексы, писать в журнал и т.д.
 * Агент использует его для перевода SIGTERM/SIGINT в кооперативную
 * остановку Supervisor и SIGHUP во внеочередной цикл сверки.
 */
#pragma once

#include <signal.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sky {

/**
 * @class SignalRouter
 * @brief Потокобезопасный менеджер обработки сигналов (Singleton)
 *
 * @warning
 * - Только для Linux систем
 * - Не поддерживает SIGKILL и SIGSTOP
 * - registerHandler() необходимо вызвать до создания рабочих потоков:
 *   маска сигналов наследуется потоками при создании
 */
class SignalRouter {
 public:
  using Handler = std::function<void(int)>;  ///< Тип обработчика сигналов

  static SignalRouter& instance() {
    static SignalRouter router;
    return router;
  }

  SignalRouter(const SignalRouter&) = delete;
  SignalRouter& operator=(const SignalRouter&) = delete;

  /**
   * @brief Зарегистрировать обработчик для сигнала
   * @param signum Номер сигнала (например, SIGTERM)
   * @param handler Функция-обработчик
   * @throw std::invalid_argument При неверном номере сигнала
   * @throw std::system_error При ошибках системных вызовов
   *
   * @code
   * router.registerHandler(SIGTERM, [&](int) { supervisor.requestStop(); });
   * @endcode
   */
  void registerHandler(int signum, Handler handler);

  /**
   * @brief Удалить все обработчики для сигнала
   * @note Сигнал остаётся заблокированным и будет поглощён signalfd
   */
  void unregisterHandler(int signum);

  /**
   * @brief Запустить поток обработки сигналов
   * @throw std::system_error При ошибках инициализации epoll/eventfd
   */
  void start();

  /**
   * @brief Остановить обработку сигналов
   * @note Безопасно вызывать повторно и из обработчика сигнала
   */
  void stop() noexcept;

  bool isRunning() const noexcept { return running_.load(); }

  ~SignalRouter();

 private:
  SignalRouter();
  void processSignals();

  std::unordered_map<int, std::vector<Handler>> handlers_;
  std::mutex handlers_mutex_;
  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::thread worker_thread_;
  int signal_fd_ = -1;
  int epoll_fd_ = -1;
  int wake_fd_ = -1;  ///< eventfd для пробуждения потока при stop()
  sigset_t original_mask_;
  sigset_t blocked_mask_{};
};

}  // namespace sky
