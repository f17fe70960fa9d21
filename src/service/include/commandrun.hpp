/**
 * @file commandrun.hpp
 * @brief Выполнение одной команды на отдельном потоке
 *
 * @details Поток запускает `/bin/bash -c <текст>` (см. runProcess) и
 * публикует результат в ResultChannel; CommandExecutor только опрашивает
 * канал и никогда не блокируется на время выполнения команды.
 *
 * @ingroup Commands
 */

#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

#include "../include/commandsource.hpp"
#include "../include/resultchannel.hpp"

class CommandRun {
 public:
  /**
   * @param request Запрос
   * @param timeout Ограничение длительности (0: без ограничения)
   * @throw std::system_error Поток не удалось создать
   */
  CommandRun(CommandRequest request, std::chrono::milliseconds timeout);
  ~CommandRun();

  CommandRun(const CommandRun &) = delete;
  CommandRun &operator=(const CommandRun &) = delete;

  /// Завершить группу процессов команды
  void cancel();

  std::optional<CommandResult> result() const { return channel_.tryResult(); }
  std::optional<CommandResult> waitResult(std::chrono::milliseconds timeout) const {
    return channel_.waitResult(timeout);
  }

  bool finished() const { return channel_.finished(); }
  double runningFor() const;
  const CommandRequest &request() const noexcept { return request_; }
  Command command() const;

 private:
  void execute(std::chrono::milliseconds timeout);

  const CommandRequest request_;
  const std::chrono::steady_clock::time_point started_;
  std::atomic<bool> cancel_{false};
  ResultChannel<CommandResult> channel_;
  std::thread thread_;
};
