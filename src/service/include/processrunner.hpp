/**
 * @file processrunner.hpp
 * @brief Запуск дочернего процесса с захватом вывода, таймаутом и отменой
 *
 * @details Дочерний процесс становится лидером собственной группы (setsid),
 * поэтому по таймауту или отмене завершается вся группа (`kill(-pid)`),
 * включая порождённые им процессы.
 *
 * Код завершения по соглашениям оболочки: WEXITSTATUS, 128 + номер сигнала,
 * 124 по таймауту, 127 если exec не удался.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

struct ProcessSpec {
  std::string command;                 ///< путь к исполняемому файлу
  std::vector<std::string> argv;       ///< аргументы (без argv[0])
  std::chrono::milliseconds timeout{0};  ///< 0: без ограничения
  std::size_t maxOutputBytes = 1024 * 1024;
};

struct ProcessResult {
  int exitCode = -1;
  std::string stdoutText;
  std::string stderrText;
  bool timedOut = false;
  bool cancelled = false;
  bool stdoutTruncated = false;
  bool stderrTruncated = false;
};

/**
 * @brief Выполнить процесс до завершения
 * @param spec Описание запуска
 * @param cancel Флаг отмены (проверяется в цикле ожидания), может быть nullptr
 * @param onTick Вызывается на каждой итерации ожидания (heartbeat)
 * @throw std::system_error Не удалось создать каналы или процесс
 */
ProcessResult runProcess(const ProcessSpec &spec,
                         const std::atomic<bool> *cancel = nullptr,
                         const std::function<void()> &onTick = nullptr);

/// `/bin/bash -c <script>`
ProcessSpec shellCommand(const std::string &script,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
