/**
 * @file ilogger.hpp
 * @brief Базовый интерфейс логгеров агента и форматирование времени.
 *
 * @details Все компоненты пишут в журнал через sky::CompositeLogger,
 * который раздаёт сообщения конкретным приёмникам (консоль, файл).
 */

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace sky {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

/**
 * @class TimeFormatter
 * @brief Форматирование меток времени (strftime-формат, локальное время).
 */
class TimeFormatter {
 public:
  static bool setGlobalFormat(const std::string& fmt);

  static std::string format(const std::chrono::system_clock::time_point& tp);

 private:
  inline static std::string globalFormat_ = "%Y-%m-%d %T";
  inline static std::mutex formatMutex_;
};

class ILogger {
 public:
  virtual ~ILogger() = default;

  virtual void init(const LogLevel level) = 0;

  virtual void setLogLevel(LogLevel level) = 0;
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

 protected:
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  virtual void log(LogLevel, const std::string&) = 0;
  virtual bool shouldSkipLog(LogLevel level) const;
};

std::string leveltoString(LogLevel level);

/**
 * @brief Разбор названия уровня ("debug", "INFO", "warning", ...)
 * @throw std::invalid_argument Для неизвестного названия
 */
LogLevel stringToLogLevel(const std::string& level);

}  // namespace sky
