#pragma once

#include "sky/ilogger.hpp"

#include <iosfwd>

#define SKY_ANSI_COLOR_RESET "\033[0m"

namespace sky {

/**
 * @class ConsoleLogger
 * @brief Вывод журнала в stdout с цветовой разметкой уровня.
 */
class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

  // Отключение ANSI-цветов (вывод в файл/журнал systemd)
  void setColorsEnabled(bool enabled);

 protected:
  ConsoleLogger() = default;
  ~ConsoleLogger() override = default;
  void log(LogLevel level, const std::string& message) override;

 private:
  static const char* colorCode(LogLevel level);
  mutable std::mutex mutex_;
  std::atomic<bool> colorsEnabled_{true};
};
}  // namespace sky
