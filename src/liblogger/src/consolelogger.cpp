#include "sky/consolelogger.hpp"

#include <iostream>
#include <sstream>

sky::ConsoleLogger& sky::ConsoleLogger::instance() {
  static sky::ConsoleLogger instance;
  return instance;
}

void sky::ConsoleLogger::init(const LogLevel level) {
  setLogLevel(level);
}

void sky::ConsoleLogger::setLogLevel(sky::LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void sky::ConsoleLogger::setColorsEnabled(bool enabled) {
  colorsEnabled_.store(enabled, std::memory_order_release);
}

void sky::ConsoleLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout.flush();
  std::cerr.flush();
}

void sky::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message;

  const bool colored = colorsEnabled_.load(std::memory_order_acquire);

  std::lock_guard lock(mutex_);
  if (colored) std::cout << colorCode(level);
  std::cout << formatted.str();
  if (colored) std::cout << SKY_ANSI_COLOR_RESET;
  std::cout << std::endl;
}

const char* sky::ConsoleLogger::colorCode(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "\033[36m";  // Cyan
    case LogLevel::LOG_INFO:
      return "\033[32m";  // Green
    case LogLevel::LOG_WARNING:
      return "\033[33m";  // Yellow
    case LogLevel::LOG_ERROR:
      return "\033[31m";  // Red
    case LogLevel::LOG_CRITICAL:
      return "\033[41m\033[37m";  // White on Red
  }
  return SKY_ANSI_COLOR_RESET;
}
