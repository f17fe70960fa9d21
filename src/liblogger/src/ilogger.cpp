#include "sky/ilogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

bool sky::TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (fmt.empty()) {
    std::cerr << "Empty time format ignored" << std::endl;
    return false;
  }
  std::lock_guard lock(formatMutex_);
  globalFormat_ = fmt;
  return true;
}

std::string sky::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  auto now_time = std::chrono::system_clock::to_time_t(tp);
  std::tm now_tm{};
  if (localtime_r(&now_time, &now_tm) == nullptr) {
    return "[INVALID_TIME]";
  }

  std::string fmt;
  {
    std::lock_guard lock(formatMutex_);
    fmt = globalFormat_;
  }

  std::ostringstream oss;
  oss << std::put_time(&now_tm, fmt.c_str());
  return oss.str();
}

sky::LogLevel sky::ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

bool sky::ILogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

void sky::ILogger::debug(const std::string& message) {
  log(sky::LogLevel::LOG_DEBUG, message);
}

void sky::ILogger::info(const std::string& message) {
  log(sky::LogLevel::LOG_INFO, message);
}

void sky::ILogger::warning(const std::string& message) {
  log(sky::LogLevel::LOG_WARNING, message);
}

void sky::ILogger::error(const std::string& message) {
  log(sky::LogLevel::LOG_ERROR, message);
}

void sky::ILogger::critical(const std::string& message) {
  log(sky::LogLevel::LOG_CRITICAL, message);
}

std::string sky::leveltoString(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "DEBUG";
    case LogLevel::LOG_INFO:
      return "INFO";
    case LogLevel::LOG_WARNING:
      return "WARNING";
    case LogLevel::LOG_ERROR:
      return "ERROR";
    case LogLevel::LOG_CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

sky::LogLevel sky::stringToLogLevel(const std::string& level) {
  std::string lower = level;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "debug") return LogLevel::LOG_DEBUG;
  if (lower == "info") return LogLevel::LOG_INFO;
  if (lower == "warning" || lower == "warn") return LogLevel::LOG_WARNING;
  if (lower == "error") return LogLevel::LOG_ERROR;
  if (lower == "critical") return LogLevel::LOG_CRITICAL;
  throw std::invalid_argument("Unknown log level: " + level);
}
