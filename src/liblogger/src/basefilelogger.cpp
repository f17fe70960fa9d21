#include "sky/basefilelogger.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

namespace sky {

void BaseFileLogger::init(const LogLevel level) {
  setLogLevel(level);
  std::lock_guard lock(mutex_);
  reopenFilesLocked();
}

void BaseFileLogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void BaseFileLogger::setRotationConfig(const RotationConfig& config) {
  std::lock_guard<std::mutex> lock(mutex_);
  rotationConfig_ = config;
}

RotationConfig BaseFileLogger::getRotationConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rotationConfig_;
}

void BaseFileLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogFile_.is_open()) mainLogFile_.flush();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
}

void BaseFileLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now())
            << " [" << leveltoString(level) << "] "
            << message << "\n";
  const std::string line = formatted.str();

  std::lock_guard lock(mutex_);
  rotateIfNeededLocked(line.size());
  writeToFileLocked(line);
}

void BaseFileLogger::reopenFilesLocked() {
  if (mainLogFile_.is_open()) {
    mainLogFile_.close();
  }
  if (fallbackLogFile_.is_open()) {
    fallbackLogFile_.close();
  }

  mainLogFile_.open(mainLogPath_, std::ios::app);
  if (!mainLogFile_.is_open()) {
    std::cerr << "[LOGGER ERROR] Cannot open main log file: " << mainLogPath_ << std::endl;

    fallbackLogFile_.open(fallbackLogPath_, std::ios::app);
    if (!fallbackLogFile_.is_open()) {
      std::cerr << "[LOGGER ERROR] Cannot open fallback log file: " << fallbackLogPath_ << std::endl;
    }
  }
}

void BaseFileLogger::rotateIfNeededLocked(std::size_t incoming) {
  namespace fs = std::filesystem;

  if (!rotationConfig_.enabled || rotationConfig_.type != RotationType::SIZE ||
      !mainLogFile_.is_open()) {
    return;
  }

  std::error_code ec;
  auto currentSize = fs::file_size(mainLogPath_, ec);
  if (ec || currentSize + incoming <= rotationConfig_.maxFileSizeBytes) return;

  mainLogFile_.close();

  // <file>.N-1 -> <file>.N, ..., <file> -> <file>.1
  if (rotationConfig_.maxBackups == 0) {
    fs::remove(mainLogPath_, ec);
  } else {
    fs::remove(mainLogPath_ + "." + std::to_string(rotationConfig_.maxBackups), ec);
    for (std::size_t i = rotationConfig_.maxBackups; i > 1; --i) {
      const std::string from = mainLogPath_ + "." + std::to_string(i - 1);
      if (fs::exists(from, ec)) {
        fs::rename(from, mainLogPath_ + "." + std::to_string(i), ec);
      }
    }
    fs::rename(mainLogPath_, mainLogPath_ + ".1", ec);
    if (ec) {
      std::cerr << "[LOGGER ERROR] Log rotation failed: " << ec.message() << std::endl;
    }
  }

  mainLogFile_.open(mainLogPath_, std::ios::app);
  if (!mainLogFile_.is_open()) {
    std::cerr << "[LOGGER ERROR] Cannot open new log file after rotation: " << mainLogPath_ << std::endl;
  }
}

void BaseFileLogger::setMainLogPath(const std::string& path) {
  std::lock_guard lock(mutex_);
  if (mainLogPath_ == path && mainLogFile_.is_open()) return;
  mainLogPath_ = path;
  reopenFilesLocked();
}

void BaseFileLogger::setFallbackLogPath(const std::string& path) {
  std::lock_guard lock(mutex_);
  if (fallbackLogPath_ == path) return;
  fallbackLogPath_ = path;
  reopenFilesLocked();
}

std::string BaseFileLogger::getMainLogPath() const {
  std::lock_guard lock(mutex_);
  return mainLogPath_;
}

std::string BaseFileLogger::getFallbackLogPath() const {
  std::lock_guard lock(mutex_);
  return fallbackLogPath_;
}

}  // namespace sky
