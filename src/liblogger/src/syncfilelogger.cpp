#include "sky/syncfilelogger.hpp"

#include <iostream>

namespace sky {

SyncFileLogger& SyncFileLogger::instance() {
    static SyncFileLogger instance;
    return instance;
}

void SyncFileLogger::writeToFileLocked(const std::string& message) {
    // Основной файл мог быть удалён или не открыт: одна попытка переоткрытия
    if (!mainLogFile_.is_open() && !fallbackLogFile_.is_open()) {
        std::cerr << "[LOGGER ERROR] No log file is open for writing! Attempting to reopen files..." << std::endl;
        reopenFilesLocked();
    }

    if (mainLogFile_.is_open()) {
        mainLogFile_ << message;
        mainLogFile_.flush();
        warnedAboutFallback_ = false;
        if (mainLogFile_.good()) return;
        std::cerr << "[LOGGER ERROR] Write to main log file failed: " << mainLogPath_ << std::endl;
        mainLogFile_.close();
        fallbackLogFile_.open(fallbackLogPath_, std::ios::app);
    }

    if (fallbackLogFile_.is_open()) {
        if (!warnedAboutFallback_) {
            std::cerr << "[LOGGER WARNING] Main log file unavailable, switching to fallback log file: "
                      << fallbackLogPath_ << std::endl;
            warnedAboutFallback_ = true;
        }
        fallbackLogFile_ << message;
        fallbackLogFile_.flush();
        return;
    }

    std::cerr << "[LOGGER ERROR] Still no log file is open for writing: " << message;
}

} // namespace sky
