#include "sky/compositelogger.hpp"

#include <mutex>

namespace sky {

    CompositeLogger& CompositeLogger::instance() {
        static CompositeLogger instance;
        return instance;
    }

    void CompositeLogger::addLogger(const std::shared_ptr<ILogger>& logger) {
        if (!logger) return;
        std::unique_lock lock(loggersMutex_);
        for (const auto& existing : loggers_) {
            if (existing.get() == logger.get()) return;
        }
        loggers_.push_back(logger);
    }

    void CompositeLogger::clearLoggers() {
        std::unique_lock lock(loggersMutex_);
        loggers_.clear();
    }

    std::size_t CompositeLogger::loggerCount() const {
        std::shared_lock lock(loggersMutex_);
        return loggers_.size();
    }

    void CompositeLogger::init(const LogLevel level) {
        std::shared_lock lock(loggersMutex_);
        for (auto& logger : loggers_) {
            logger->init(level);
        }
    }

    void CompositeLogger::setLogLevel(LogLevel level) {
        currentLevel_.store(level, std::memory_order_release);
        std::shared_lock lock(loggersMutex_);
        for (auto& logger : loggers_) {
            logger->setLogLevel(level);
        }
    }

    void CompositeLogger::flush() {
        std::shared_lock lock(loggersMutex_);
        for (auto& logger : loggers_) {
            logger->flush();
        }
    }

    void CompositeLogger::debug(const std::string& message) {
        log(LogLevel::LOG_DEBUG, message);
    }

    void CompositeLogger::info(const std::string& message) {
        log(LogLevel::LOG_INFO, message);
    }

    void CompositeLogger::warning(const std::string& message) {
        log(LogLevel::LOG_WARNING, message);
    }

    void CompositeLogger::error(const std::string& message) {
        log(LogLevel::LOG_ERROR, message);
    }

    void CompositeLogger::critical(const std::string& message) {
        log(LogLevel::LOG_CRITICAL, message);
    }

    void CompositeLogger::log(LogLevel level, const std::string& message) {
        std::shared_lock lock(loggersMutex_);
        for (auto& logger : loggers_) {
            switch (level) {
                case LogLevel::LOG_DEBUG:    logger->debug(message); break;
                case LogLevel::LOG_INFO:     logger->info(message); break;
                case LogLevel::LOG_WARNING:  logger->warning(message); break;
                case LogLevel::LOG_ERROR:    logger->error(message); break;
                case LogLevel::LOG_CRITICAL: logger->critical(message); break;
            }
        }
    }

    bool CompositeLogger::shouldSkipLog(LogLevel) const {
        return false;
    }
}
