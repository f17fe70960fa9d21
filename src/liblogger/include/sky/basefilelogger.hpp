#pragma once
#include "sky/ilogger.hpp"
#include "sky/irotatablelogger.hpp"
#include <fstream>
#include <mutex>

namespace sky {

/**
 * @class BaseFileLogger
 * @brief Общая часть файловых логгеров: открытие файлов, резервный файл,
 *        ротация по размеру.
 *
 * @note Все методы с суффиксом Locked вызываются при захваченном mutex_.
 */
class BaseFileLogger : public ILogger, public IRotatableLogger {
public:
    void init(const LogLevel level) override;
    void setLogLevel(LogLevel level) override;
    void setRotationConfig(const RotationConfig& config) override;
    RotationConfig getRotationConfig() const override;
    void flush() override;
    void setMainLogPath(const std::string& path);
    void setFallbackLogPath(const std::string& path);
    std::string getMainLogPath() const;
    std::string getFallbackLogPath() const;

protected:
    BaseFileLogger() = default;
    ~BaseFileLogger() override = default;

    void log(LogLevel level, const std::string& message) override;
    virtual void writeToFileLocked(const std::string& formattedMessage) = 0;

    void reopenFilesLocked();
    void rotateIfNeededLocked(std::size_t incoming);

    mutable std::mutex mutex_;
    std::ofstream mainLogFile_;
    std::ofstream fallbackLogFile_;
    std::string mainLogPath_ = "skystation.log";
    std::string fallbackLogPath_ = "skystation_fallback.log";
    RotationConfig rotationConfig_;
};

}  // namespace sky
