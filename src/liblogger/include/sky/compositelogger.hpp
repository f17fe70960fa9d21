#pragma once

#include "sky/ilogger.hpp"
#include <vector>
#include <memory>
#include <shared_mutex>

namespace sky {

/**
 * @class CompositeLogger
 * @brief Единая точка логирования: рассылает сообщения всем приёмникам.
 *
 * @note Фильтрация по уровню выполняется вложенными логгерами.
 */
class CompositeLogger : public ILogger {
public:
    static CompositeLogger& instance();

    CompositeLogger(const CompositeLogger&) = delete;
    CompositeLogger& operator=(const CompositeLogger&) = delete;

    void addLogger(const std::shared_ptr<ILogger>& logger);

    // Удаляет все приёмники (используется при переинициализации)
    void clearLoggers();

    std::size_t loggerCount() const;

    void init(const LogLevel level) override;

    void setLogLevel(LogLevel level) override;

    void flush() override;

    void debug(const std::string& message) override;
    void info(const std::string& message) override;
    void warning(const std::string& message) override;
    void error(const std::string& message) override;
    void critical(const std::string& message) override;

protected:
    bool shouldSkipLog(LogLevel level) const override;
    void log(LogLevel level, const std::string& message) override;

private:
    CompositeLogger() = default;
    ~CompositeLogger() override = default;

    mutable std::shared_mutex loggersMutex_;
    std::vector<std::shared_ptr<ILogger>> loggers_;
};

/**
 * @brief Обёртка синглтона в shared_ptr без владения
 */
template <typename T>
std::shared_ptr<ILogger> nonOwning(T& logger) {
    return std::shared_ptr<ILogger>(&logger, [](ILogger*) {});
}

} // namespace sky
