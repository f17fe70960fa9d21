#pragma once
#include "sky/basefilelogger.hpp"

namespace sky {

/**
 * @class SyncFileLogger
 * @brief Синхронная запись в файл: каждое сообщение сбрасывается на диск
 *        до возврата из вызова.
 */
class SyncFileLogger : public BaseFileLogger {
public:
    static SyncFileLogger& instance();

protected:
    void writeToFileLocked(const std::string& message) override;

private:
    SyncFileLogger() = default;
    bool warnedAboutFallback_ = false;
};

} // namespace sky
