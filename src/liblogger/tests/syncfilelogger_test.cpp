#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include "sky/syncfilelogger.hpp"

namespace fs = std::filesystem;

// Вспомогательный класс для временных файлов
class TempFile {
public:
    explicit TempFile(const std::string& prefix = "test") {
        path_ = (fs::temp_directory_path() /
                 (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".log"))
                    .string();
    }
    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
        for (int i = 1; i <= 5; ++i) fs::remove(path_ + "." + std::to_string(i), ec);
    }
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

static std::string readAll(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

class SyncFileLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mainLog_ = std::make_unique<TempFile>("main");
        fallbackLog_ = std::make_unique<TempFile>("fallback");
        logger_ = &sky::SyncFileLogger::instance();
        logger_->setRotationConfig(sky::RotationConfig{});
        logger_->setFallbackLogPath(fallbackLog_->path());
        logger_->setMainLogPath(mainLog_->path());
        logger_->init(sky::LogLevel::LOG_INFO);
    }
    void TearDown() override {
        logger_->flush();
    }
    std::unique_ptr<TempFile> mainLog_;
    std::unique_ptr<TempFile> fallbackLog_;
    sky::SyncFileLogger* logger_;
};

// Сообщение записывается в основной файл
TEST_F(SyncFileLoggerTest, WritesToMainFile) {
    const std::string message = "Test message to main file";
    logger_->info(message);

    EXPECT_NE(readAll(mainLog_->path()).find(message), std::string::npos);
}

// Основной файл в несуществующем каталоге: запись уходит в резервный
TEST_F(SyncFileLoggerTest, FallbackWhenMainPathUnavailable) {
    logger_->setMainLogPath("/nonexistent-dir-for-sky-tests/main.log");

    const std::string message = "Test message to fallback";
    logger_->info(message);

    EXPECT_NE(readAll(fallbackLog_->path()).find(message), std::string::npos);
    logger_->setMainLogPath(mainLog_->path());
}

// Сообщение ниже текущего уровня не пишется
TEST_F(SyncFileLoggerTest, SkipsLowerLevel) {
    logger_->setLogLevel(sky::LogLevel::LOG_WARNING);
    const std::string message = "This should not appear";
    logger_->info(message);

    EXPECT_EQ(readAll(mainLog_->path()).find(message), std::string::npos);
}

TEST_F(SyncFileLoggerTest, FormatsMessage) {
    const std::string message = "Formatted message";
    logger_->error(message);

    std::string content = readAll(mainLog_->path());
    EXPECT_NE(content.find("[ERROR] " + message), std::string::npos);
}

// Ротация по размеру: старое содержимое уходит в <file>.1, число копий ограничено
TEST_F(SyncFileLoggerTest, RotatesBySizeKeepingBackups) {
    sky::RotationConfig cfg;
    cfg.enabled = true;
    cfg.type = sky::RotationType::SIZE;
    cfg.maxFileSizeBytes = 200;
    cfg.maxBackups = 2;
    logger_->setRotationConfig(cfg);

    for (int i = 0; i < 40; ++i) {
        logger_->info("rotation line number " + std::to_string(i));
    }

    EXPECT_TRUE(fs::exists(mainLog_->path() + ".1"));
    EXPECT_TRUE(fs::exists(mainLog_->path() + ".2"));
    EXPECT_FALSE(fs::exists(mainLog_->path() + ".3"));
    EXPECT_LE(fs::file_size(mainLog_->path()), 200u);
    EXPECT_NE(readAll(mainLog_->path()).find("rotation line number 39"), std::string::npos);
}

TEST_F(SyncFileLoggerTest, HandlesEmptyMessage) {
    EXPECT_NO_THROW(logger_->info(""));
}
