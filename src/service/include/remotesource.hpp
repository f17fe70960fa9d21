/**
 * @file remotesource.hpp
 * @brief Удалённые каталоги файлов (конфигурации, команды)
 *
 * @details Реализации:
 *  - DirectoryRemoteSource: `file://` или путь (смонтированный ресурс);
 *  - CurlRemoteSource: `http(s)://` (индексная страница) и `ftp://`.
 *
 * @ingroup Distribution
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

/**
 * @interface RemoteSource
 * @brief Плоский удалённый каталог: перечисление и скачивание файлов
 */
class RemoteSource {
 public:
  virtual ~RemoteSource() = default;

  /**
   * @brief Имена файлов каталога (без путей), отсортированные
   * @throw DistributionError Каталог недоступен
   */
  virtual std::vector<std::string> listFiles() = 0;

  /**
   * @brief Скачать файл name в destination (перезаписывая)
   * @throw DistributionError Ошибка передачи; частичный файл удаляется
   */
  virtual void download(const std::string &name,
                        const std::filesystem::path &destination) = 0;

  /// Адрес источника для журналов
  virtual std::string describe() const = 0;
};

/**
 * @class DirectoryRemoteSource
 * @brief Локальный каталог в роли удалённого источника
 */
class DirectoryRemoteSource : public RemoteSource {
 public:
  explicit DirectoryRemoteSource(std::filesystem::path directory);

  std::vector<std::string> listFiles() override;
  void download(const std::string &name,
                const std::filesystem::path &destination) override;
  std::string describe() const override { return directory_.string(); }

 private:
  std::filesystem::path directory_;
};

/**
 * @brief Создание источника по схеме URL
 *
 * @code
 auto remote = makeRemoteSource("https://example.org/station42/", std::chrono::seconds(10));
 for (const auto &name : remote->listFiles()) { ... }
 @endcode
 *
 * @throw ConfigurationError Неподдерживаемая схема
 */
std::unique_ptr<RemoteSource> makeRemoteSource(const std::string &url,
                                               std::chrono::seconds timeout);
