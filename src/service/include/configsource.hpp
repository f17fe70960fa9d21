/**
 * @file configsource.hpp
 * @brief Источники декларативной конфигурации агента
 *
 * @details
 * Документ конфигурации: JSON-объект двух уровней: ключ `main` и ключи
 * воркеров, значения: объекты с параметрами воркера.
 *
 * Варианты:
 *  - StaticConfigSource: однократный разбор файла при создании
 *  - DynamicConfigSource: повторное чтение при изменении mtime, под
 *    именованной блокировкой "configuration"
 *  - InMemoryConfigSource: обёртка над готовым документом
 *
 * Все методы возвращают глубокие копии; вызывающий код может изменять
 * результат без влияния на источник.
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "../include/templateprocessor.hpp"

/**
 * @class ConfigSource
 * @brief Абстрактный источник конфигурации
 * @ingroup Configuration
 */
class ConfigSource {
 public:
  using Marker = std::filesystem::file_time_type;

  virtual ~ConfigSource() = default;

  /**
   * @brief Полный документ конфигурации (копия)
   * @throw ConfigurationError Если документ не удаётся прочитать
   */
  virtual nlohmann::json getGlobal() = 0;

  /**
   * @brief Секция конфигурации воркера
   *
   * @details Сначала ищется точное совпадение ключа верхнего уровня, затем
   * ключ, оканчивающийся на name (`station.CommandExecutor` для
   * `CommandExecutor`). При нескольких совпадениях по суффиксу выбирается
   * первый в лексикографическом порядке.
   *
   * @throw ConfigKeyNotFound Если подходящего ключа нет
   */
  nlohmann::json get(const std::string &name);

  /**
   * @brief Маркер изменения (для файловых источников: текущий mtime)
   * @return nullopt для источников, которые никогда не меняются
   *
   * @details Воркер запоминает маркер перед сном и сравнивает его с новым
   * значением через changedSince(), не разбирая документ заново.
   */
  virtual std::optional<Marker> lastModified() { return std::nullopt; }

  /**
   * @brief Изменился ли документ с момента, когда был получен marker
   */
  bool changedSince(const std::optional<Marker> &marker);

  /// Поиск секции в уже полученном документе (см. get())
  static nlohmann::json findSection(const nlohmann::json &global,
                                    const std::string &name);
};

/**
 * @class StaticConfigSource
 * @brief Разбирает файл один раз при создании и больше его не читает
 */
class StaticConfigSource : public ConfigSource {
 public:
  /**
   * @param path Путь к файлу конфигурации
   * @param templates Подстановки `$ENV{}` и `{{ }}`
   * @throw ConfigurationError При ошибке чтения или разбора
   */
  explicit StaticConfigSource(const std::filesystem::path &path,
                              TemplateProcessor templates = TemplateProcessor());

  nlohmann::json getGlobal() override;

 private:
  nlohmann::json document_;
};

/**
 * @class DynamicConfigSource
 * @brief Перечитывает файл, только если изменился его mtime
 *
 * @details Проверка mtime и чтение выполняются под
 * NamedLock::get("configuration"), которую ConfigDistributor держит во время
 * подмены ссылки на текущий файл. Путь может быть символической ссылкой;
 * отслеживается mtime файла, на который она указывает.
 */
class DynamicConfigSource : public ConfigSource {
 public:
  explicit DynamicConfigSource(std::filesystem::path path,
                               TemplateProcessor templates = TemplateProcessor());

  nlohmann::json getGlobal() override;

  std::optional<Marker> lastModified() override;

  const std::filesystem::path &path() const noexcept { return path_; }

 private:
  // Вызывается под NamedLock; возвращает актуальный документ
  const nlohmann::json &refreshLocked();

  std::filesystem::path path_;
  TemplateProcessor templates_;

  std::mutex cacheMutex_;
  std::optional<Marker> observed_;
  nlohmann::json cached_;
};

/**
 * @class InMemoryConfigSource
 * @brief Документ в памяти (тесты, проверка кандидатов ConfigDistributor)
 */
class InMemoryConfigSource : public ConfigSource {
 public:
  explicit InMemoryConfigSource(nlohmann::json document);

  nlohmann::json getGlobal() override;

  /// Заменить документ; маркер изменения сдвигается вперёд
  void update(nlohmann::json document);

  std::optional<Marker> lastModified() override;

 private:
  std::mutex mutex_;
  nlohmann::json document_;
  Marker marker_;
};
