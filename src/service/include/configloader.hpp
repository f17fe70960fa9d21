/**
 * @file configloader.hpp
 * @brief Чтение документов конфигурации (TOML, JSON) с диска
 *
 * @details
 * Низкоуровневый загрузчик, общий для StaticConfigSource,
 * DynamicConfigSource и проверки версионных файлов ConfigDistributor.
 * Формат определяется расширением файла (для символической ссылки:
 * расширением цели): `.toml` разбирается toml++, остальное как JSON.
 * TOML-таблицы преобразуются в nlohmann::json; дата и время становятся
 * строками. Ошибки открытия файла и синтаксиса преобразуются в
 * ConfigurationError с человекочитаемым сообщением.
 *
 * @see ConfigSource, TemplateProcessor
 */

#pragma once
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @defgroup Configuration Компоненты управления конфигурацией
 */

/**
 * @class ConfigLoader
 * @brief Загрузчик конфигураций из TOML- и JSON-файлов
 * @ingroup Configuration
 *
 * @note Не хранит состояния, безопасен для одновременного использования
 */
class ConfigLoader {
 public:
  enum class Format { Json, Toml };

  /// Формат по расширению файла (ссылка разыменовывается)
  static Format formatOf(const std::filesystem::path &filename);

  /**
     * @brief Загружает и разбирает файл конфигурации
     *
     * @param[in] filename Путь к файлу (допускается символическая ссылка)
     * @return nlohmann::json Документ верхнего уровня
     *
     * @throw ConfigurationError Если файл не открывается, не является
     *        корректным JSON или корнем документа не является объект
     *
     * @code
     ConfigLoader loader;
     auto doc = loader.loadFromFile("/opt/skystation/skystation_config.toml");
     double period = doc["main"]["period"];
     @endcode
     */
  nlohmann::json loadFromFile(const std::filesystem::path &filename) const;

  /**
   * @brief Разбор документа из строки
   * @param[in] text Текст документа
   * @param[in] origin Имя источника для сообщений об ошибках
   * @param[in] format Формат текста
   * @throw ConfigurationError При синтаксической ошибке или не-объекте в корне
   */
  nlohmann::json parse(const std::string &text,
                       const std::string &origin = "<memory>",
                       Format format = Format::Json) const;

  /**
   * @brief Чтение файла целиком
   * @throw ConfigurationError Если файл недоступен
   */
  static std::string readFileContents(const std::filesystem::path &filename);
};
