/**
 * @file templateprocessor.hpp
 * @brief Подстановка переменных окружения и глобальных значений в JSON
 *
 * @details
 * Обходит все строковые узлы документа и заменяет:
 *  - `$ENV{VAR}` на значение переменной окружения VAR
 *  - `{{ name }}` на значение name из таблицы глобальных значений
 *    (файл globals.json в каталоге конфигурации)
 *
 * @warning Неизвестные переменные оставляются без изменений
 */

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @class TemplateProcessor
 * @ingroup Configuration
 */
class TemplateProcessor {
 public:
  TemplateProcessor() = default;
  explicit TemplateProcessor(std::map<std::string, std::string> globals);

  /**
   * @brief Загрузить глобальные значения из JSON-объекта строк/чисел
   * @throw ConfigurationError Если файл повреждён или корень не объект
   * @note Отсутствующий файл не является ошибкой
   */
  static TemplateProcessor fromGlobalsFile(const std::filesystem::path &path);

  /**
     * @brief Выполняет подстановку во всём документе
     *
     * @code
     nlohmann::json cfg = R"({"CommandExecutor": {"url": "{{ server }}/$ENV{STATION}"}})"_json;
     TemplateProcessor tp({{"server", "https://example.org"}});
     tp.process(cfg);
     @endcode
     */
  void process(nlohmann::json &config) const;

  void resolveEnvironment(std::string &value) const;
  void resolveGlobals(std::string &value) const;

  const std::map<std::string, std::string> &globals() const noexcept {
    return globals_;
  }

 private:
  void walkJson(nlohmann::json &node,
                const std::function<void(std::string &)> &func) const;

  std::map<std::string, std::string> globals_;
};
