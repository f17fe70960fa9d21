/**
 * @file versionedconfig.hpp
 * @brief Версионные файлы конфигурации и их атомарное принятие
 *
 * @details
 * Имя версионного файла: `<prefix>_<текст>_<версия>.toml` (или `.json`), ровно три
 * сегмента через `_` после удаления расширения, версия: неотрицательное
 * целое. Текущая конфигурация: файл, на который указывает ссылка-псевдоним
 * (ConfigLayout::aliasName).
 *
 * Принятие (adopt) выполняется под NamedLock "configuration":
 *  1. временная символическая ссылка на новый файл;
 *  2. rename() временной ссылки поверх псевдонима (атомарно в POSIX);
 *  3. удаление всех прочих версионных файлов каталога.
 *
 * @ingroup Distribution
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "../include/templateprocessor.hpp"
#include "../include/workercontext.hpp"

class WorkerRegistry;

class VersionedConfigFolder {
 public:
  using Version = std::uint64_t;

  explicit VersionedConfigFolder(ConfigLayout layout);

  /// Версия из имени файла или nullopt, если имя не версионное
  std::optional<Version> version(const std::string &filename) const;

  bool isValidName(const std::string &filename) const {
    return version(filename).has_value();
  }

  /**
   * @brief Имя с максимальной версией
   * @details При равных версиях выбирается лексикографически большее имя,
   *          чтобы выбор не зависел от порядка перечисления.
   */
  std::optional<std::string> best(const std::vector<std::string> &names) const;

  /// Версионные файлы каталога конфигурации (без псевдонима), по имени
  std::vector<std::string> listLocal() const;

  /// Имя файла, на который указывает псевдоним
  std::optional<std::string> current() const;

  /**
   * @brief Атомарно сделать file текущей конфигурацией
   * @param file Проверенный кандидат (в каталоге конфигурации или в .incoming/)
   * @return Удалённые устаревшие версии
   * @throw std::filesystem::filesystem_error Ошибка файловой системы
   */
  std::vector<std::string> adopt(const std::filesystem::path &file);

  /**
   * @brief Проверка документа-кандидата
   * @return Текст первой найденной ошибки или nullopt
   */
  static std::optional<std::string> validateDocument(
      const nlohmann::json &document, const WorkerRegistry &registry);

  /// Разбор файла + validateDocument()
  std::optional<std::string> validateFile(const std::filesystem::path &file,
                                          const WorkerRegistry &registry) const;

  const ConfigLayout &layout() const noexcept { return layout_; }
  std::filesystem::path incomingFolder() const {
    return layout_.folder / ".incoming";
  }

 private:
  ConfigLayout layout_;
};
