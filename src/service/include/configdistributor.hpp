/**
 * @file configdistributor.hpp
 * @brief Воркер распространения версионных конфигураций
 *
 * @details
 * Каждый шаг:
 *  1. перечисление версионных файлов на удалённом источнике;
 *  2. если максимальная удалённая версия больше версии текущей
 *     конфигурации (цели псевдонима): скачивание в `<каталог>/.incoming/`
 *     и проверка `<файл>.sha256` (если предложен);
 *  3. проверка кандидата (VersionedConfigFolder::validateFile);
 *  4. только при успешной проверке: атомарное принятие (adopt), удаление
 *     устаревших версий и уведомление ConfigChangeCallback. Отвергнутый
 *     кандидат удаляется, текущая конфигурация не меняется.
 *
 * Отвергнутый кандидат запоминается (имя, SHA-256, содержимое `.sha256`) и
 * повторно не проверяется, пока на источнике не появится исправленный файл.
 *
 * Ошибки распространения (DistributionError) журналируются и не переводят
 * воркер в Failure.
 *
 * Ключи секции: `url` (обязателен), `update_every` (секунды, обязателен),
 * `timeout` (секунды, по умолчанию 10).
 *
 * @ingroup Distribution
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../include/remotesource.hpp"
#include "../include/versionedconfig.hpp"
#include "../include/worker.hpp"

/**
 * @interface ConfigChangeCallback
 * @brief Получатель уведомлений о принятии новой конфигурации
 */
class ConfigChangeCallback {
 public:
  virtual ~ConfigChangeCallback() = default;
  virtual void onConfigAdopted(const std::string &workerName,
                               const std::string &adoptedFile) = 0;
};

class ConfigDistributor : public Worker {
 public:
  static constexpr const char *kKey = "ConfigDistributor";

  struct Settings {
    std::string url;
    double updateEvery = 0;
    std::chrono::seconds timeout{10};
  };

  ConfigDistributor(const std::string &name, const WorkerContext &context);
  ~ConfigDistributor() override;

  static std::optional<std::string> checkConfig(ConfigSource &source);
  std::optional<std::string> deployTest() override;

  /**
   * @brief Один проход распространения
   * @return Имя принятого файла или nullopt, если принимать нечего
   * @throw DistributionError Источник недоступен или кандидат отвергнут
   */
  std::optional<std::string> distribute(RemoteSource &remote);

  /// @throw ConfigurationError Неверная секция
  static Settings parseSettings(const nlohmann::json &section);

 protected:
  void step() override;

 private:
  std::unique_ptr<RemoteSource> makeRemote(const Settings &settings) const;
  /// Содержимое `<кандидат>.sha256`, если источник его предлагает
  static std::optional<std::string> fetchDigestFile(
      RemoteSource &remote, const std::vector<std::string> &remoteNames,
      const std::filesystem::path &candidate);
  /// @throw DistributionError Несовпадение контрольной суммы или неверный документ
  void verifyCandidate(const std::filesystem::path &candidate,
                       const std::string &digest,
                       const std::optional<std::string> &digestFile);
  void notifyAdopted(const std::string &adopted);

  VersionedConfigFolder folder_;
  std::string rejected_;
};
