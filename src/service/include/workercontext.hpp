/**
 * @file workercontext.hpp
 * @brief Зависимости, передаваемые каждому воркеру при создании
 *
 * @details Вместо глобальных списков обратных вызовов на уровне классов все
 * внешние приёмники передаются явно и живут столько же, сколько процесс.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class ConfigSource;
class StatusRegistry;
class WorkerRegistry;
class CommandCallback;
class ConfigChangeCallback;
class CommandChannel;
class StatusReportCallback;
class RemoteSource;

/**
 * @struct ConfigLayout
 * @brief Расположение файлов конфигурации на станции
 *
 * @details Версионные файлы: `<prefix>_<произвольный текст>_<версия><расширение>`,
 * где расширение одно из extensions (TOML основной формат, JSON допускается).
 * Текущий файл адресуется стабильной символической ссылкой aliasName.
 */
struct ConfigLayout {
  std::filesystem::path folder = "/opt/skystation";
  std::string prefix = "skystation";
  std::string aliasName = "skystation_config.toml";
  std::vector<std::string> extensions = {".toml", ".json"};
  std::string globalsName = "globals.json";

  std::filesystem::path aliasPath() const { return folder / aliasName; }
  std::filesystem::path globalsPath() const { return folder / globalsName; }
};

using CommandChannelFactory =
    std::function<std::unique_ptr<CommandChannel>(const nlohmann::json &)>;

using RemoteSourceFactoryFn = std::function<std::unique_ptr<RemoteSource>(
    const std::string &url, std::chrono::seconds timeout)>;

struct WorkerContext {
  std::shared_ptr<ConfigSource> configSource;
  std::shared_ptr<StatusRegistry> statusRegistry;
  const WorkerRegistry *workerRegistry = nullptr;  ///< для проверки кандидатов конфигурации
  ConfigLayout layout;

  std::vector<std::shared_ptr<CommandCallback>> commandCallbacks;
  std::vector<std::shared_ptr<StatusReportCallback>> statusReportCallbacks;
  std::vector<std::shared_ptr<ConfigChangeCallback>> configChangeCallbacks;

  /// Создание сетевого канала команд (nullptr: сетевой источник недоступен)
  CommandChannelFactory channelFactory;

  /// Создание удалённого источника по URL (пусто: RemoteSourceFactory по схеме)
  RemoteSourceFactoryFn remoteSourceFactory;
};
