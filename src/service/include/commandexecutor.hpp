/**
 * @file commandexecutor.hpp
 * @brief Воркер выполнения команд оператора
 *
 * @details
 * Ключи секции `CommandExecutor`:
 *  - `update_every`: период опроса, секунды (обязателен);
 *  - `source`: `remote` | `network` | `local` (по умолчанию `remote`,
 *    если задан `url`, иначе `local`);
 *  - `command_file`: локальный файл команд (`<каталог>/command.sh`);
 *  - `url`: удалённый каталог с `command_*.txt` (для `remote`);
 *  - `command_folder`: каталог загрузки и маркера (`<каталог>/command`);
 *  - `token`: токен сетевого канала (для `network`);
 *  - `timeout`: ограничение одной команды, секунды (0: нет).
 *
 * Одновременно выполняется не более одной команды; запросы, пришедшие во
 * время выполнения, не принимаются (очереди нет). Результат доставляется
 * обратным вызовам ровно один раз.
 *
 * @ingroup Commands
 */

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../include/commandrun.hpp"
#include "../include/commandsource.hpp"
#include "../include/worker.hpp"

/**
 * @interface CommandCallback
 * @brief Получатель результатов команд
 */
class CommandCallback {
 public:
  virtual ~CommandCallback() = default;
  virtual void onCommandResult(const std::string &workerName,
                               const CommandResult &result) = 0;
};

/// Журналирование результата через CompositeLogger
class LoggingCommandCallback : public CommandCallback {
 public:
  void onCommandResult(const std::string &workerName,
                       const CommandResult &result) override;
};

class CommandExecutor : public Worker {
 public:
  static constexpr const char *kKey = "CommandExecutor";

  enum class SourceKind { Remote, Network, Local };

  struct Settings {
    double updateEvery = 0;
    SourceKind source = SourceKind::Local;
    std::filesystem::path commandFile;
    std::string url;
    std::filesystem::path commandFolder;
    std::string token;
    double timeout = 0;

    /// Поля, определяющие набор источников
    std::string sourceSignature() const;
  };

  CommandExecutor(const std::string &name, const WorkerContext &context);
  ~CommandExecutor() override;

  /// @throw ConfigurationError Неверная секция
  static Settings parseSettings(const nlohmann::json &section,
                                const ConfigLayout &layout);

  static std::optional<std::string> checkConfig(ConfigSource &source);
  std::optional<std::string> deployTest() override;

  bool commandInFlight() const;

 protected:
  void step() override;
  void onExit() override;

 private:
  void rebuildSources(const Settings &settings);
  std::optional<CommandRequest> pollSources();
  void launch(CommandRequest request, CommandSource *origin,
              const Settings &settings);
  void deliver(const CommandResult &result);

  mutable std::mutex runMutex_;
  std::unique_ptr<CommandRun> run_;
  CommandSource *origin_ = nullptr;

  std::string signature_;
  std::unique_ptr<CommandSource> primary_;
  std::unique_ptr<CommandSource> fallback_;
  LoggingCommandCallback logCallback_;
};
