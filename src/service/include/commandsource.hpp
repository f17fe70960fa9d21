/**
 * @file commandsource.hpp
 * @brief Команды оператора и источники запросов на их выполнение
 *
 * @details Источники:
 *  - LocalCommandFileSource: локальный файл-«почтовый ящик»
 *    (содержимое: одна команда, файл очищается после чтения);
 *  - RemoteCommandFileSource: удалённый каталог с единственным
 *    `command_*.txt`, повторное имя отбрасывается по файлу-маркеру;
 *  - ChannelCommandSource: сетевой канал с проверкой токена.
 *
 * @ingroup Commands
 */

#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "../include/remotesource.hpp"

enum class CommandState { Pending, Running, Done };

std::string toString(CommandState state);

/// Входящий запрос: `{command_id, command_text, auth_token}`
struct CommandRequest {
  std::string id;
  std::string text;
  std::string authToken;

  static CommandRequest fromJson(const nlohmann::json &json);
};

/// Исходящий результат: `{command_id, command_text, exit_code, stdout, stderr}`
struct CommandResult {
  std::string id;
  std::string text;
  int exitCode = -1;
  std::string stdoutText;
  std::string stderrText;

  nlohmann::json toJson() const;
};

/// Команда в процессе жизни: Pending -> Running -> Done
struct Command {
  std::string id;
  std::string text;
  CommandState state = CommandState::Pending;
  std::optional<int> exitCode;
  std::string stdoutText;
  std::string stderrText;
};

/**
 * @interface CommandSource
 */
class CommandSource {
 public:
  virtual ~CommandSource() = default;

  /// Не более одного нового запроса за вызов
  virtual std::optional<CommandRequest> poll() = 0;

  /// Доставка результата запроса, полученного из этого источника
  virtual void report(const CommandResult &) {}

  virtual std::string describe() const = 0;
};

class LocalCommandFileSource : public CommandSource {
 public:
  explicit LocalCommandFileSource(std::filesystem::path file);

  std::optional<CommandRequest> poll() override;
  std::string describe() const override { return file_.string(); }

 private:
  std::filesystem::path file_;
};

class RemoteCommandFileSource : public CommandSource {
 public:
  /**
   * @param remote Удалённый каталог
   * @param commandFolder Каталог загрузки и файла-маркера previous.txt
   */
  RemoteCommandFileSource(std::unique_ptr<RemoteSource> remote,
                          std::filesystem::path commandFolder);

  /// @throw DistributionError Больше одного command_*.txt или ошибка передачи
  std::optional<CommandRequest> poll() override;
  std::string describe() const override { return remote_->describe(); }

  static bool isCommandFile(const std::string &name);

 private:
  std::unique_ptr<RemoteSource> remote_;
  std::filesystem::path commandFolder_;
};

/**
 * @interface CommandChannel
 * @brief Транспорт сетевых команд (кодек вне этого модуля)
 */
class CommandChannel {
 public:
  virtual ~CommandChannel() = default;
  virtual std::optional<CommandRequest> poll() = 0;
  virtual void report(const CommandResult &result) = 0;
};

class ChannelCommandSource : public CommandSource {
 public:
  ChannelCommandSource(std::unique_ptr<CommandChannel> channel,
                       std::string token, std::filesystem::path markerFile);

  /// @throw AuthenticationError Токен запроса не совпадает
  std::optional<CommandRequest> poll() override;
  void report(const CommandResult &result) override;
  std::string describe() const override { return "network channel"; }

 private:
  std::unique_ptr<CommandChannel> channel_;
  std::string token_;
  std::filesystem::path markerFile_;
  std::optional<std::string> lastText_;
};

/// Содержимое файла-маркера (последний принятый запрос) или nullopt
std::optional<std::string> readMarker(const std::filesystem::path &file);
void writeMarker(const std::filesystem::path &file, const std::string &value);
