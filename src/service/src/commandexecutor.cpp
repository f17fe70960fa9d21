#include "../include/commandexecutor.hpp"

#include <cmath>
#include <vector>

#include "../include/configsource.hpp"
#include "../include/errors.hpp"
#include "../include/processrunner.hpp"
#include "sky/MetricsCollector.hpp"
#include "sky/compositelogger.hpp"

namespace fs = std::filesystem;

namespace {

std::string outputText(const CommandResult &result) {
  return "output of last command:\nstdout:\n" + result.stdoutText +
         "\nstderr:\n" + result.stderrText;
}

const char *toString(CommandExecutor::SourceKind kind) {
  switch (kind) {
    case CommandExecutor::SourceKind::Remote:
      return "remote";
    case CommandExecutor::SourceKind::Network:
      return "network";
    case CommandExecutor::SourceKind::Local:
      return "local";
  }
  return "unknown";
}

std::string optionalString(const nlohmann::json &section, const char *key) {
  if (!section.contains(key)) return {};
  if (!section[key].is_string()) {
    throw ConfigurationError(std::string("'") + key + "' must be a string");
  }
  return section[key].get<std::string>();
}

}  // namespace

void LoggingCommandCallback::onCommandResult(const std::string &workerName,
                                             const CommandResult &result) {
  auto &logger = sky::CompositeLogger::instance();
  logger.info(workerName + ": command " + result.id + " exited with code " +
              std::to_string(result.exitCode));
  if (!result.stdoutText.empty()) {
    logger.debug(workerName + ": stdout:\n" + result.stdoutText);
  }
  if (!result.stderrText.empty()) {
    logger.debug(workerName + ": stderr:\n" + result.stderrText);
  }
}

std::string CommandExecutor::Settings::sourceSignature() const {
  return std::string(toString(source)) + "|" + commandFile.string() + "|" +
         url + "|" + commandFolder.string() + "|" + token;
}

CommandExecutor::CommandExecutor(const std::string &name,
                                 const WorkerContext &context)
    : Worker(name, context, {"commands"}) {
  sky::MetricsCollector::instance().ensureCounter("commands_executed",
                                                  "Operator commands executed");
  status()->setMisc("current command", "no command running");
  status()->setMisc("previous command output", "no previous command");
}

CommandExecutor::~CommandExecutor() { stop(); }

CommandExecutor::Settings CommandExecutor::parseSettings(
    const nlohmann::json &section, const ConfigLayout &layout) {
  if (!section.is_object()) {
    throw ConfigurationError(std::string(kKey) + " section is not an object");
  }
  Settings settings;

  if (!section.contains("update_every") || !section["update_every"].is_number()) {
    throw ConfigurationError("'update_every' is missing or not a number");
  }
  settings.updateEvery = section["update_every"].get<double>();
  if (settings.updateEvery <= 0) {
    throw ConfigurationError("'update_every' must be positive");
  }

  settings.url = optionalString(section, "url");
  settings.token = optionalString(section, "token");

  const std::string file = optionalString(section, "command_file");
  settings.commandFile = file.empty() ? layout.folder / "command.sh" : fs::path(file);
  const std::string folder = optionalString(section, "command_folder");
  settings.commandFolder = folder.empty() ? layout.folder / "command" : fs::path(folder);

  std::string source = optionalString(section, "source");
  if (source.empty()) source = settings.url.empty() ? "local" : "remote";

  if (source == "remote") {
    settings.source = SourceKind::Remote;
    if (settings.url.empty()) {
      throw ConfigurationError("'url' is required for the remote command source");
    }
  } else if (source == "network") {
    settings.source = SourceKind::Network;
    if (settings.token.empty()) {
      throw ConfigurationError("'token' is required for the network command source");
    }
  } else if (source == "local") {
    settings.source = SourceKind::Local;
  } else {
    throw ConfigurationError("unknown command source '" + source + "'");
  }

  if (section.contains("timeout")) {
    if (!section["timeout"].is_number() || section["timeout"].get<double>() < 0) {
      throw ConfigurationError("'timeout' must be a non-negative number");
    }
    settings.timeout = section["timeout"].get<double>();
  }
  return settings;
}

std::optional<std::string> CommandExecutor::checkConfig(ConfigSource &source) {
  try {
    parseSettings(source.get(kKey), ConfigLayout());
  } catch (const std::exception &e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

std::optional<std::string> CommandExecutor::deployTest() {
  try {
    const auto settings = parseSettings(config().get(kKey), context().layout);
    fs::create_directories(settings.commandFolder);
    rebuildSources(settings);
    if (settings.source == SourceKind::Remote) {
      // Проверка доступности удалённого каталога без приёма команды
      auto remote = context().remoteSourceFactory
                        ? context().remoteSourceFactory(settings.url, std::chrono::seconds(10))
                        : makeRemoteSource(settings.url, std::chrono::seconds(10));
      remote->listFiles();
    }
    const auto result =
        runProcess(shellCommand("echo deploy test", std::chrono::seconds(5)));
    if (result.exitCode != 0 || result.stdoutText != "deploy test\n") {
      return "shell test command failed with exit code " +
             std::to_string(result.exitCode);
    }
  } catch (const std::exception &e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

void CommandExecutor::rebuildSources(const Settings &settings) {
  const auto signature = settings.sourceSignature();
  if (primary_ && signature == signature_) return;

  primary_.reset();
  fallback_.reset();

  switch (settings.source) {
    case SourceKind::Local:
      primary_ = std::make_unique<LocalCommandFileSource>(settings.commandFile);
      break;
    case SourceKind::Remote: {
      const std::chrono::seconds timeout(10);
      auto remote = context().remoteSourceFactory
                        ? context().remoteSourceFactory(settings.url, timeout)
                        : makeRemoteSource(settings.url, timeout);
      primary_ = std::make_unique<RemoteCommandFileSource>(
          std::move(remote), settings.commandFolder);
      break;
    }
    case SourceKind::Network: {
      if (!context().channelFactory) {
        throw ConfigurationError(
            "network command source requested but no channel is available");
      }
      auto channel = context().channelFactory(config().get(kKey));
      if (!channel) {
        throw ConfigurationError("command channel could not be created");
      }
      primary_ = std::make_unique<ChannelCommandSource>(
          std::move(channel), settings.token,
          settings.commandFolder / "previous.txt");
      break;
    }
  }
  if (settings.source != SourceKind::Local) {
    fallback_ = std::make_unique<LocalCommandFileSource>(settings.commandFile);
  }

  signature_ = signature;
  sky::CompositeLogger::instance().info(
      name() + ": command source " + toString(settings.source) + " (" +
      primary_->describe() + ")");
}

std::optional<CommandRequest> CommandExecutor::pollSources() {
  if (auto request = primary_->poll()) {
    origin_ = primary_.get();
    return request;
  }
  if (fallback_) {
    if (auto request = fallback_->poll()) {
      origin_ = fallback_.get();
      return request;
    }
  }
  return std::nullopt;
}

void CommandExecutor::launch(CommandRequest request, CommandSource *origin,
                             const Settings &settings) {
  const auto timeout = std::chrono::milliseconds(
      static_cast<long long>(std::llround(settings.timeout * 1000.0)));

  std::lock_guard lock(runMutex_);
  run_ = std::make_unique<CommandRun>(std::move(request), timeout);
  origin_ = origin;
}

void CommandExecutor::deliver(const CommandResult &result) {
  auto &logger = sky::CompositeLogger::instance();

  std::vector<CommandCallback *> callbacks{&logCallback_};
  for (const auto &callback : context().commandCallbacks) {
    if (callback) callbacks.push_back(callback.get());
  }
  for (auto *callback : callbacks) {
    try {
      callback->onCommandResult(name(), result);
    } catch (const std::exception &e) {
      logger.error(name() + ": command callback failed: " + e.what());
    }
  }

  if (origin_) {
    try {
      origin_->report(result);
    } catch (const std::exception &e) {
      logger.error(name() + ": cannot report command result: " + e.what());
    }
  }

  sky::MetricsCollector::instance().incrementCounter("commands_executed");
  status()->setMisc("previous command output", outputText(result));
}

void CommandExecutor::step() {
  const auto settings = parseSettings(config().get(kKey), context().layout);

  std::optional<CommandResult> finished;
  {
    std::lock_guard lock(runMutex_);
    if (run_) {
      finished = run_->result();
      if (finished) {
        run_.reset();
      } else {
        status()->setMisc("current command",
                          "running for " +
                              std::to_string(static_cast<long long>(run_->runningFor())) +
                              " seconds\n" + run_->request().text);
      }
    }
  }

  if (finished) {
    deliver(*finished);
    origin_ = nullptr;
  }

  if (!commandInFlight()) {
    // Источники пересоздаются только без выполняющейся команды:
    // origin_ должен дожить до доставки результата
    rebuildSources(settings);
    if (auto request = pollSources()) {
      const std::string text = request->text;
      launch(std::move(*request), origin_, settings);
      status()->setMisc("current command", "running for 0 seconds\n" + text);
    } else {
      status()->setMisc("current command", "no command running");
    }
  }

  sleepSeconds(settings.updateEvery, true);
}

void CommandExecutor::onExit() {
  std::unique_ptr<CommandRun> run;
  {
    std::lock_guard lock(runMutex_);
    run = std::move(run_);
  }
  if (run) {
    sky::CompositeLogger::instance().warning(
        name() + ": cancelling command " + run->request().id);
    run->cancel();
  }
}

bool CommandExecutor::commandInFlight() const {
  std::lock_guard lock(runMutex_);
  return run_ != nullptr;
}
