/**
 * @file service_controller.cpp
 * @brief Реализация ServiceController
 *
 * @details
 *  - run(): разбор аргументов, загрузка конфигурации, запуск Supervisor
 *  - initLogger(): конфигурация логирования
 *  - initSignals(): SIGTERM/SIGINT/SIGHUP через sky::SignalRouter
 */

#include "../include/service_controller.hpp"

#include <signal.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "../include/builtinworkers.hpp"
#include "../include/configsource.hpp"
#include "../include/deploytest.hpp"
#include "../include/errors.hpp"
#include "../include/namedlock.hpp"
#include "../include/statusregistry.hpp"
#include "../include/templateprocessor.hpp"
#include "../include/version.hpp"
#include "sky/SignalRouter.hpp"
#include "sky/compositelogger.hpp"
#include "sky/consolelogger.hpp"
#include "sky/syncfilelogger.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kLocalLogMaxBytes = 1024 * 1024;

void logStatusChange(const StatusSnapshot &event) {
  auto &logger = sky::CompositeLogger::instance();
  std::string message = "status of " + event.name + ": ";
  if (event.previousState) message += toString(*event.previousState) + " -> ";
  message += toString(event.state);

  if (event.state == WorkerState::Failure) {
    logger.warning(message + " (" + toString(event.failureKind) +
                   (event.error ? ": " + *event.error : std::string()) + ")");
  } else {
    logger.debug(message);
  }
}

}  // namespace

ServiceController::ServiceController() {
  registerBuiltinWorkers(registry_);
  statusCallbacks_.push_back(
      std::make_shared<FunctionStatusCallback>(logStatusChange));
}

void ServiceController::addStatusCallback(
    std::shared_ptr<StatusChangeCallback> callback) {
  statusCallbacks_.push_back(std::move(callback));
}

void ServiceController::addCommandCallback(
    std::shared_ptr<CommandCallback> callback) {
  context_.commandCallbacks.push_back(std::move(callback));
}

void ServiceController::addStatusReportCallback(
    std::shared_ptr<StatusReportCallback> callback) {
  context_.statusReportCallbacks.push_back(std::move(callback));
}

void ServiceController::addConfigChangeCallback(
    std::shared_ptr<ConfigChangeCallback> callback) {
  context_.configChangeCallbacks.push_back(std::move(callback));
}

void ServiceController::setCommandChannelFactory(CommandChannelFactory factory) {
  context_.channelFactory = std::move(factory);
}

int ServiceController::run(int argc, char **argv) {
  auto &logger = sky::CompositeLogger::instance();

  ParsedArgs args;
  try {
    ArgumentParser parser;
    args = parser.parse(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\n\n";
    printHelp();
    return EXIT_FAILURE;
  }

  if (args.help_message) {
    printHelp();
    return EXIT_SUCCESS;
  }
  if (args.version_message) {
    printVersion();
    return EXIT_SUCCESS;
  }

  // До настройки по конфигурации ошибки пишутся в консоль
  if (logger.loggerCount() == 0) {
    logger.addLogger(sky::nonOwning(sky::ConsoleLogger::instance()));
  }

  try {
    layout_.folder = args.config_dir;
    if (!fs::is_directory(layout_.folder)) {
      throw ConfigurationError("configuration folder " + layout_.folder.string() +
                               " not found");
    }
    if (!fs::exists(layout_.aliasPath())) {
      throw ConfigurationError("configuration file " +
                               layout_.aliasPath().string() + " not found");
    }

    NamedLock::setLockDirectory(layout_.folder);
    auto source = std::make_shared<DynamicConfigSource>(
        layout_.aliasPath(),
        TemplateProcessor::fromGlobalsFile(layout_.globalsPath()));

    const auto main = source->get(WorkerRegistry::kMainKey);
    initLogger(args, main);
    logger.info("skystation agent " + std::string(kAgentVersion) +
                " starting with configuration " + layout_.aliasPath().string());

    context_.configSource = source;
    context_.statusRegistry = std::make_shared<StatusRegistry>(statusCallbacks_);
    context_.workerRegistry = &registry_;
    context_.layout = layout_;

    if (args.deploy_test) {
      return runDeployTests(*source, context_);
    }

    initSignals();

    {
      auto supervisor = std::make_unique<Supervisor>(context_, registry_);
      std::lock_guard lock(mtx_);
      supervisor_ = std::move(supervisor);
      if (shutdown_requested_) supervisor_->requestStop();
    }

    supervisor_->run();

    const bool clean = supervisor_->shutdown();
    sky::SignalRouter::instance().stop();

    if (!clean) {
      logger.critical("Service controller: forcing exit, workers still running");
      logger.flush();
      std::_Exit(EXIT_FAILURE);
    }

    logger.info("Service controller: shutdown complete");
    logger.flush();
    return EXIT_SUCCESS;
  } catch (const std::exception &e) {
    logger.critical(e.what());
    sky::SignalRouter::instance().stop();
    logger.flush();
    return EXIT_FAILURE;
  }
}

void ServiceController::initLogger(const ParsedArgs &args,
                                   const nlohmann::json &main) {
  auto &composite_logger = sky::CompositeLogger::instance();
  composite_logger.clearLoggers();

  const std::string localLogFile =
      main.contains("local_log_file") && main["local_log_file"].is_string()
          ? main["local_log_file"].get<std::string>()
          : std::string();

  auto addSyncFile = [&](const std::string &file, const std::string &level,
                         bool rotated) {
    auto &logger = sky::SyncFileLogger::instance();
    logger.setMainLogPath(file);
    if (rotated) {
      sky::RotationConfig rotation;
      rotation.enabled = true;
      rotation.type = sky::RotationType::SIZE;
      rotation.maxFileSizeBytes = kLocalLogMaxBytes;
      rotation.maxBackups = 3;
      logger.setRotationConfig(rotation);
    }
    if (!level.empty()) logger.setLogLevel(sky::stringToLogLevel(level));
    composite_logger.addLogger(sky::nonOwning(logger));
  };

  if (args.use_cli_logging && !args.logger_types.empty()) {
    for (const auto &type : args.logger_types) {
      if (type == "console") {
        composite_logger.addLogger(sky::nonOwning(sky::ConsoleLogger::instance()));
      } else if (type == "sync_file") {
        addSyncFile(localLogFile.empty()
                        ? (layout_.folder / "skystation.log").string()
                        : localLogFile,
                    "", !localLogFile.empty());
      }
    }
  } else if (main.contains("logging") && main["logging"].is_array()) {
    for (auto &entry : main["logging"]) {
      std::string type = entry.value("type", "console");
      std::string level = entry.value("level", "info");
      std::string file = entry.value("file", "skystation.log");

      if (type == "console") {
        auto &logger = sky::ConsoleLogger::instance();
        logger.setLogLevel(sky::stringToLogLevel(level));
        composite_logger.addLogger(sky::nonOwning(logger));
      } else if (type == "sync_file") {
        addSyncFile(file, level, entry.value("rotated", false));
      } else {
        throw ConfigurationError("unknown logger type '" + type + "'");
      }
    }
  } else {
    composite_logger.addLogger(sky::nonOwning(sky::ConsoleLogger::instance()));
    if (!localLogFile.empty()) {
      addSyncFile(localLogFile, "", true);
    }
  }

  if (args.log_level.has_value()) {
    composite_logger.setLogLevel(sky::stringToLogLevel(args.log_level.value()));
  } else if (main.contains("log_level") && main["log_level"].is_string()) {
    composite_logger.setLogLevel(
        sky::stringToLogLevel(main["log_level"].get<std::string>()));
  }
}

void ServiceController::initSignals() {
  auto &router = sky::SignalRouter::instance();
  sky::CompositeLogger::instance().debug(
      "Service controller: Registering signal handlers ...");

  router.registerHandler(SIGTERM, [this](int signum) { handleShutdown(signum); });
  router.registerHandler(SIGINT, [this](int signum) { handleShutdown(signum); });
  router.registerHandler(SIGHUP, [this](int) { handleWake(); });

  router.start();
  sky::CompositeLogger::instance().info("SignalRouter started successfully");
}

void ServiceController::handleShutdown(int signum) {
  sky::CompositeLogger::instance().info("Signal " + std::to_string(signum) +
                                        " received, shutting down");
  std::lock_guard lock(mtx_);
  shutdown_requested_ = true;
  if (supervisor_) supervisor_->requestStop();
}

void ServiceController::handleWake() {
  sky::CompositeLogger::instance().info(
      "SIGHUP received, running reconciliation now");
  std::lock_guard lock(mtx_);
  if (supervisor_) supervisor_->wake();
}

int ServiceController::runDeployTests(ConfigSource &source,
                                      const WorkerContext &context) {
  const auto results = deployTests(source, registry_, context);
  for (const auto &[key, error] : results) {
    if (error) {
      std::cout << "[failed] " << key << ": " << *error << "\n";
    } else {
      std::cout << "[ok] " << key << "\n";
    }
  }
  const bool passed = deployTestsPassed(results);
  std::cout << (passed ? "deploy test passed" : "deploy test failed") << std::endl;
  return passed ? EXIT_SUCCESS : EXIT_FAILURE;
}

void ServiceController::printHelp() {
  std::cout << "skystation agent\n\n"
            << "Usage:\n"
            << " skystation-agent [options]\n\n"
            << "Options:\n"
            << " --help, -h          Show this help message\n"
            << " --version, -v       Show version info\n"
            << " --config-dir=DIR    Configuration folder (default /opt/skystation)\n"
            << " --log-type=TYPES    Logger types (comma-separated: console,sync_file)\n"
            << " --log-level=LEVEL   Logging level "
               "[debug|info|warning|error|critical]\n"
            << " --deploy-test       Check configuration and worker side effects, then exit\n";
}

void ServiceController::printVersion() {
  std::cout << "skystation agent v" << kAgentVersion << "\n";
}
