#include "../include/commandrun.hpp"

#include "../include/processrunner.hpp"
#include "sky/MetricsCollector.hpp"
#include "sky/compositelogger.hpp"

CommandRun::CommandRun(CommandRequest request, std::chrono::milliseconds timeout)
    : request_(std::move(request)), started_(std::chrono::steady_clock::now()) {
  thread_ = std::thread(&CommandRun::execute, this, timeout);
}

CommandRun::~CommandRun() {
  if (thread_.joinable()) {
    if (!channel_.finished()) cancel();
    thread_.join();
  }
}

void CommandRun::cancel() { cancel_ = true; }

double CommandRun::runningFor() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       started_)
      .count();
}

Command CommandRun::command() const {
  Command command{request_.id, request_.text, CommandState::Running,
                  std::nullopt, {}, {}};
  if (auto result = channel_.tryResult()) {
    command.state = CommandState::Done;
    command.exitCode = result->exitCode;
    command.stdoutText = result->stdoutText;
    command.stderrText = result->stderrText;
  }
  return command;
}

void CommandRun::execute(std::chrono::milliseconds timeout) {
  auto &logger = sky::CompositeLogger::instance();
  logger.info("Executing command " + request_.id);
  channel_.heartbeat();

  CommandResult result{request_.id, request_.text, -1, {}, {}};
  try {
    auto process = runProcess(shellCommand(request_.text, timeout), &cancel_,
                              [this] { channel_.heartbeat(); });
    result.exitCode = process.exitCode;
    result.stdoutText = std::move(process.stdoutText);
    result.stderrText = std::move(process.stderrText);
    if (process.timedOut) {
      logger.warning("Command " + request_.id + " timed out");
    } else if (process.cancelled) {
      logger.warning("Command " + request_.id + " cancelled");
    }
  } catch (const std::exception &e) {
    logger.error("Command " + request_.id + " could not be started: " + e.what());
    channel_.setError(e.what());
    result.stderrText = e.what();
  }

  logger.info("Command " + request_.id + " finished with exit code " +
              std::to_string(result.exitCode));
  sky::MetricsCollector::instance().recordTaskTime(
      "command_run", std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - started_));
  channel_.setResult(std::move(result));
}
