/**
 * @file worker.cpp
 * @brief Реализация жизненного цикла воркера
 */

#include "../include/worker.hpp"

#include "../include/errors.hpp"
#include "../include/statusregistry.hpp"
#include "sky/MetricsCollector.hpp"
#include "sky/compositelogger.hpp"

Worker::Worker(std::string name, WorkerContext context,
               std::set<std::string> tags)
    : name_(std::move(name)), context_(std::move(context)) {
  if (!context_.configSource) {
    throw std::invalid_argument("Worker " + name_ + ": no configuration source");
  }
  if (context_.statusRegistry) {
    status_ = context_.statusRegistry->createStatus(name_, tags);
  } else {
    status_ = std::make_shared<WorkerStatus>(name_, nullptr, std::move(tags));
  }
}

Worker::~Worker() {
  if (thread_.joinable()) {
    sky::CompositeLogger::instance().warning(
        "Worker " + name_ + " destroyed while its thread was not joined");
    running_ = false;
    token_.requestStop();
    if (thread_.get_id() != std::this_thread::get_id()) {
      thread_.join();
    } else {
      thread_.detach();
    }
  }
}

void Worker::start() {
  std::lock_guard<std::mutex> lock(lifecycleMutex_);

  if (alive_) {
    sky::CompositeLogger::instance().warning("Worker already running: " + name_);
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }

  token_.reset();
  stopped_ = false;
  running_ = true;
  alive_ = true;
  status_->setStarting();

  try {
    thread_ = std::thread(&Worker::run, this);
  } catch (const std::system_error &) {
    running_ = false;
    alive_ = false;
    throw;
  }
}

void Worker::stop() {
  std::lock_guard<std::mutex> lock(lifecycleMutex_);

  stopped_ = true;
  running_ = false;
  token_.requestStop();

  if (thread_.joinable()) {
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
      return;
    }
    thread_.join();
  }
  sky::CompositeLogger::instance().debug("Worker stopped: " + name_);
}

bool Worker::revive() {
  if (alive_ || stopped_) return false;

  sky::CompositeLogger::instance().info("Worker " + name_ +
                                        " not running, trying to restart");
  try {
    start();
  } catch (const std::exception &e) {
    sky::CompositeLogger::instance().error("Failed to revive worker " + name_ +
                                           ": " + e.what());
    return false;
  }
  sky::MetricsCollector::instance().incrementCounter("workers_revived");
  return true;
}

bool Worker::isAlive() const noexcept {
  return alive_.load(std::memory_order_acquire);
}

bool Worker::isRunning() const noexcept {
  return running_.load(std::memory_order_acquire);
}

Worker::WakeReason Worker::sleep(std::chrono::milliseconds duration,
                                 bool interruptOnConfigChange) {
  std::function<bool()> configChanged;
  if (interruptOnConfigChange) {
    auto marker = config().lastModified();
    configChanged = [this, marker] { return config().changedSince(marker); };
  }

  const bool interrupted = token_.waitFor(duration, configChanged);
  if (!running_ || token_.stopRequested()) return WakeReason::Stop;
  return interrupted ? WakeReason::ConfigChange : WakeReason::Timeout;
}

Worker::WakeReason Worker::sleepSeconds(double seconds,
                                        bool interruptOnConfigChange) {
  if (seconds < 0) seconds = 0;
  return sleep(std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0)),
               interruptOnConfigChange);
}

void Worker::run() {
  auto &logger = sky::CompositeLogger::instance();
  logger.info(name_ + ": starting");

  while (running_) {
    try {
      status_->setRunning();
      step();
    } catch (const AuthenticationError &e) {
      logger.error(name_ + ": authentication failure: " + e.what());
      status_->setFailure(e.what(), FailureKind::Authentication);
      sky::MetricsCollector::instance().incrementCounter("worker_failures");
      running_ = false;
      alive_ = false;
      return;
    } catch (const std::exception &e) {
      logger.error(name_ + ": " + e.what());
      status_->setFailure(e.what(), FailureKind::Step);
      sky::MetricsCollector::instance().incrementCounter("worker_failures");
      running_ = false;
      alive_ = false;
      return;
    }
  }

  logger.info(name_ + ": turning off");
  try {
    onExit();
  } catch (const std::exception &e) {
    logger.error(name_ + ": exit hook failed: " + e.what());
  }
  status_->setOff();
  alive_ = false;
}
