/**
 * @file supervisor.cpp
 * @brief Реализация Supervisor
 */

#include "../include/supervisor.hpp"

#include <condition_variable>
#include <mutex>
#include <thread>

#include "../include/configsource.hpp"
#include "../include/errors.hpp"
#include "../include/statusregistry.hpp"
#include "sky/MetricsCollector.hpp"
#include "sky/compositelogger.hpp"

namespace {

std::chrono::milliseconds toMillis(double seconds) {
  return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::string join(const std::vector<std::string> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) out += ", ";
    out += item;
  }
  return out;
}

}  // namespace

Supervisor::Supervisor(WorkerContext context, const WorkerRegistry &registry)
    : context_(std::move(context)), registry_(registry) {
  if (!context_.configSource) {
    throw std::invalid_argument("Supervisor: no configuration source");
  }

  nlohmann::json main;
  try {
    main = context_.configSource->get(WorkerRegistry::kMainKey);
  } catch (const ConfigKeyNotFound &) {
    throw ConfigurationError("Supervisor: configuration has no 'main' section");
  }

  if (!main.is_object() || !main.contains("period") ||
      !main["period"].is_number()) {
    throw ConfigurationError(
        "Supervisor: 'main.period' is missing or not a number");
  }
  const double period = main["period"].get<double>();
  if (period <= 0) {
    throw ConfigurationError("Supervisor: 'main.period' must be positive");
  }
  period_ = toMillis(period);

  if (main.contains("stop_timeout")) {
    if (!main["stop_timeout"].is_number() ||
        main["stop_timeout"].get<double>() < 0) {
      throw ConfigurationError(
          "Supervisor: 'main.stop_timeout' must be a non-negative number");
    }
    stopTimeout_ = toMillis(main["stop_timeout"].get<double>());
  }

  auto &metrics = sky::MetricsCollector::instance();
  metrics.ensureCounter("workers_started", "Worker instances started");
  metrics.ensureCounter("workers_stopped", "Worker instances stopped");
  metrics.ensureCounter("workers_revived", "Crashed workers restarted");
  metrics.ensureCounter("worker_failures", "Worker steps that raised");
}

Supervisor::~Supervisor() {
  if (workers_.size() > 0) {
    shutdown(stopTimeout_);
  }
}

Supervisor::CycleReport Supervisor::reconcile() {
  auto &logger = sky::CompositeLogger::instance();
  const auto begin = std::chrono::steady_clock::now();
  CycleReport report;

  const auto global = context_.configSource->getGlobal();
  auto resolution = registry_.resolveDocument(global);
  report.unresolved = std::move(resolution.unresolved);

  // Воркеры, которых больше нет в желаемом наборе
  auto undesired = workers_.access([&](WorkersContainer::Map &workers) {
    std::vector<std::shared_ptr<Worker>> removed;
    for (auto it = workers.begin(); it != workers.end();) {
      if (resolution.resolved.count(it->first) == 0) {
        removed.push_back(it->second);
        it = workers.erase(it);
      } else {
        ++it;
      }
    }
    return removed;
  });

  for (auto &worker : undesired) {
    logger.info("Supervisor: stopping worker " + worker->name());
    worker->stop();
    if (context_.statusRegistry) context_.statusRegistry->remove(worker->name());
    report.stopped.push_back(worker->name());
    sky::MetricsCollector::instance().incrementCounter("workers_stopped");
  }

  // Недостающие воркеры
  std::set<std::string> justStarted;
  for (const auto &entry : resolution.resolved) {
    const std::string &key = entry.first;
    const WorkerDescriptor &descriptor = entry.second;
    if (workers_.find(key)) continue;

    try {
      auto worker = descriptor.create(key, context_);
      if (!worker) {
        throw std::runtime_error("factory returned no worker");
      }
      worker->start();
      workers_.access([&](WorkersContainer::Map &workers) {
        workers.emplace(key, worker);
      });
      justStarted.insert(key);
      report.started.push_back(key);
      sky::MetricsCollector::instance().incrementCounter("workers_started");
      logger.info("Supervisor: started worker " + key);
    } catch (const std::exception &e) {
      logger.error("Supervisor: failed to start worker " + key + ": " +
                   e.what());
      report.failedToStart.push_back(key);
    }
  }

  // Перезапуск упавших
  auto live = workers_.access([](WorkersContainer::Map &workers) {
    std::vector<std::shared_ptr<Worker>> all;
    for (const auto &entry : workers) all.push_back(entry.second);
    return all;
  });
  for (auto &worker : live) {
    if (justStarted.count(worker->name())) continue;
    if (worker->revive()) {
      report.revived.push_back(worker->name());
    }
  }

  if (report.hasActions()) {
    logger.info("Supervisor: cycle done (started: [" + join(report.started) +
                "], stopped: [" + join(report.stopped) + "], revived: [" +
                join(report.revived) + "])");
  } else {
    logger.debug("Supervisor: cycle done, nothing to do");
  }
  sky::MetricsCollector::instance().recordTaskTime(
      "reconciliation", std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - begin));
  return report;
}

void Supervisor::run() {
  auto &logger = sky::CompositeLogger::instance();
  logger.info("Supervisor: running with period " +
              std::to_string(period_.count()) + " ms");

  while (!token_.stopRequested()) {
    try {
      reconcile();
    } catch (const std::exception &e) {
      logger.error(std::string("Supervisor: reconciliation failed: ") +
                   e.what());
    }
    token_.waitFor(period_);
  }
  logger.info("Supervisor: loop ended");
}

void Supervisor::requestStop() { token_.requestStop(); }

void Supervisor::wake() { token_.notify(); }

bool Supervisor::shutdown(std::chrono::milliseconds timeout) {
  auto &logger = sky::CompositeLogger::instance();
  auto workers = workers_.takeAll();
  if (workers.empty()) return true;

  logger.info("Supervisor: stopping " + std::to_string(workers.size()) +
              " worker(s)");

  struct Pending {
    std::mutex mutex;
    std::condition_variable cv;
    std::set<std::string> names;
  };
  auto pending = std::make_shared<Pending>();
  for (const auto &[name, worker] : workers) pending->names.insert(name);

  std::vector<std::thread> stoppers;
  stoppers.reserve(workers.size());
  for (auto &entry : workers) {
    stoppers.emplace_back([pending, worker = entry.second] {
      worker->stop();
      {
        std::lock_guard lock(pending->mutex);
        pending->names.erase(worker->name());
      }
      pending->cv.notify_all();
    });
  }

  bool allStopped = false;
  std::set<std::string> hung;
  {
    std::unique_lock lock(pending->mutex);
    allStopped = pending->cv.wait_for(lock, timeout,
                                      [&] { return pending->names.empty(); });
    hung = pending->names;
  }

  if (allStopped) {
    for (auto &t : stoppers) t.join();
    sky::MetricsCollector::instance().incrementCounter(
        "workers_stopped", static_cast<double>(workers.size()));
    logger.info("Supervisor: all workers stopped");
    return true;
  }

  std::vector<std::string> hungNames(hung.begin(), hung.end());
  logger.critical("Supervisor: workers did not stop within " +
                  std::to_string(timeout.count()) + " ms: " + join(hungNames));
  for (auto &t : stoppers) t.detach();
  return false;
}

std::set<std::string> Supervisor::liveWorkers() const {
  auto names = workers_.names();
  return std::set<std::string>(names.begin(), names.end());
}

std::shared_ptr<Worker> Supervisor::worker(const std::string &name) const {
  return workers_.find(name);
}
