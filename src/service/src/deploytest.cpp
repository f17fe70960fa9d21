#include "../include/deploytest.hpp"

#include "../include/configsource.hpp"
#include "../include/worker.hpp"
#include "../include/workerregistry.hpp"
#include "sky/compositelogger.hpp"

DeployTestResults deployTests(ConfigSource &source,
                              const WorkerRegistry &registry,
                              const WorkerContext &context) {
  auto &logger = sky::CompositeLogger::instance();
  DeployTestResults results;

  nlohmann::json global;
  try {
    global = source.getGlobal();
    const auto main = ConfigSource::findSection(global, WorkerRegistry::kMainKey);
    if (!main.is_object() || !main.contains("period") ||
        !main["period"].is_number()) {
      results[WorkerRegistry::kMainKey] =
          std::string("'main.period' is missing or not a number");
    } else {
      results[WorkerRegistry::kMainKey] = std::nullopt;
    }
  } catch (const std::exception &e) {
    results[WorkerRegistry::kMainKey] = std::string(e.what());
    return results;
  }

  const auto resolution = registry.resolveDocument(global);
  for (const auto &unresolved : resolution.unresolved) {
    results[unresolved] = std::string("no worker registered for this key");
  }

  for (const auto &entry : resolution.resolved) {
    const std::string &key = entry.first;
    const WorkerDescriptor &descriptor = entry.second;
    logger.info("Deploy test: " + key);

    try {
      if (auto error = descriptor.checkConfig(source)) {
        results[key] = "configuration: " + *error;
        continue;
      }
      auto worker = descriptor.create(key, context);
      results[key] = worker->deployTest();
    } catch (const std::exception &e) {
      results[key] = std::string(e.what());
    }
  }
  return results;
}

bool deployTestsPassed(const DeployTestResults &results) {
  for (const auto &entry : results) {
    if (entry.second) return false;
  }
  return true;
}
