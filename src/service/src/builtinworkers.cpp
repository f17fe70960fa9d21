#include "../include/builtinworkers.hpp"

#include "../include/commandexecutor.hpp"
#include "../include/configdistributor.hpp"
#include "../include/statusreporter.hpp"

void registerBuiltinWorkers(WorkerRegistry &registry) {
  registry.registerWorker<ConfigDistributor>(ConfigDistributor::kKey);
  registry.registerWorker<CommandExecutor>(CommandExecutor::kKey);
  registry.registerWorker<StatusReporter>(StatusReporter::kKey);
}
