/**
 * @file builtinworkers.hpp
 * @brief Регистрация встроенных видов воркеров
 */

#pragma once

#include "../include/workerregistry.hpp"

/// ConfigDistributor, CommandExecutor, StatusReporter
void registerBuiltinWorkers(WorkerRegistry &registry);
