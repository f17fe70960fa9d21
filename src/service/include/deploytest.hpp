/**
 * @file deploytest.hpp
 * @brief Предварительная проверка развёртывания (`--deploy-test`)
 *
 * @details Для каждого разрешённого ключа конфигурации: создание воркера
 * (без запуска), checkConfig(), затем deployTest(). Результат: ошибка или
 * nullopt по каждому ключу; ключ `main` проверяет `main.period`.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

#include "../include/workercontext.hpp"

class ConfigSource;
class WorkerRegistry;

using DeployTestResults = std::map<std::string, std::optional<std::string>>;

DeployTestResults deployTests(ConfigSource &source,
                              const WorkerRegistry &registry,
                              const WorkerContext &context);

/// Все проверки прошли
bool deployTestsPassed(const DeployTestResults &results);
