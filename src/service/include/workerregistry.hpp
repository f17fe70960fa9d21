/**
 * @file workerregistry.hpp
 * @brief Реестр видов воркеров: ключ конфигурации -> конструктор
 *
 * @details Заполняется при старте процесса (registerBuiltinWorkers).
 * Ключ конфигурации разрешается по точному совпадению, затем по последнему
 * сегменту после точки: `station.workers.CommandExecutor` -> `CommandExecutor`.
 * Неразрешённые ключи журналируются и пропускаются; ошибка одного ключа не
 * прерывает разрешение остальных.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "../include/workercontext.hpp"

class Worker;
class ConfigSource;

/**
 * @struct WorkerDescriptor
 * @brief Идентичность вида воркера
 */
struct WorkerDescriptor {
  using CreatorFunction = std::function<std::shared_ptr<Worker>(
      const std::string &name, const WorkerContext &context)>;
  using CheckFunction =
      std::function<std::optional<std::string>(ConfigSource &)>;

  std::string key;
  CreatorFunction create;
  CheckFunction checkConfig;
};

class WorkerRegistry {
 public:
  /// Зарезервированный ключ верхнего уровня
  static constexpr const char *kMainKey = "main";

  struct Resolution {
    std::map<std::string, WorkerDescriptor> resolved;  ///< ключ дескриптора -> дескриптор
    std::vector<std::string> unresolved;               ///< ключи документа без дескриптора
  };

  /**
   * @brief Зарегистрировать вид воркера
   * @throw std::invalid_argument Пустой ключ или отсутствующие функции
   * @note Повторная регистрация ключа заменяет дескриптор
   */
  void registerDescriptor(WorkerDescriptor descriptor);

  /**
   * @brief Регистрация типа T с конструктором T(name, context) и
   *        статическим T::checkConfig(ConfigSource&)
   *
   * @code
   registry.registerWorker<CommandExecutor>("CommandExecutor");
   @endcode
   */
  template <typename T>
  void registerWorker(const std::string &key) {
    registerDescriptor(WorkerDescriptor{
        key,
        [](const std::string &name, const WorkerContext &context) {
          return std::static_pointer_cast<Worker>(
              std::make_shared<T>(name, context));
        },
        [](ConfigSource &source) { return T::checkConfig(source); }});
  }

  std::optional<WorkerDescriptor> resolve(const std::string &configKey) const;

  /**
   * @brief Разрешение всех ключей документа, кроме `main`
   * @param logUnresolved Журналировать неразрешённые ключи
   */
  Resolution resolveDocument(const nlohmann::json &global,
                             bool logUnresolved = true) const;

  bool isSupported(const std::string &configKey) const;
  std::vector<std::string> getSupportedKeys() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, WorkerDescriptor> descriptors_;
};
