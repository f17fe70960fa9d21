/**
 * @file workerregistry.cpp
 * @brief Реализация реестра видов воркеров
 */

#include "../include/workerregistry.hpp"

#include <stdexcept>

#include "sky/compositelogger.hpp"

void WorkerRegistry::registerDescriptor(WorkerDescriptor descriptor) {
  if (descriptor.key.empty()) {
    throw std::invalid_argument("Worker key cannot be empty");
  }
  if (descriptor.key == kMainKey) {
    throw std::invalid_argument("Worker key 'main' is reserved");
  }
  if (!descriptor.create || !descriptor.checkConfig) {
    throw std::invalid_argument("Worker descriptor " + descriptor.key +
                                " is incomplete");
  }

  const std::string key = descriptor.key;
  std::lock_guard<std::mutex> lock(mutex_);
  descriptors_[key] = std::move(descriptor);
  sky::CompositeLogger::instance().debug("Registered worker type: " + key);
}

std::optional<WorkerDescriptor> WorkerRegistry::resolve(
    const std::string &configKey) const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (auto it = descriptors_.find(configKey); it != descriptors_.end()) {
    return it->second;
  }

  const auto dot = configKey.rfind('.');
  if (dot != std::string::npos && dot + 1 < configKey.size()) {
    if (auto it = descriptors_.find(configKey.substr(dot + 1));
        it != descriptors_.end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

WorkerRegistry::Resolution WorkerRegistry::resolveDocument(
    const nlohmann::json &global, bool logUnresolved) const {
  Resolution result;
  if (!global.is_object()) return result;

  for (auto it = global.begin(); it != global.end(); ++it) {
    const std::string &key = it.key();
    if (key == kMainKey) continue;

    auto descriptor = resolve(key);
    if (!descriptor) {
      if (logUnresolved) {
        sky::CompositeLogger::instance().error(
            "Failed to resolve worker for configuration key '" + key +
            "', skipping");
      }
      result.unresolved.push_back(key);
      continue;
    }

    if (result.resolved.count(descriptor->key)) {
      sky::CompositeLogger::instance().warning(
          "Configuration key '" + key + "' duplicates worker " +
          descriptor->key + ", ignoring");
      continue;
    }
    result.resolved.emplace(descriptor->key, std::move(*descriptor));
  }
  return result;
}

bool WorkerRegistry::isSupported(const std::string &configKey) const {
  return resolve(configKey).has_value();
}

std::vector<std::string> WorkerRegistry::getSupportedKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(descriptors_.size());
  for (const auto &[key, descriptor] : descriptors_) {
    keys.push_back(key);
  }
  return keys;
}
