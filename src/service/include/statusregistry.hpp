/**
 * @file statusregistry.hpp
 * @brief Реестр записей состояния всех живых воркеров
 *
 * @details Список StatusChangeCallback передаётся при создании и не
 * меняется в течение жизни процесса; рассылка синхронная и упорядоченная.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "../include/workerstatus.hpp"

class StatusRegistry {
 public:
  explicit StatusRegistry(StatusCallbacks callbacks = {});

  /**
   * @brief Получить запись состояния по имени, создав её при необходимости
   * @note Создание рассылает синтетическое событие Starting
   */
  std::shared_ptr<WorkerStatus> createStatus(const std::string &name,
                                             const std::set<std::string> &tags = {});

  std::shared_ptr<WorkerStatus> find(const std::string &name) const;

  void remove(const std::string &name);

  /// Глубокая копия всех записей (имя -> снимок)
  std::map<std::string, StatusSnapshot> snapshot() const;

  std::size_t size() const;

 private:
  std::shared_ptr<const StatusCallbacks> callbacks_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<WorkerStatus>> statuses_;
};
