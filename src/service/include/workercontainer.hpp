/**
 * @file workercontainer.hpp
 * @brief Потокобезопасный контейнер живых воркеров Supervisor
 *
 * @details
 * Блокировка берётся только на время учётных операций: остановка и запуск
 * воркеров выполняются вне неё, над извлечёнными shared_ptr.
 *
 * @warning
 * Не выполняйте внутри access() длительные или блокирующие операции
 * (stop(), join()): это задержит остальные потоки.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../include/worker.hpp"

class WorkersContainer {
 public:
  using Map = std::map<std::string, std::shared_ptr<Worker>>;

  /**
     * @brief Выполняет произвольную операцию с картой воркеров под блокировкой
     *
     * @code
     container.access([&](auto &workers) {
         workers.emplace(worker->name(), worker);
     });
     @endcode
     */
  template <typename Func>
  decltype(auto) access(Func &&func) {
    std::lock_guard lock(mutex_);
    return func(workers_);
  }

  size_t size() const {
    std::lock_guard lock(mutex_);
    return workers_.size();
  }

  std::vector<std::string> names() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(workers_.size());
    for (const auto &[name, worker] : workers_) result.push_back(name);
    return result;
  }

  std::shared_ptr<Worker> find(const std::string &name) const {
    std::lock_guard lock(mutex_);
    auto it = workers_.find(name);
    return it == workers_.end() ? nullptr : it->second;
  }

  /// Извлечь все воркеры (контейнер становится пустым)
  Map takeAll() {
    std::lock_guard lock(mutex_);
    Map result;
    result.swap(workers_);
    return result;
  }

 private:
  mutable std::mutex mutex_;
  Map workers_;
};
