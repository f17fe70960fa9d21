/**
 * @file namedlock.hpp
 * @brief Именованные области взаимного исключения
 *
 * @details
 * NamedLock::get("configuration") возвращает одну и ту же блокировку для
 * всех потоков процесса. Ею пользуются DynamicConfigSource (чтение файла и
 * проверка mtime) и ConfigDistributor (атомарная подмена ссылки), поэтому
 * читатель никогда не видит частично записанный файл.
 *
 * Если задан каталог блокировок (setLockDirectory), захват дополнительно
 * берёт flock(2) на файл `<dir>/.<name>.lock`, что позволяет внешним
 * утилитам, изменяющим конфигурацию, участвовать в той же области.
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

class NamedLock {
 public:
  static constexpr const char *kConfiguration = "configuration";

  /**
   * @brief Получить блокировку по имени (создаётся при первом обращении)
   */
  static NamedLock &get(const std::string &name);

  /**
   * @brief Каталог для файлов межпроцессной блокировки
   * @note Пустой путь отключает flock
   */
  static void setLockDirectory(const std::filesystem::path &dir);

  void lock();
  void unlock();

  const std::string &name() const noexcept { return name_; }

  NamedLock(const NamedLock &) = delete;
  NamedLock &operator=(const NamedLock &) = delete;
  ~NamedLock();

 private:
  explicit NamedLock(std::string name);

  std::string name_;
  std::recursive_mutex mutex_;
  int depth_ = 0;
  int fd_ = -1;

  static std::mutex registryMutex_;
  static std::map<std::string, std::unique_ptr<NamedLock>> registry_;
  static std::filesystem::path lockDirectory_;
};
