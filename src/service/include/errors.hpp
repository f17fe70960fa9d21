/**
 * @file errors.hpp
 * @brief Иерархия исключений агента
 *
 * @details
 * - ConfigurationError: отсутствующие/некорректные ключи, неверные типы,
 *   неразрешимые ключи воркеров
 * - ConfigKeyNotFound: запрошенная секция конфигурации не найдена
 * - DistributionError: ошибка загрузки/проверки версионной конфигурации
 * - AuthenticationError: неверный токен команды/статуса
 *
 * Ошибки шага воркера не имеют отдельного типа: любое исключение,
 * вышедшее из Worker::step(), переводит воркер в Failure.
 */

#pragma once

#include <stdexcept>
#include <string>

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string &what)
      : std::runtime_error(what) {}
};

class ConfigKeyNotFound : public ConfigurationError {
 public:
  explicit ConfigKeyNotFound(const std::string &key)
      : ConfigurationError("configuration key not found: " + key), key_(key) {}

  const std::string &key() const noexcept { return key_; }

 private:
  std::string key_;
};

class DistributionError : public std::runtime_error {
 public:
  explicit DistributionError(const std::string &what)
      : std::runtime_error(what) {}
};

class AuthenticationError : public std::runtime_error {
 public:
  explicit AuthenticationError(const std::string &what)
      : std::runtime_error(what) {}
};
