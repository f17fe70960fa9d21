/**
 * @file MetricsCollector.hpp
 * @brief Сбор метрик агента в формате Prometheus
 *
 * @details Реализует потокобезопасный сбор:
 * - Счетчиков (Counter): запуски/остановки воркеров, принятые конфигурации,
 *   выполненные команды
 * - Времени выполнения задач (Summary: сумма и количество)
 *
 * Экспорт используется StatusReporter для записи в файл отчёта.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace sky {

/**
 * @class MetricsCollector
 * @brief Потокобезопасный сборщик метрик (Singleton)
 *
 * @warning Не поддерживает метки (labels): имя метрики уникально
 */
class MetricsCollector {
public:
    /**
     * @brief Получить экземпляр MetricsCollector
     *
     * @code
     * auto& metrics = sky::MetricsCollector::instance();
     * metrics.incrementCounter("workers_started");
     * @endcode
     */
    static MetricsCollector& instance();

    /**
     * @brief Зарегистрировать новый счетчик
     * @param name Уникальное имя счетчика
     * @param help Описание метрики (для Prometheus)
     * @throw std::runtime_error Если счетчик уже зарегистрирован
     * @throw std::invalid_argument Если имя не соответствует [a-zA-Z_][a-zA-Z0-9_]*
     */
    void registerCounter(const std::string& name, const std::string& help = "");

    /**
     * @brief Зарегистрировать счетчик, если он ещё не существует
     * @return true, если счетчик создан этим вызовом
     */
    bool ensureCounter(const std::string& name, const std::string& help = "");

    /**
     * @brief Увеличить значение счетчика
     * @warning Для незарегистрированных счетчиков вызов игнорируется
     */
    void incrementCounter(const std::string& name, double value = 1.0);

    /// Текущее значение счетчика (nullopt, если не зарегистрирован)
    std::optional<double> counterValue(const std::string& name) const;

    /**
     * @brief Записать время выполнения задачи
     * @param name Имя метрики
     * @param duration Время выполнения в миллисекундах
     */
    void recordTaskTime(const std::string& name, std::chrono::milliseconds duration);

    /**
     * @brief Экспорт метрик в формате Prometheus (text-based, version 0.0.4)
     */
    std::string exportPrometheus() const;

    /// Удалить все метрики (используется в тестах)
    void reset();

private:
    MetricsCollector() = default;

    struct Counter {
        double value = 0.0;
        std::string help;
    };

    struct Summary {
        std::uint64_t sumMs = 0;
        std::uint64_t count = 0;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Counter> counters_;
    std::map<std::string, Summary> taskTimes_;
};

} // namespace sky
