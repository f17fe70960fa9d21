/**
 * @file statusreporter.hpp
 * @brief Воркер сводного отчёта о состоянии станции
 *
 * @details Каждый шаг снимает копию StatusRegistry, формирует текстовый
 * отчёт, вычисляет наихудшее состояние (Failure > Off > Starting > Running),
 * передаёт их StatusReportCallback и, если задан `report_file`, атомарно
 * записывает отчёт вместе с экспортом метрик.
 *
 * Ключи секции: `update_every` (секунды, обязателен), `report_file`.
 *
 * Формат отчёта:
 * @code
 local date and time: 10/18/2026, 21:04:11
 skystation software version 0.1.0
 disk size: 29.1 GB | used: 7.4 GB | free: 21.7 GB

 [running] CommandExecutor
 running for: 0:12:03
 current command: no command running
 @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "../include/worker.hpp"
#include "../include/workerstatus.hpp"

/**
 * @interface StatusReportCallback
 * @brief Приёмник сводного отчёта (push-уведомления, выгрузка)
 */
class StatusReportCallback {
 public:
  virtual ~StatusReportCallback() = default;
  virtual void onStatusReport(WorkerState worst, const std::string &report) = 0;
};

class StatusReporter : public Worker {
 public:
  static constexpr const char *kKey = "StatusReporter";

  struct Settings {
    double updateEvery = 0;
    std::optional<std::filesystem::path> reportFile;
  };

  using Snapshots = std::map<std::string, StatusSnapshot>;

  StatusReporter(const std::string &name, const WorkerContext &context);
  ~StatusReporter() override;

  static Settings parseSettings(const nlohmann::json &section);
  static std::optional<std::string> checkConfig(ConfigSource &source);
  std::optional<std::string> deployTest() override;

  /// Наихудшее состояние или nullopt для пустого набора
  static std::optional<WorkerState> worstState(const Snapshots &snapshots);

  static std::string generateReport(const Snapshots &snapshots,
                                    const std::filesystem::path &diskPath,
                                    StatusSnapshot::Clock::time_point now);

  /// Блок одного воркера: `[state] name` и строки `ключ: значение`
  static std::string workerBlock(const StatusSnapshot &snapshot,
                                 StatusSnapshot::Clock::time_point now);

  /// Длительность в виде `H:MM:SS` (`N day(s), H:MM:SS` для суток и более)
  static std::string formatDuration(std::chrono::seconds duration);

  /// Размер в единицах B, KB, MB... с двумя знаками после запятой
  static std::string formatSize(std::uintmax_t bytes);

  static std::string diskStats(const std::filesystem::path &path);

 protected:
  void step() override;

 private:
  void writeReport(const std::filesystem::path &file, const std::string &report);
};
