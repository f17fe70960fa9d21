#include "../include/statusreporter.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "../include/configsource.hpp"
#include "../include/errors.hpp"
#include "../include/statusregistry.hpp"
#include "../include/version.hpp"
#include "sky/MetricsCollector.hpp"
#include "sky/compositelogger.hpp"

namespace fs = std::filesystem;

StatusReporter::StatusReporter(const std::string &name,
                               const WorkerContext &context)
    : Worker(name, context, {"status"}) {}

StatusReporter::~StatusReporter() { stop(); }

StatusReporter::Settings StatusReporter::parseSettings(
    const nlohmann::json &section) {
  if (!section.is_object()) {
    throw ConfigurationError(std::string(kKey) + " section is not an object");
  }
  Settings settings;
  if (!section.contains("update_every") || !section["update_every"].is_number()) {
    throw ConfigurationError("'update_every' is missing or not a number");
  }
  settings.updateEvery = section["update_every"].get<double>();
  if (settings.updateEvery <= 0) {
    throw ConfigurationError("'update_every' must be positive");
  }
  if (section.contains("report_file")) {
    if (!section["report_file"].is_string()) {
      throw ConfigurationError("'report_file' must be a string");
    }
    settings.reportFile = fs::path(section["report_file"].get<std::string>());
  }
  return settings;
}

std::optional<std::string> StatusReporter::checkConfig(ConfigSource &source) {
  try {
    parseSettings(source.get(kKey));
  } catch (const std::exception &e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

std::optional<std::string> StatusReporter::deployTest() {
  try {
    const auto settings = parseSettings(config().get(kKey));
    if (settings.reportFile) {
      writeReport(*settings.reportFile, "deploy test\n");
    }
  } catch (const std::exception &e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

std::optional<WorkerState> StatusReporter::worstState(const Snapshots &snapshots) {
  std::optional<WorkerState> worst;
  for (const auto &[name, snapshot] : snapshots) {
    if (!worst || severity(snapshot.state) > severity(*worst)) {
      worst = snapshot.state;
    }
  }
  return worst;
}

std::string StatusReporter::formatDuration(std::chrono::seconds duration) {
  long long total = duration.count();
  if (total < 0) total = 0;
  const long long days = total / 86400;
  total %= 86400;

  std::ostringstream ss;
  if (days > 0) {
    ss << days << (days == 1 ? " day, " : " days, ");
  }
  ss << total / 3600 << ':' << std::setw(2) << std::setfill('0')
     << (total % 3600) / 60 << ':' << std::setw(2) << std::setfill('0')
     << total % 60;
  return ss.str();
}

std::string StatusReporter::formatSize(std::uintmax_t bytes) {
  static const char *units[] = {"B", "KB", "MB", "GB", "TB", "PB", "EB"};
  if (bytes == 0) return "0B";

  int index = static_cast<int>(std::floor(std::log(static_cast<double>(bytes)) /
                                          std::log(1024.0)));
  index = std::min(index, 6);
  const double value = static_cast<double>(bytes) / std::pow(1024.0, index);

  std::ostringstream ss;
  ss << std::round(value * 100.0) / 100.0 << ' ' << units[index];
  return ss.str();
}

std::string StatusReporter::diskStats(const fs::path &path) {
  std::error_code ec;
  const auto info = fs::space(path, ec);
  if (ec) {
    return "disk usage unavailable: " + ec.message();
  }
  return "disk size: " + formatSize(info.capacity) +
         " | used: " + formatSize(info.capacity - info.free) +
         " | free: " + formatSize(info.available);
}

std::string StatusReporter::workerBlock(const StatusSnapshot &snapshot,
                                        StatusSnapshot::Clock::time_point now) {
  using std::chrono::duration_cast;
  using std::chrono::seconds;

  std::vector<std::pair<std::string, std::string>> lines = snapshot.misc;
  auto put = [&lines](const std::string &key, const std::string &value) {
    for (auto &line : lines) {
      if (line.first == key) {
        line.second = value;
        return;
      }
    }
    lines.emplace_back(key, value);
  };

  if (snapshot.state == WorkerState::Failure && snapshot.error) {
    put("error", *snapshot.error);
  }
  if ((snapshot.state == WorkerState::Off ||
       snapshot.state == WorkerState::Failure) &&
      snapshot.lastTimeRunning) {
    put("last time run",
        formatDuration(duration_cast<seconds>(now - *snapshot.lastTimeRunning)));
  }
  if (snapshot.startedRunning) {
    put("running for",
        formatDuration(duration_cast<seconds>(now - *snapshot.startedRunning)));
  }

  std::string block = "[" + toString(snapshot.state) + "] " + snapshot.name;
  for (const auto &[key, value] : lines) {
    block += "\n" + key + ": " + value;
  }
  return block;
}

std::string StatusReporter::generateReport(const Snapshots &snapshots,
                                           const fs::path &diskPath,
                                           StatusSnapshot::Clock::time_point now) {
  const std::time_t t = StatusSnapshot::Clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  char date[64];
  std::strftime(date, sizeof(date), "%m/%d/%Y, %H:%M:%S", &tm);

  std::string report = "\nlocal date and time: " + std::string(date) +
                       "\nskystation software version " + kAgentVersion + "\n" +
                       diskStats(diskPath) + "\n";

  bool first = true;
  for (const auto &[name, snapshot] : snapshots) {
    report += first ? "\n" : "\n\n";
    report += workerBlock(snapshot, now);
    first = false;
  }
  return report;
}

void StatusReporter::writeReport(const fs::path &file, const std::string &report) {
  if (file.has_parent_path()) fs::create_directories(file.parent_path());
  const fs::path tmp = file.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot write status report " + tmp.string());
    }
    out << report;
    out << "\n\n" << sky::MetricsCollector::instance().exportPrometheus();
    if (!out) {
      throw std::runtime_error("cannot write status report " + tmp.string());
    }
  }
  fs::rename(tmp, file);
}

void StatusReporter::step() {
  auto &logger = sky::CompositeLogger::instance();
  const auto settings = parseSettings(config().get(kKey));

  std::ostringstream every;
  every << settings.updateEvery;
  status()->setMisc("status report expected every (seconds)", every.str());

  Snapshots snapshots;
  if (context().statusRegistry) {
    snapshots = context().statusRegistry->snapshot();
  }

  const auto report =
      generateReport(snapshots, context().layout.folder, StatusSnapshot::Clock::now());
  const auto worst = worstState(snapshots).value_or(WorkerState::Running);

  for (const auto &callback : context().statusReportCallbacks) {
    if (!callback) continue;
    try {
      callback->onStatusReport(worst, report);
    } catch (const std::exception &e) {
      logger.error(name() + ": status report callback failed: " + e.what());
    }
  }

  if (settings.reportFile) {
    writeReport(*settings.reportFile, report);
    logger.debug(name() + ": report written to " + settings.reportFile->string());
  }

  sleepSeconds(settings.updateEvery, true);
}
