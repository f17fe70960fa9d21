#include "sky/MetricsCollector.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace sky {

namespace {

constexpr const char* kPrefix = "skystation_";

bool isValidMetricName(const std::string& name) {
    if (name.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

} // namespace

MetricsCollector& MetricsCollector::instance() {
    static MetricsCollector instance;
    return instance;
}

void MetricsCollector::registerCounter(const std::string& name, const std::string& help) {
    if (!isValidMetricName(name)) {
        throw std::invalid_argument("Invalid metric name: " + name);
    }
    std::lock_guard lock(mutex_);
    if (counters_.count(name)) {
        throw std::runtime_error("Metric already registered: " + name);
    }
    counters_[name].help = help;
}

bool MetricsCollector::ensureCounter(const std::string& name, const std::string& help) {
    if (!isValidMetricName(name)) {
        throw std::invalid_argument("Invalid metric name: " + name);
    }
    std::lock_guard lock(mutex_);
    auto [it, inserted] = counters_.try_emplace(name);
    if (inserted) it->second.help = help;
    return inserted;
}

void MetricsCollector::incrementCounter(const std::string& name, double value) {
    std::lock_guard lock(mutex_);
    if (auto it = counters_.find(name); it != counters_.end()) {
        it->second.value += value;
    }
}

std::optional<double> MetricsCollector::counterValue(const std::string& name) const {
    std::lock_guard lock(mutex_);
    if (auto it = counters_.find(name); it != counters_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

void MetricsCollector::recordTaskTime(const std::string& name, std::chrono::milliseconds duration) {
    if (!isValidMetricName(name) || duration.count() < 0) return;
    std::lock_guard lock(mutex_);
    auto& summary = taskTimes_[name];
    summary.sumMs += static_cast<std::uint64_t>(duration.count());
    summary.count += 1;
}

std::string MetricsCollector::exportPrometheus() const {
    std::ostringstream ss;
    std::lock_guard lock(mutex_);

    for (const auto& [name, counter] : counters_) {
        if (!counter.help.empty()) {
            ss << "# HELP " << kPrefix << name << " " << counter.help << "\n";
        }
        ss << "# TYPE " << kPrefix << name << " counter\n";
        ss << kPrefix << name << " " << counter.value << "\n";
    }

    for (const auto& [name, summary] : taskTimes_) {
        ss << "# TYPE " << kPrefix << name << "_ms summary\n";
        ss << kPrefix << name << "_ms_sum " << summary.sumMs << "\n";
        ss << kPrefix << name << "_ms_count " << summary.count << "\n";
    }

    return ss.str();
}

void MetricsCollector::reset() {
    std::lock_guard lock(mutex_);
    counters_.clear();
    taskTimes_.clear();
}

} // namespace sky
