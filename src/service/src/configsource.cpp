#include "../include/configsource.hpp"

#include <system_error>

#include "../include/configloader.hpp"
#include "../include/errors.hpp"
#include "../include/namedlock.hpp"
#include "sky/compositelogger.hpp"

namespace fs = std::filesystem;

namespace {

bool endsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

nlohmann::json ConfigSource::findSection(const nlohmann::json &global,
                                         const std::string &name) {
  if (!global.is_object()) {
    throw ConfigurationError("configuration document is not an object");
  }
  if (auto it = global.find(name); it != global.end()) {
    return *it;
  }
  // nlohmann::json хранит ключи объекта упорядоченно
  for (auto it = global.begin(); it != global.end(); ++it) {
    if (endsWith(it.key(), name)) {
      return it.value();
    }
  }
  throw ConfigKeyNotFound(name);
}

nlohmann::json ConfigSource::get(const std::string &name) {
  return findSection(getGlobal(), name);
}

bool ConfigSource::changedSince(const std::optional<Marker> &marker) {
  const auto current = lastModified();
  if (!current || !marker) return false;
  return *current != *marker;
}

// ---------------------------------------------------------------------------

StaticConfigSource::StaticConfigSource(const fs::path &path,
                                       TemplateProcessor templates) {
  document_ = ConfigLoader().loadFromFile(path);
  templates.process(document_);
  sky::CompositeLogger::instance().debug("StaticConfigSource: loaded " +
                                         path.string());
}

nlohmann::json StaticConfigSource::getGlobal() { return document_; }

// ---------------------------------------------------------------------------

DynamicConfigSource::DynamicConfigSource(fs::path path,
                                         TemplateProcessor templates)
    : path_(std::move(path)), templates_(std::move(templates)) {}

const nlohmann::json &DynamicConfigSource::refreshLocked() {
  std::error_code ec;
  const auto mtime = fs::last_write_time(path_, ec);
  if (ec) {
    throw ConfigurationError("DynamicConfigSource: cannot stat " +
                             path_.string() + ": " + ec.message());
  }

  if (observed_ && *observed_ == mtime) {
    return cached_;
  }

  auto document = ConfigLoader().loadFromFile(path_);
  templates_.process(document);
  cached_ = std::move(document);
  observed_ = mtime;
  sky::CompositeLogger::instance().debug("DynamicConfigSource: (re)loaded " +
                                         path_.string());
  return cached_;
}

nlohmann::json DynamicConfigSource::getGlobal() {
  std::lock_guard fileLock(NamedLock::get(NamedLock::kConfiguration));
  std::lock_guard cacheLock(cacheMutex_);
  return refreshLocked();
}

std::optional<ConfigSource::Marker> DynamicConfigSource::lastModified() {
  std::lock_guard fileLock(NamedLock::get(NamedLock::kConfiguration));
  std::error_code ec;
  const auto mtime = fs::last_write_time(path_, ec);
  if (ec) {
    std::lock_guard cacheLock(cacheMutex_);
    return observed_;
  }
  return mtime;
}

// ---------------------------------------------------------------------------

InMemoryConfigSource::InMemoryConfigSource(nlohmann::json document)
    : document_(std::move(document)), marker_(Marker::clock::now()) {}

nlohmann::json InMemoryConfigSource::getGlobal() {
  std::lock_guard lock(mutex_);
  return document_;
}

void InMemoryConfigSource::update(nlohmann::json document) {
  std::lock_guard lock(mutex_);
  document_ = std::move(document);
  marker_ += std::chrono::seconds(1);
}

std::optional<ConfigSource::Marker> InMemoryConfigSource::lastModified() {
  std::lock_guard lock(mutex_);
  return marker_;
}
