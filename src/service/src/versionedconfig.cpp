#include "../include/versionedconfig.hpp"

#include <algorithm>
#include <mutex>

#include "../include/configloader.hpp"
#include "../include/configsource.hpp"
#include "../include/errors.hpp"
#include "../include/namedlock.hpp"
#include "../include/workerregistry.hpp"
#include "sky/compositelogger.hpp"

namespace fs = std::filesystem;

VersionedConfigFolder::VersionedConfigFolder(ConfigLayout layout)
    : layout_(std::move(layout)) {}

std::optional<VersionedConfigFolder::Version> VersionedConfigFolder::version(
    const std::string &filename) const {
  if (filename == layout_.aliasName) return std::nullopt;

  std::string stem;
  for (const auto &ext : layout_.extensions) {
    if (filename.size() > ext.size() &&
        filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0) {
      stem = filename.substr(0, filename.size() - ext.size());
      break;
    }
  }
  if (stem.empty()) return std::nullopt;

  std::vector<std::string> parts;
  size_t begin = 0;
  while (true) {
    const size_t pos = stem.find('_', begin);
    parts.push_back(stem.substr(begin, pos - begin));
    if (pos == std::string::npos) break;
    begin = pos + 1;
  }

  if (parts.size() != 3 || parts[0] != layout_.prefix) return std::nullopt;

  const std::string &digits = parts[2];
  if (digits.empty() ||
      !std::all_of(digits.begin(), digits.end(),
                   [](unsigned char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  try {
    return static_cast<Version>(std::stoull(digits));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<std::string> VersionedConfigFolder::best(
    const std::vector<std::string> &names) const {
  std::optional<std::string> result;
  Version bestVersion = 0;
  for (const auto &name : names) {
    const auto v = version(name);
    if (!v) continue;
    if (!result || *v > bestVersion || (*v == bestVersion && name > *result)) {
      result = name;
      bestVersion = *v;
    }
  }
  return result;
}

std::vector<std::string> VersionedConfigFolder::listLocal() const {
  std::vector<std::string> names;
  std::error_code ec;
  for (fs::directory_iterator it(layout_.folder, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    const auto name = it->path().filename().string();
    if (isValidName(name)) names.push_back(name);
  }
  if (ec) {
    sky::CompositeLogger::instance().warning(
        "Cannot list configuration folder " + layout_.folder.string() + ": " +
        ec.message());
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::optional<std::string> VersionedConfigFolder::current() const {
  std::error_code ec;
  const auto alias = layout_.aliasPath();
  if (!fs::is_symlink(alias, ec)) return std::nullopt;
  const auto target = fs::read_symlink(alias, ec);
  if (ec) return std::nullopt;
  return target.filename().string();
}

std::vector<std::string> VersionedConfigFolder::adopt(const fs::path &file) {
  auto &logger = sky::CompositeLogger::instance();
  const std::string name = file.filename().string();
  if (!isValidName(name)) {
    throw DistributionError("not a versioned configuration file: " + name);
  }

  const fs::path target = layout_.folder / name;
  const fs::path tmpLink = layout_.folder / ("." + layout_.aliasName + ".tmp");
  std::vector<std::string> removed;

  std::lock_guard lock(NamedLock::get(NamedLock::kConfiguration));

  if (fs::absolute(file).lexically_normal() !=
      fs::absolute(target).lexically_normal()) {
    fs::rename(file, target);
  }
  // Новый mtime, чтобы DynamicConfigSource заметил смену файла
  fs::last_write_time(target, fs::file_time_type::clock::now());

  fs::remove(tmpLink);
  fs::create_symlink(name, tmpLink);
  fs::rename(tmpLink, layout_.aliasPath());

  for (const auto &other : listLocal()) {
    if (other == name) continue;
    std::error_code ec;
    fs::remove(layout_.folder / other, ec);
    if (ec) {
      logger.warning("Cannot remove superseded configuration " + other + ": " +
                     ec.message());
    } else {
      removed.push_back(other);
    }
  }

  logger.info("Configuration " + name + " adopted");
  return removed;
}

std::optional<std::string> VersionedConfigFolder::validateDocument(
    const nlohmann::json &document, const WorkerRegistry &registry) {
  if (!document.is_object()) {
    return "configuration root is not an object";
  }
  auto main = document.find(WorkerRegistry::kMainKey);
  if (main == document.end()) {
    return std::string("missing '") + WorkerRegistry::kMainKey + "' key";
  }
  if (!main->is_object() || !main->contains("period") ||
      !(*main)["period"].is_number()) {
    return "'main.period' is missing or not a number";
  }

  InMemoryConfigSource source(document);
  for (auto it = document.begin(); it != document.end(); ++it) {
    if (it.key() == WorkerRegistry::kMainKey) continue;

    const auto descriptor = registry.resolve(it.key());
    if (!descriptor) {
      return "unresolved worker key '" + it.key() + "'";
    }
    try {
      if (auto error = descriptor->checkConfig(source)) {
        return it.key() + ": " + *error;
      }
    } catch (const std::exception &e) {
      return it.key() + ": " + e.what();
    }
  }
  return std::nullopt;
}

std::optional<std::string> VersionedConfigFolder::validateFile(
    const fs::path &file, const WorkerRegistry &registry) const {
  nlohmann::json document;
  try {
    document = ConfigLoader().loadFromFile(file);
    TemplateProcessor::fromGlobalsFile(layout_.globalsPath()).process(document);
  } catch (const ConfigurationError &e) {
    return std::string(e.what());
  }
  return validateDocument(document, registry);
}
