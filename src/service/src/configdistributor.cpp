#include "../include/configdistributor.hpp"

#include <stdlib.h>

#include <algorithm>

#include "../include/configloader.hpp"
#include "../include/configsource.hpp"
#include "../include/errors.hpp"
#include "../include/filehash.hpp"
#include "../include/workerregistry.hpp"
#include "sky/MetricsCollector.hpp"
#include "sky/compositelogger.hpp"

namespace fs = std::filesystem;

ConfigDistributor::ConfigDistributor(const std::string &name,
                                     const WorkerContext &context)
    : Worker(name, context, {"distribution"}), folder_(context.layout) {
  auto &metrics = sky::MetricsCollector::instance();
  metrics.ensureCounter("configs_adopted", "Distributed configurations adopted");
  metrics.ensureCounter("configs_rejected",
                        "Distributed configurations rejected");
}

ConfigDistributor::~ConfigDistributor() { stop(); }

ConfigDistributor::Settings ConfigDistributor::parseSettings(
    const nlohmann::json &section) {
  if (!section.is_object()) {
    throw ConfigurationError(std::string(kKey) + " section is not an object");
  }
  Settings settings;

  if (!section.contains("url") || !section["url"].is_string() ||
      section["url"].get<std::string>().empty()) {
    throw ConfigurationError("'url' is missing or not a string");
  }
  settings.url = section["url"].get<std::string>();

  if (!section.contains("update_every") || !section["update_every"].is_number()) {
    throw ConfigurationError("'update_every' is missing or not a number");
  }
  settings.updateEvery = section["update_every"].get<double>();
  if (settings.updateEvery <= 0) {
    throw ConfigurationError("'update_every' must be positive");
  }

  if (section.contains("timeout")) {
    if (!section["timeout"].is_number() || section["timeout"].get<double>() <= 0) {
      throw ConfigurationError("'timeout' must be a positive number");
    }
    settings.timeout =
        std::chrono::seconds(static_cast<long long>(section["timeout"].get<double>()));
  }
  return settings;
}

std::optional<std::string> ConfigDistributor::checkConfig(ConfigSource &source) {
  try {
    parseSettings(source.get(kKey));
  } catch (const std::exception &e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

std::unique_ptr<RemoteSource> ConfigDistributor::makeRemote(
    const Settings &settings) const {
  if (context().remoteSourceFactory) {
    return context().remoteSourceFactory(settings.url, settings.timeout);
  }
  return makeRemoteSource(settings.url, settings.timeout);
}

std::optional<std::string> ConfigDistributor::fetchDigestFile(
    RemoteSource &remote, const std::vector<std::string> &remoteNames,
    const fs::path &candidate) {
  const std::string sidecar = candidate.filename().string() + ".sha256";
  if (std::find(remoteNames.begin(), remoteNames.end(), sidecar) ==
      remoteNames.end()) {
    return std::nullopt;
  }

  const fs::path sidecarPath = candidate.parent_path() / sidecar;
  remote.download(sidecar, sidecarPath);
  std::string contents;
  try {
    contents = ConfigLoader::readFileContents(sidecarPath);
  } catch (const ConfigurationError &e) {
    throw DistributionError(e.what());
  }
  std::error_code ec;
  fs::remove(sidecarPath, ec);
  return contents;
}

void ConfigDistributor::verifyCandidate(const fs::path &candidate,
                                        const std::string &digest,
                                        const std::optional<std::string> &digestFile) {
  if (digestFile) {
    std::string expected;
    try {
      expected = parseDigestFile(*digestFile);
    } catch (const ConfigurationError &e) {
      throw DistributionError(e.what());
    }
    if (expected != digest) {
      throw DistributionError("checksum mismatch for " +
                              candidate.filename().string() + ": expected " +
                              expected + ", got " + digest);
    }
  }
  if (auto error = folder_.validateFile(candidate, *context().workerRegistry)) {
    throw DistributionError(*error);
  }
}

void ConfigDistributor::notifyAdopted(const std::string &adopted) {
  for (const auto &callback : context().configChangeCallbacks) {
    if (!callback) continue;
    try {
      callback->onConfigAdopted(name(), adopted);
    } catch (const std::exception &e) {
      sky::CompositeLogger::instance().error(
          name() + ": configuration callback failed: " + e.what());
    }
  }
}

std::optional<std::string> ConfigDistributor::distribute(RemoteSource &remote) {
  auto &logger = sky::CompositeLogger::instance();
  auto &metrics = sky::MetricsCollector::instance();

  if (!context().workerRegistry) {
    throw ConfigurationError(name() + ": no worker registry to validate against");
  }

  const auto remoteNames = remote.listFiles();
  const auto remoteBest = folder_.best(remoteNames);
  if (!remoteBest) {
    logger.debug(name() + ": no versioned configuration at " + remote.describe());
    return std::nullopt;
  }

  // Сравнение с целью псевдонима, а не с максимальным локальным файлом:
  // файл, переименованный до переключения ссылки, не считается принятым
  auto local = folder_.current();
  if (!local || !folder_.isValidName(*local)) {
    local = folder_.best(folder_.listLocal());
  }
  if (local && *folder_.version(*local) >= *folder_.version(*remoteBest)) {
    logger.debug(name() + ": local configuration " + *local + " is up to date");
    return std::nullopt;
  }

  const fs::path incoming = folder_.incomingFolder();
  fs::create_directories(incoming);
  const fs::path candidate = incoming / *remoteBest;

  // Ошибки передачи не относятся к кандидату: повтор на следующем шаге
  std::string digest;
  std::optional<std::string> digestFile;
  try {
    remote.download(*remoteBest, candidate);
    digest = sha256File(candidate);
    digestFile = fetchDigestFile(remote, remoteNames, candidate);
  } catch (const std::exception &) {
    std::error_code ec;
    fs::remove(candidate, ec);
    throw;
  }

  const std::string fingerprint =
      *remoteBest + "|" + digest + "|" + digestFile.value_or("");
  if (fingerprint == rejected_) {
    std::error_code ec;
    fs::remove(candidate, ec);
    logger.debug(name() + ": " + *remoteBest +
                 " unchanged since it was rejected, skipping");
    return std::nullopt;
  }

  logger.info(name() + ": new configuration " + *remoteBest + " found at " +
              remote.describe());

  try {
    verifyCandidate(candidate, digest, digestFile);
  } catch (const DistributionError &e) {
    std::error_code ec;
    fs::remove(candidate, ec);
    rejected_ = fingerprint;
    status()->setMisc("rejected", *remoteBest);
    metrics.incrementCounter("configs_rejected");
    throw DistributionError("configuration " + *remoteBest +
                            " rejected: " + e.what());
  }

  const auto removed = folder_.adopt(candidate);
  metrics.incrementCounter("configs_adopted");
  rejected_.clear();
  status()->removeMisc("rejected");

  status()->setMisc("sha256", digest);
  for (const auto &old : removed) {
    logger.info(name() + ": removed superseded configuration " + old);
  }
  notifyAdopted(*remoteBest);
  return remoteBest;
}

void ConfigDistributor::step() {
  const auto settings = parseSettings(config().get(kKey));

  try {
    auto remote = makeRemote(settings);
    distribute(*remote);
  } catch (const DistributionError &e) {
    sky::CompositeLogger::instance().error(name() + ": " + e.what());
  }

  const auto current = folder_.current();
  status()->setMisc("current", current ? *current : std::string("none"));

  sleepSeconds(settings.updateEvery, true);
}

std::optional<std::string> ConfigDistributor::deployTest() {
  Settings settings;
  try {
    settings = parseSettings(config().get(kKey));
  } catch (const std::exception &e) {
    return std::string(e.what());
  }

  std::string tmpl = (fs::temp_directory_path() / "skystation-deploy-XXXXXX").string();
  if (!mkdtemp(tmpl.data())) {
    return std::string("cannot create temporary directory");
  }
  const fs::path tmpDir(tmpl);

  std::optional<std::string> error;
  try {
    auto remote = makeRemote(settings);
    const auto best = folder_.best(remote->listFiles());
    if (!best) {
      error = "no versioned configuration found at " + settings.url;
    } else {
      remote->download(*best, tmpDir / *best);
      const auto document = ConfigLoader().loadFromFile(tmpDir / *best);
      if (!document.contains(WorkerRegistry::kMainKey)) {
        error = *best + " has no '" + WorkerRegistry::kMainKey + "' key";
      }
    }
  } catch (const std::exception &e) {
    error = std::string(e.what());
  }

  std::error_code ec;
  fs::remove_all(tmpDir, ec);
  return error;
}
