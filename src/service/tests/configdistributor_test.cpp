#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../include/builtinworkers.hpp"
#include "../include/configdistributor.hpp"
#include "../include/curlremotesource.hpp"
#include "../include/errors.hpp"
#include "../include/filehash.hpp"
#include "../include/statusregistry.hpp"
#include "sky/MetricsCollector.hpp"
#include "testsupport.hpp"

using namespace std::chrono_literals;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using testsupport::TempDir;
using testsupport::waitUntil;
using testsupport::writeFile;

namespace fs = std::filesystem;

namespace {

std::string configWithVersion(int period) {
  return nlohmann::json{{"main", {{"period", period}}},
                        {"StatusReporter", {{"update_every", 30}}}}
      .dump();
}

const char *kInvalidConfig =
    R"({"main": {"period": 5}, "Telescope": {"aperture": 200}})";

double counter(const std::string &name) {
  return sky::MetricsCollector::instance().counterValue(name).value_or(0);
}

class RecordingConfigCallback : public ConfigChangeCallback {
 public:
  void onConfigAdopted(const std::string &workerName,
                       const std::string &adoptedFile) override {
    adopted.push_back(workerName + ":" + adoptedFile);
  }
  std::vector<std::string> adopted;
};

class ThrowingConfigCallback : public ConfigChangeCallback {
 public:
  void onConfigAdopted(const std::string &, const std::string &) override {
    throw std::runtime_error("receiver unavailable");
  }
};

}  // namespace

class ConfigDistributorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registerBuiltinWorkers(registry_);
    context_.layout.folder = local_.path();
    context_.workerRegistry = &registry_;
    context_.statusRegistry = std::make_shared<StatusRegistry>();
    context_.configSource = std::make_shared<InMemoryConfigSource>(nlohmann::json{
        {"main", {{"period", 1}}},
        {"ConfigDistributor",
         {{"url", remote_.path().string()}, {"update_every", 0.05}}}});

    writeFile(local_ / "skystation_station_4.json", configWithVersion(4));
    fs::create_symlink("skystation_station_4.json",
                       local_ / "skystation_config.toml");
  }

  std::vector<std::string> localVersions() {
    return VersionedConfigFolder(context_.layout).listLocal();
  }

  TempDir local_{"skystation-local"};
  TempDir remote_{"skystation-remote"};
  WorkerRegistry registry_;
  WorkerContext context_;
};

TEST_F(ConfigDistributorTest, InvalidRemoteVersionNeverReplacesLocal) {
  writeFile(remote_ / "skystation_station_3.json", configWithVersion(3));
  writeFile(remote_ / "skystation_station_5.json", kInvalidConfig);
  const double rejectedBefore = counter("configs_rejected");

  ConfigDistributor distributor("ConfigDistributor", context_);
  DirectoryRemoteSource remote(remote_.path());

  try {
    distributor.distribute(remote);
    FAIL() << "expected DistributionError";
  } catch (const DistributionError &e) {
    EXPECT_THAT(e.what(), HasSubstr("skystation_station_5.json"));
    EXPECT_THAT(e.what(), HasSubstr("Telescope"));
  }

  EXPECT_THAT(localVersions(), ElementsAre("skystation_station_4.json"));
  EXPECT_EQ(VersionedConfigFolder(context_.layout).current(),
            "skystation_station_4.json");
  EXPECT_TRUE(fs::is_empty(local_ / ".incoming"));
  EXPECT_EQ(counter("configs_rejected"), rejectedBefore + 1);
}

TEST_F(ConfigDistributorTest, ValidRemoteVersionIsAdoptedAndOthersRemoved) {
  writeFile(local_ / "skystation_station_2.json", configWithVersion(2));
  writeFile(remote_ / "skystation_station_3.json", configWithVersion(3));
  writeFile(remote_ / "skystation_station_5.json", configWithVersion(5));
  const double adoptedBefore = counter("configs_adopted");

  ConfigDistributor distributor("ConfigDistributor", context_);
  DirectoryRemoteSource remote(remote_.path());

  EXPECT_EQ(distributor.distribute(remote), "skystation_station_5.json");
  EXPECT_THAT(localVersions(), ElementsAre("skystation_station_5.json"));
  EXPECT_EQ(VersionedConfigFolder(context_.layout).current(),
            "skystation_station_5.json");
  EXPECT_EQ(counter("configs_adopted"), adoptedBefore + 1);
  EXPECT_EQ(distributor.status()->snapshot().miscValue("sha256"),
            sha256File(local_ / "skystation_station_5.json"));

  // Повторный проход: принимать нечего
  EXPECT_FALSE(distributor.distribute(remote).has_value());
}

TEST_F(ConfigDistributorTest, OlderOrEqualRemoteVersionIsIgnored) {
  writeFile(remote_ / "skystation_station_4.json", configWithVersion(44));
  writeFile(remote_ / "skystation_station_1.json", configWithVersion(1));

  ConfigDistributor distributor("ConfigDistributor", context_);
  DirectoryRemoteSource remote(remote_.path());
  EXPECT_FALSE(distributor.distribute(remote).has_value());
  EXPECT_THAT(localVersions(), ElementsAre("skystation_station_4.json"));
}

TEST_F(ConfigDistributorTest, ChecksumSidecarMustMatch) {
  writeFile(remote_ / "skystation_station_6.json", configWithVersion(6));
  writeFile(remote_ / "skystation_station_6.json.sha256",
            std::string(64, '0') + "  skystation_station_6.json\n");

  ConfigDistributor distributor("ConfigDistributor", context_);
  DirectoryRemoteSource remote(remote_.path());
  EXPECT_THROW(distributor.distribute(remote), DistributionError);
  EXPECT_THAT(localVersions(), ElementsAre("skystation_station_4.json"));

  writeFile(remote_ / "skystation_station_6.json.sha256",
            sha256File(remote_ / "skystation_station_6.json") +
                "  skystation_station_6.json\n");
  EXPECT_EQ(distributor.distribute(remote), "skystation_station_6.json");
}

TEST_F(ConfigDistributorTest, RunningWorkerAdoptsNewVersion) {
  auto distributor = std::make_shared<ConfigDistributor>("ConfigDistributor", context_);
  distributor->start();

  ASSERT_TRUE(waitUntil([&] {
    return distributor->status()->snapshot().miscValue("current") ==
           std::optional<std::string>("skystation_station_4.json");
  }));

  writeFile(remote_ / "skystation_station_7.json", configWithVersion(7));
  ASSERT_TRUE(waitUntil([&] {
    return distributor->status()->snapshot().miscValue("current") ==
           std::optional<std::string>("skystation_station_7.json");
  }));

  // Ошибка распространения не роняет воркер
  writeFile(remote_ / "skystation_station_8.json", kInvalidConfig);
  std::this_thread::sleep_for(200ms);
  EXPECT_TRUE(distributor->isAlive());
  EXPECT_EQ(distributor->status()->state(), WorkerState::Running);
  EXPECT_THAT(localVersions(), ElementsAre("skystation_station_7.json"));

  distributor->stop();
  EXPECT_EQ(distributor->status()->state(), WorkerState::Off);
}

TEST_F(ConfigDistributorTest, RejectedVersionIsNotRecheckedUntilCorrected) {
  writeFile(remote_ / "skystation_station_5.json", kInvalidConfig);
  const double rejectedBefore = counter("configs_rejected");

  ConfigDistributor distributor("ConfigDistributor", context_);
  DirectoryRemoteSource remote(remote_.path());

  EXPECT_THROW(distributor.distribute(remote), DistributionError);
  EXPECT_EQ(distributor.status()->snapshot().miscValue("rejected"),
            std::optional<std::string>("skystation_station_5.json"));
  EXPECT_FALSE(distributor.distribute(remote).has_value());
  EXPECT_FALSE(distributor.distribute(remote).has_value());
  EXPECT_EQ(counter("configs_rejected"), rejectedBefore + 1);
  EXPECT_TRUE(fs::is_empty(local_ / ".incoming"));

  // Исправленный файл под тем же именем принимается
  writeFile(remote_ / "skystation_station_5.json", configWithVersion(5));
  EXPECT_EQ(distributor.distribute(remote), "skystation_station_5.json");
  EXPECT_EQ(counter("configs_rejected"), rejectedBefore + 1);
  EXPECT_FALSE(distributor.status()->snapshot().miscValue("rejected").has_value());
}

TEST_F(ConfigDistributorTest, FileRenamedBeforeAliasSwitchIsAdoptedAgain) {
  // Состояние после сбоя питания посреди adopt(): файл на месте, ссылка старая
  writeFile(local_ / "skystation_station_5.json", configWithVersion(5));
  writeFile(remote_ / "skystation_station_5.json", configWithVersion(5));

  ConfigDistributor distributor("ConfigDistributor", context_);
  DirectoryRemoteSource remote(remote_.path());

  EXPECT_EQ(distributor.distribute(remote), "skystation_station_5.json");
  EXPECT_EQ(VersionedConfigFolder(context_.layout).current(),
            "skystation_station_5.json");
  EXPECT_THAT(localVersions(), ElementsAre("skystation_station_5.json"));
}

TEST_F(ConfigDistributorTest, AdoptionNotifiesConfigCallbacks) {
  auto recorder = std::make_shared<RecordingConfigCallback>();
  context_.configChangeCallbacks.push_back(std::make_shared<ThrowingConfigCallback>());
  context_.configChangeCallbacks.push_back(recorder);
  writeFile(remote_ / "skystation_station_5.json", configWithVersion(5));

  ConfigDistributor distributor("ConfigDistributor", context_);
  DirectoryRemoteSource remote(remote_.path());

  EXPECT_EQ(distributor.distribute(remote), "skystation_station_5.json");
  EXPECT_THAT(recorder->adopted,
              ElementsAre("ConfigDistributor:skystation_station_5.json"));

  // Отвергнутый кандидат уведомлений не порождает
  writeFile(remote_ / "skystation_station_6.json", kInvalidConfig);
  EXPECT_THROW(distributor.distribute(remote), DistributionError);
  EXPECT_EQ(recorder->adopted.size(), 1u);
}

TEST_F(ConfigDistributorTest, TomlRemoteVersionIsAdopted) {
  writeFile(remote_ / "skystation_station_5.toml",
            "[main]\nperiod = 5\n\n[StatusReporter]\nupdate_every = 30\n");

  ConfigDistributor distributor("ConfigDistributor", context_);
  DirectoryRemoteSource remote(remote_.path());

  EXPECT_EQ(distributor.distribute(remote), "skystation_station_5.toml");
  EXPECT_THAT(localVersions(), ElementsAre("skystation_station_5.toml"));

  DynamicConfigSource source(context_.layout.aliasPath());
  EXPECT_EQ(source.get("main")["period"], 5);
}

TEST_F(ConfigDistributorTest, CheckConfigRequiresUrlAndPeriod) {
  InMemoryConfigSource missingUrl(nlohmann::json{{"ConfigDistributor", {{"update_every", 10}}}});
  EXPECT_THAT(ConfigDistributor::checkConfig(missingUrl).value_or(""),
              HasSubstr("url"));

  InMemoryConfigSource missingPeriod(nlohmann::json{{"ConfigDistributor", {{"url", "/tmp"}}}});
  EXPECT_THAT(ConfigDistributor::checkConfig(missingPeriod).value_or(""),
              HasSubstr("update_every"));

  InMemoryConfigSource ok(
      nlohmann::json{{"ConfigDistributor", {{"url", "https://example.org/"}, {"update_every", 10}}}});
  EXPECT_FALSE(ConfigDistributor::checkConfig(ok).has_value());
}

TEST_F(ConfigDistributorTest, DeployTestDownloadsBestRemoteFile) {
  ConfigDistributor distributor("ConfigDistributor", context_);
  EXPECT_THAT(distributor.deployTest().value_or(""),
              HasSubstr("no versioned configuration"));

  writeFile(remote_ / "skystation_station_9.json", configWithVersion(9));
  EXPECT_FALSE(distributor.deployTest().has_value());

  writeFile(remote_ / "skystation_station_10.json", R"({"StatusReporter": {}})");
  EXPECT_THAT(distributor.deployTest().value_or(""), HasSubstr("main"));
}

TEST(RemoteSourceTest, FactorySelectsByScheme) {
  TempDir dir;
  writeFile(dir / "b.txt", "b");
  writeFile(dir / "a.txt", "a");

  auto bare = makeRemoteSource(dir.path().string(), 5s);
  EXPECT_THAT(bare->listFiles(), ElementsAre("a.txt", "b.txt"));

  auto file = makeRemoteSource("file://" + dir.path().string(), 5s);
  EXPECT_THAT(file->listFiles(), ElementsAre("a.txt", "b.txt"));

  EXPECT_NE(dynamic_cast<CurlRemoteSource *>(
                makeRemoteSource("https://example.org/cfg", 5s).get()),
            nullptr);
  EXPECT_THROW(makeRemoteSource("gopher://example.org", 5s), ConfigurationError);
}

TEST(RemoteSourceTest, DirectorySourceReportsMissingFiles) {
  TempDir dir;
  DirectoryRemoteSource source(dir / "absent");
  EXPECT_THROW(source.listFiles(), DistributionError);

  DirectoryRemoteSource existing(dir.path());
  EXPECT_THROW(existing.download("nothing.json", dir / "out.json"),
               DistributionError);
  EXPECT_FALSE(fs::exists(dir / "out.json"));
}

TEST(CurlRemoteSourceTest, ParsesIndexPageLinks) {
  const std::string html = R"(
    <html><head><title>Index of /station42</title></head><body>
    <h1>Index of /station42</h1>
    <a href="../">Parent Directory</a>
    <a href="skystation_station_4.json">skystation_station_4.json</a>
    <a href="/station42/skystation_station_5.json?download=1">v5</a>
    <a href="skystation_station_5.json.sha256">sha</a>
    <a href="sub/">sub/</a>
    <a href="?C=N;O=D">Name</a>
    </body></html>)";

  EXPECT_THAT(CurlRemoteSource::parseIndexPage(html, "https://example.org/station42/"),
              ElementsAre("skystation_station_4.json", "skystation_station_5.json",
                          "skystation_station_5.json.sha256"));
}

TEST(CurlRemoteSourceTest, ParsesFtpNameList) {
  EXPECT_THAT(CurlRemoteSource::parseNameList(
                  "command_reboot.txt\r\nskystation_a_1.json\r\n\r\n./\r\n"),
              ElementsAre("command_reboot.txt", "skystation_a_1.json"));
}

TEST(FileHashTest, Sha256OfKnownContent) {
  TempDir dir;
  writeFile(dir / "abc.txt", "abc");
  EXPECT_EQ(sha256File(dir / "abc.txt"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_THROW(sha256File(dir / "missing"), std::runtime_error);
  EXPECT_EQ(parseDigestFile("BA7816BF  abc.txt\n"), "ba7816bf");
}
