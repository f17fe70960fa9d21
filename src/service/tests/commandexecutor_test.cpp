#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <deque>

#include "../include/commandexecutor.hpp"
#include "../include/errors.hpp"
#include "../include/statusregistry.hpp"
#include "testsupport.hpp"

using namespace std::chrono_literals;
using ::testing::HasSubstr;
using testsupport::readFile;
using testsupport::TempDir;
using testsupport::waitUntil;
using testsupport::writeFile;

namespace fs = std::filesystem;

namespace {

// Общее состояние сетевого канала, переживающее пересоздание источника
struct ChannelState {
  std::mutex mutex;
  std::deque<CommandRequest> requests;
  std::vector<CommandResult> reported;
  std::atomic<int> created{0};

  void push(CommandRequest request) {
    std::lock_guard lock(mutex);
    requests.push_back(std::move(request));
  }
  std::vector<CommandResult> results() {
    std::lock_guard lock(mutex);
    return reported;
  }
};

class FakeChannel : public CommandChannel {
 public:
  explicit FakeChannel(std::shared_ptr<ChannelState> state) : state_(std::move(state)) {}

  std::optional<CommandRequest> poll() override {
    std::lock_guard lock(state_->mutex);
    if (state_->requests.empty()) return std::nullopt;
    auto request = state_->requests.front();
    state_->requests.pop_front();
    return request;
  }
  void report(const CommandResult &result) override {
    std::lock_guard lock(state_->mutex);
    state_->reported.push_back(result);
  }

 private:
  std::shared_ptr<ChannelState> state_;
};

class RecordingCallback : public CommandCallback {
 public:
  void onCommandResult(const std::string &workerName,
                       const CommandResult &result) override {
    std::lock_guard lock(mutex_);
    worker_ = workerName;
    results_.push_back(result);
  }
  std::vector<CommandResult> results() const {
    std::lock_guard lock(mutex_);
    return results_;
  }

 private:
  mutable std::mutex mutex_;
  std::string worker_;
  std::vector<CommandResult> results_;
};

}  // namespace

class CommandExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    channel_ = std::make_shared<ChannelState>();
    callback_ = std::make_shared<RecordingCallback>();

    context_.layout.folder = dir_.path();
    context_.statusRegistry = std::make_shared<StatusRegistry>();
    context_.commandCallbacks.push_back(callback_);
    auto state = channel_;
    context_.channelFactory = [state](const nlohmann::json &) {
      ++state->created;
      return std::make_unique<FakeChannel>(state);
    };
  }

  void configure(nlohmann::json section) {
    source_ = std::make_shared<InMemoryConfigSource>(document(std::move(section)));
    context_.configSource = source_;
  }

  static nlohmann::json document(nlohmann::json section) {
    section["update_every"] = 0.02;
    return {{"main", {{"period", 1}}}, {"CommandExecutor", section}};
  }

  std::string misc(CommandExecutor &executor, const std::string &key) {
    return executor.status()->snapshot().miscValue(key).value_or("");
  }

  TempDir dir_;
  std::shared_ptr<InMemoryConfigSource> source_;
  std::shared_ptr<ChannelState> channel_;
  std::shared_ptr<RecordingCallback> callback_;
  WorkerContext context_;
};

TEST_F(CommandExecutorTest, SettingsDefaultsAndValidation) {
  ConfigLayout layout;
  layout.folder = "/opt/station";

  auto settings = CommandExecutor::parseSettings({{"update_every", 5}}, layout);
  EXPECT_EQ(settings.source, CommandExecutor::SourceKind::Local);
  EXPECT_EQ(settings.commandFile, fs::path("/opt/station/command.sh"));
  EXPECT_EQ(settings.commandFolder, fs::path("/opt/station/command"));

  settings = CommandExecutor::parseSettings(
      {{"update_every", 5}, {"url", "ftp://example.org/cmd/"}}, layout);
  EXPECT_EQ(settings.source, CommandExecutor::SourceKind::Remote);

  EXPECT_THROW(CommandExecutor::parseSettings({{"source", "local"}}, layout),
               ConfigurationError);
  EXPECT_THROW(CommandExecutor::parseSettings(
                   {{"update_every", 5}, {"source", "network"}}, layout),
               ConfigurationError);
  EXPECT_THROW(CommandExecutor::parseSettings(
                   {{"update_every", 5}, {"source", "remote"}}, layout),
               ConfigurationError);
  EXPECT_THROW(CommandExecutor::parseSettings(
                   {{"update_every", 5}, {"source", "pigeon"}}, layout),
               ConfigurationError);
  EXPECT_THROW(CommandExecutor::parseSettings(
                   {{"update_every", 5}, {"timeout", -2}}, layout),
               ConfigurationError);
}

TEST_F(CommandExecutorTest, RunsLocalCommandAndPublishesOutput) {
  configure({{"source", "local"}});
  CommandExecutor executor("CommandExecutor", context_);
  EXPECT_EQ(misc(executor, "current command"), "no command running");
  EXPECT_EQ(misc(executor, "previous command output"), "no previous command");
  EXPECT_TRUE(executor.status()->snapshot().tags.count("commands"));

  executor.start();
  writeFile(dir_ / "command.sh", "echo hello");

  ASSERT_TRUE(waitUntil([&] { return callback_->results().size() == 1; }));
  const auto result = callback_->results().front();
  EXPECT_EQ(result.id, "command.sh");
  EXPECT_EQ(result.exitCode, 0);
  EXPECT_EQ(result.stdoutText, "hello\n");
  EXPECT_EQ(readFile(dir_ / "command.sh"), "");

  EXPECT_THAT(misc(executor, "previous command output"),
              HasSubstr("stdout:\nhello\n"));
  ASSERT_TRUE(waitUntil(
      [&] { return misc(executor, "current command") == "no command running"; }));

  executor.stop();
  EXPECT_EQ(executor.status()->state(), WorkerState::Off);
}

TEST_F(CommandExecutorTest, ReportsRunningCommand) {
  configure({{"source", "local"}});
  CommandExecutor executor("CommandExecutor", context_);
  executor.start();
  writeFile(dir_ / "command.sh", "sleep 1.5");

  ASSERT_TRUE(waitUntil([&] { return executor.commandInFlight(); }));
  ASSERT_TRUE(waitUntil(
      [&] { return misc(executor, "current command") == "running for 1 seconds\nsleep 1.5"; }));

  ASSERT_TRUE(waitUntil([&] { return callback_->results().size() == 1; }));
  executor.stop();
}

TEST_F(CommandExecutorTest, NetworkCommandsAreAuthenticatedAndDeduplicated) {
  configure({{"source", "network"}, {"token", "secret"}});
  channel_->push({"1", "echo one", "secret"});
  channel_->push({"2", "echo one", "secret"});
  channel_->push({"3", "echo two", "secret"});

  CommandExecutor executor("CommandExecutor", context_);
  executor.start();

  ASSERT_TRUE(waitUntil([&] { return channel_->results().size() == 2; }));
  const auto reported = channel_->results();
  EXPECT_EQ(reported[0].id, "1");
  EXPECT_EQ(reported[0].stdoutText, "one\n");
  EXPECT_EQ(reported[1].id, "3");
  EXPECT_EQ(reported[1].stdoutText, "two\n");
  EXPECT_EQ(callback_->results().size(), 2u);
  EXPECT_EQ(channel_->created.load(), 1);
  EXPECT_EQ(readFile(dir_ / "command" / "previous.txt"), "echo two");

  executor.stop();
}

TEST_F(CommandExecutorTest, InvalidTokenFailsWithAuthenticationKind) {
  configure({{"source", "network"}, {"token", "secret"}});
  channel_->push({"1", "reboot", "wrong"});

  CommandExecutor executor("CommandExecutor", context_);
  executor.start();

  ASSERT_TRUE(waitUntil([&] { return !executor.isAlive(); }));
  const auto snapshot = executor.status()->snapshot();
  EXPECT_EQ(snapshot.state, WorkerState::Failure);
  EXPECT_EQ(snapshot.failureKind, FailureKind::Authentication);
  EXPECT_TRUE(callback_->results().empty());
}

TEST_F(CommandExecutorTest, LocalFileWaitsWhileCommandInFlight) {
  configure({{"source", "network"}, {"token", "secret"}});
  channel_->push({"1", "sleep 0.5; echo network", "secret"});

  CommandExecutor executor("CommandExecutor", context_);
  executor.start();
  ASSERT_TRUE(waitUntil([&] { return executor.commandInFlight(); }));

  writeFile(dir_ / "command.sh", "echo local");
  std::this_thread::sleep_for(150ms);
  // Файл не принят, пока выполняется другая команда
  EXPECT_EQ(readFile(dir_ / "command.sh"), "echo local");

  ASSERT_TRUE(waitUntil([&] { return callback_->results().size() == 2; }));
  const auto results = callback_->results();
  EXPECT_EQ(results[0].stdoutText, "network\n");
  EXPECT_EQ(results[1].stdoutText, "local\n");
  // Результат локальной команды в сеть не отправляется
  EXPECT_EQ(channel_->results().size(), 1u);

  executor.stop();
}

TEST_F(CommandExecutorTest, StopCancelsRunningCommand) {
  configure({{"source", "local"}});
  CommandExecutor executor("CommandExecutor", context_);
  executor.start();
  writeFile(dir_ / "command.sh", "sleep 30");
  ASSERT_TRUE(waitUntil([&] { return executor.commandInFlight(); }));

  const auto begin = std::chrono::steady_clock::now();
  executor.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
  EXPECT_FALSE(executor.commandInFlight());
  EXPECT_EQ(executor.status()->state(), WorkerState::Off);
  EXPECT_TRUE(callback_->results().empty());
}

TEST_F(CommandExecutorTest, NetworkSourceWithoutChannelFails) {
  context_.channelFactory = nullptr;
  configure({{"source", "network"}, {"token", "secret"}});
  CommandExecutor executor("CommandExecutor", context_);
  executor.start();

  ASSERT_TRUE(waitUntil([&] { return !executor.isAlive(); }));
  EXPECT_EQ(executor.status()->state(), WorkerState::Failure);
  EXPECT_THAT(executor.status()->snapshot().error.value_or(""),
              HasSubstr("no channel"));
}

TEST_F(CommandExecutorTest, DeployTestRunsShellProbe) {
  configure({{"source", "local"}});
  CommandExecutor executor("CommandExecutor", context_);
  EXPECT_FALSE(executor.deployTest().has_value());
  EXPECT_TRUE(fs::is_directory(dir_ / "command"));
}

TEST_F(CommandExecutorTest, TokenChangeDuringCommandStillReportsToOriginalChannel) {
  configure({{"source", "network"}, {"token", "first"}});
  channel_->push({"1", "sleep 0.5; echo one", "first"});

  CommandExecutor executor("CommandExecutor", context_);
  executor.start();
  ASSERT_TRUE(waitUntil([&] { return executor.commandInFlight(); }));

  source_->update(document({{"source", "network"}, {"token", "second"}}));
  std::this_thread::sleep_for(100ms);
  // Пока команда выполняется, источник не пересоздаётся
  EXPECT_EQ(channel_->created.load(), 1);

  ASSERT_TRUE(waitUntil([&] { return channel_->results().size() == 1; }));
  EXPECT_EQ(channel_->results().front().id, "1");
  EXPECT_EQ(channel_->results().front().stdoutText, "one\n");

  // После доставки результата действует новый токен
  ASSERT_TRUE(waitUntil([&] { return channel_->created == 2; }));
  channel_->push({"2", "echo two", "second"});
  ASSERT_TRUE(waitUntil([&] { return channel_->results().size() == 2; }));
  EXPECT_EQ(channel_->results().back().stdoutText, "two\n");
  EXPECT_EQ(executor.status()->state(), WorkerState::Running);

  executor.stop();
}

TEST_F(CommandExecutorTest, RemoteCommandFileRunsOnceAcrossPolls) {
  const auto remote = dir_ / "remote";
  writeFile(remote / "command_uptime.txt", "echo remote");
  configure({{"source", "remote"}, {"url", remote.string()}});

  CommandExecutor executor("CommandExecutor", context_);
  executor.start();

  ASSERT_TRUE(waitUntil([&] { return callback_->results().size() == 1; }));
  EXPECT_EQ(callback_->results().front().stdoutText, "remote\n");

  // Тот же файл остаётся на сервере: повторного выполнения нет
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(callback_->results().size(), 1u);
  EXPECT_EQ(readFile(dir_ / "command" / "previous.txt"), "command_uptime.txt");
  EXPECT_EQ(executor.status()->state(), WorkerState::Running);

  // Новое имя файла: новая команда
  fs::remove(remote / "command_uptime.txt");
  writeFile(remote / "command_date.txt", "echo again");
  ASSERT_TRUE(waitUntil([&] { return callback_->results().size() == 2; }));
  EXPECT_EQ(callback_->results().back().stdoutText, "again\n");

  executor.stop();
}
