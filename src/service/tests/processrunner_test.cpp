#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "../include/processrunner.hpp"
#include "../include/resultchannel.hpp"
#include "testsupport.hpp"

using namespace std::chrono_literals;
using ::testing::HasSubstr;
using testsupport::TempDir;

TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
  const auto result =
      runProcess(shellCommand("echo out; echo err >&2; exit 3", 5s));
  EXPECT_EQ(result.exitCode, 3);
  EXPECT_EQ(result.stdoutText, "out\n");
  EXPECT_EQ(result.stderrText, "err\n");
  EXPECT_FALSE(result.timedOut);
  EXPECT_FALSE(result.cancelled);
}

TEST(ProcessRunnerTest, MissingExecutableExitsWith127) {
  ProcessSpec spec;
  spec.command = "/nonexistent/skystation-tool";
  EXPECT_EQ(runProcess(spec).exitCode, 127);
}

TEST(ProcessRunnerTest, StdinIsClosed) {
  const auto result = runProcess(shellCommand("cat; echo done", 5s));
  EXPECT_EQ(result.exitCode, 0);
  EXPECT_EQ(result.stdoutText, "done\n");
}

TEST(ProcessRunnerTest, TimeoutKillsProcessAndReports124) {
  const auto begin = std::chrono::steady_clock::now();
  const auto result = runProcess(shellCommand("echo started; sleep 30", 300ms));
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
  EXPECT_TRUE(result.timedOut);
  EXPECT_EQ(result.exitCode, 124);
  EXPECT_EQ(result.stdoutText, "started\n");
}

TEST(ProcessRunnerTest, CancelKillsWholeProcessGroup) {
  TempDir dir;
  const auto marker = dir / "survivor";
  std::atomic<bool> cancel{false};

  std::thread canceller([&] {
    std::this_thread::sleep_for(300ms);
    cancel = true;
  });
  // Дочерний процесс оболочки тоже должен быть завершён
  const auto result = runProcess(
      shellCommand("(sleep 1; touch " + marker.string() + ") & sleep 30"), &cancel);
  canceller.join();

  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(result.exitCode, 128 + 9);

  std::this_thread::sleep_for(1500ms);
  EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST(ProcessRunnerTest, OutputIsBounded) {
  ProcessSpec spec = shellCommand("head -c 5000 /dev/zero | tr '\\0' 'x'", 5s);
  spec.maxOutputBytes = 100;
  const auto result = runProcess(spec);
  EXPECT_EQ(result.exitCode, 0);
  EXPECT_TRUE(result.stdoutTruncated);
  EXPECT_EQ(result.stdoutText, std::string(100, 'x') + "(truncated)");
}

TEST(ProcessRunnerTest, TickCallbackRunsWhileWaiting) {
  int ticks = 0;
  runProcess(shellCommand("sleep 0.3", 5s), nullptr, [&] { ++ticks; });
  EXPECT_GT(ticks, 0);
}

TEST(ResultChannelTest, DeliversResultAcrossThreads) {
  ResultChannel<int> channel;
  EXPECT_FALSE(channel.finished());
  EXPECT_FALSE(channel.lastHeartbeat().has_value());
  EXPECT_FALSE(channel.waitResult(10ms).has_value());

  std::thread producer([&] {
    channel.heartbeat();
    std::this_thread::sleep_for(50ms);
    channel.setResult(42);
  });
  EXPECT_EQ(channel.waitResult(5s), std::optional<int>(42));
  producer.join();

  EXPECT_TRUE(channel.finished());
  EXPECT_TRUE(channel.lastHeartbeat().has_value());
  EXPECT_FALSE(channel.error().has_value());
}

TEST(ResultChannelTest, ErrorFinishesWithoutResult) {
  ResultChannel<std::string> channel;
  channel.setError("spawn failed");
  EXPECT_TRUE(channel.finished());
  EXPECT_FALSE(channel.waitResult(1s).has_value());
  EXPECT_THAT(channel.error().value_or(""), HasSubstr("spawn"));
}
