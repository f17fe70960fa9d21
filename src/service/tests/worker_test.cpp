#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../include/statusregistry.hpp"
#include "../include/worker.hpp"
#include "testsupport.hpp"

using namespace std::chrono_literals;
using ::testing::ElementsAre;
using testsupport::ScriptedWorker;
using testsupport::StatusRecorder;
using testsupport::waitUntil;

namespace {

// Шаг спит до изменения конфигурации или остановки
class SleepyWorker : public Worker {
 public:
  SleepyWorker(const std::string &name, const WorkerContext &context)
      : Worker(name, context) {}
  ~SleepyWorker() override { stop(); }

  std::optional<std::string> deployTest() override { return std::nullopt; }

  std::atomic<int> wakes{0};
  std::atomic<int> configWakes{0};
  std::atomic<bool> sleeping{false};

 protected:
  void step() override {
    sleeping = true;
    const auto reason = sleep(10s, true);
    sleeping = false;
    if (reason == WakeReason::ConfigChange) ++configWakes;
    ++wakes;
  }
};

}  // namespace

class WorkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    recorder_ = std::make_shared<StatusRecorder>();
    source_ = std::make_shared<InMemoryConfigSource>(
        nlohmann::json{{"main", {{"period", 1}}}});
    context_.configSource = source_;
    context_.statusRegistry =
        std::make_shared<StatusRegistry>(StatusCallbacks{recorder_});
  }

  std::shared_ptr<StatusRecorder> recorder_;
  std::shared_ptr<InMemoryConfigSource> source_;
  WorkerContext context_;
};

TEST_F(WorkerTest, RequiresConfigurationSource) {
  WorkerContext empty;
  EXPECT_THROW(ScriptedWorker("A", empty), std::invalid_argument);
}

TEST_F(WorkerTest, StartRunsStepsUntilStopped) {
  ScriptedWorker worker("A", context_);
  EXPECT_FALSE(worker.isAlive());

  worker.start();
  ASSERT_TRUE(waitUntil([&] { return worker.steps >= 3; }));
  EXPECT_TRUE(worker.isAlive());
  EXPECT_TRUE(worker.isRunning());
  EXPECT_EQ(worker.status()->state(), WorkerState::Running);
  EXPECT_TRUE(worker.status()->runningFor().has_value());

  worker.stop();
  EXPECT_FALSE(worker.isAlive());
  EXPECT_EQ(worker.exits, 1);
  EXPECT_EQ(worker.status()->state(), WorkerState::Off);
  EXPECT_FALSE(worker.status()->runningFor().has_value());
  EXPECT_TRUE(worker.status()->notRunningFor().has_value());

  EXPECT_THAT(recorder_->states("A"),
              ElementsAre(WorkerState::Starting, WorkerState::Running,
                          WorkerState::Off));
}

TEST_F(WorkerTest, SecondStartIsIgnoredWhileAlive) {
  ScriptedWorker worker("A", context_);
  worker.start();
  worker.start();
  ASSERT_TRUE(waitUntil([&] { return worker.steps >= 1; }));
  worker.stop();
  EXPECT_EQ(worker.exits, 1);
}

TEST_F(WorkerTest, StopIsIdempotentAndSafeBeforeStart) {
  ScriptedWorker worker("A", context_);
  worker.stop();
  worker.start();
  worker.stop();
  worker.stop();
  EXPECT_EQ(worker.status()->state(), WorkerState::Off);
}

TEST_F(WorkerTest, StepExceptionEndsThreadWithFailure) {
  ScriptedWorker worker("A", context_);
  worker.crashNext = true;
  worker.start();

  ASSERT_TRUE(waitUntil([&] { return !worker.isAlive(); }));
  const auto snapshot = worker.status()->snapshot();
  EXPECT_EQ(snapshot.state, WorkerState::Failure);
  EXPECT_EQ(snapshot.failureKind, FailureKind::Step);
  EXPECT_EQ(snapshot.error, std::optional<std::string>("simulated crash"));
  EXPECT_EQ(worker.exits, 0);

  // Шаг не повторяется в том же потоке
  const int steps = worker.steps;
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(worker.steps, steps);
}

TEST_F(WorkerTest, AuthenticationFailureIsReportedSeparately) {
  ScriptedWorker worker("A", context_);
  worker.authFailureNext = true;
  worker.start();

  ASSERT_TRUE(waitUntil([&] { return !worker.isAlive(); }));
  const auto snapshot = worker.status()->snapshot();
  EXPECT_EQ(snapshot.state, WorkerState::Failure);
  EXPECT_EQ(snapshot.failureKind, FailureKind::Authentication);
  EXPECT_EQ(snapshot.error, std::optional<std::string>("token rejected"));
}

TEST_F(WorkerTest, ReviveRestartsCrashedWorker) {
  ScriptedWorker worker("A", context_);
  EXPECT_FALSE(worker.isAlive());

  worker.crashNext = true;
  worker.start();
  ASSERT_TRUE(waitUntil([&] { return !worker.isAlive(); }));
  recorder_->clear();

  EXPECT_TRUE(worker.revive());
  const int steps = worker.steps;
  ASSERT_TRUE(waitUntil([&] { return worker.steps > steps + 1; }));
  EXPECT_EQ(worker.status()->state(), WorkerState::Running);
  EXPECT_THAT(recorder_->states("A"),
              ElementsAre(WorkerState::Starting, WorkerState::Running));

  // Живой воркер не перезапускается
  EXPECT_FALSE(worker.revive());

  worker.stop();
  // Остановленный явно тоже
  EXPECT_FALSE(worker.revive());
  EXPECT_EQ(worker.status()->state(), WorkerState::Off);
}

TEST_F(WorkerTest, SleepWakesOnConfigurationChange) {
  SleepyWorker worker("Sleepy", context_);
  worker.start();
  ASSERT_TRUE(waitUntil([&] { return worker.sleeping.load(); }));

  int period = 2;
  ASSERT_TRUE(waitUntil(
      [&] {
        source_->update({{"main", {{"period", period++}}}});
        return worker.configWakes >= 1;
      },
      2s));

  worker.stop();
  EXPECT_EQ(worker.status()->state(), WorkerState::Off);
}

TEST_F(WorkerTest, StopInterruptsLongSleep) {
  SleepyWorker worker("Sleepy", context_);
  worker.start();
  ASSERT_TRUE(waitUntil([&] { return worker.sleeping.load(); }));

  const auto begin = std::chrono::steady_clock::now();
  worker.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
  EXPECT_EQ(worker.configWakes, 0);
}

TEST_F(WorkerTest, StatusIsSharedThroughRegistry) {
  ScriptedWorker worker("A", context_);
  EXPECT_EQ(context_.statusRegistry->find("A"), worker.status());
}
