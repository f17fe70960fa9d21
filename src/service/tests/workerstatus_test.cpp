#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../include/statusregistry.hpp"
#include "../include/workerstatus.hpp"
#include "testsupport.hpp"

using ::testing::ElementsAre;
using testsupport::StatusRecorder;

namespace {

std::shared_ptr<const StatusCallbacks> callbacksOf(
    std::shared_ptr<StatusChangeCallback> callback) {
  return std::make_shared<const StatusCallbacks>(StatusCallbacks{std::move(callback)});
}

}  // namespace

TEST(WorkerStatusTest, ConstructionEmitsSyntheticStarting) {
  auto recorder = std::make_shared<StatusRecorder>();
  WorkerStatus status("camera", callbacksOf(recorder), {"capture"});

  auto events = recorder->events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].name, "camera");
  EXPECT_EQ(events[0].state, WorkerState::Starting);
  EXPECT_FALSE(events[0].previousState.has_value());
  EXPECT_EQ(events[0].tags.count("capture"), 1u);
}

TEST(WorkerStatusTest, CallbackFiresOnlyWhenStateChanges) {
  auto recorder = std::make_shared<StatusRecorder>();
  WorkerStatus status("camera", callbacksOf(recorder));

  status.setRunning();
  status.setRunning();
  status.setFailure("boom");
  status.setFailure("boom again");
  status.setOff();
  status.setOff();
  status.setRunning();

  EXPECT_THAT(recorder->states("camera"),
              ElementsAre(WorkerState::Starting, WorkerState::Running,
                          WorkerState::Failure, WorkerState::Off,
                          WorkerState::Running));
}

TEST(WorkerStatusTest, EventCarriesPreviousState) {
  auto recorder = std::make_shared<StatusRecorder>();
  WorkerStatus status("upload", callbacksOf(recorder));
  status.setRunning();
  status.setFailure("disk full");

  auto events = recorder->events();
  ASSERT_EQ(events.size(), 3u);
  ASSERT_TRUE(events[2].previousState.has_value());
  EXPECT_EQ(*events[2].previousState, WorkerState::Running);
  EXPECT_EQ(events[2].error.value_or(""), "disk full");
  EXPECT_EQ(events[2].failureKind, FailureKind::Step);
}

TEST(WorkerStatusTest, StartedRunningSetOnlyWhileRunning) {
  WorkerStatus status("camera", nullptr);

  const std::vector<std::function<void()>> transitions = {
      [&] { status.setRunning(); },   [&] { status.setOff(); },
      [&] { status.setRunning(); },   [&] { status.setFailure("x"); },
      [&] { status.setStarting(); },  [&] { status.setRunning(); },
      [&] { status.setRunning(); },   [&] { status.setFailure("y"); }};

  for (const auto &transition : transitions) {
    transition();
    const auto snapshot = status.snapshot();
    EXPECT_EQ(snapshot.startedRunning.has_value(),
              snapshot.state == WorkerState::Running);
  }
}

TEST(WorkerStatusTest, LeavingRunningStampsLastTimeRunning) {
  WorkerStatus status("camera", nullptr);
  EXPECT_FALSE(status.snapshot().lastTimeRunning.has_value());
  EXPECT_FALSE(status.notRunningFor().has_value());

  status.setRunning();
  EXPECT_TRUE(status.runningFor().has_value());
  status.setOff();

  const auto snapshot = status.snapshot();
  EXPECT_TRUE(snapshot.lastTimeRunning.has_value());
  EXPECT_FALSE(status.runningFor().has_value());
  EXPECT_TRUE(status.notRunningFor().has_value());
}

TEST(WorkerStatusTest, RunningClearsPreviousError) {
  WorkerStatus status("camera", nullptr);
  status.setFailure("token mismatch", FailureKind::Authentication);
  EXPECT_EQ(status.snapshot().failureKind, FailureKind::Authentication);

  status.setRunning();
  const auto snapshot = status.snapshot();
  EXPECT_FALSE(snapshot.error.has_value());
  EXPECT_EQ(snapshot.failureKind, FailureKind::None);
}

TEST(WorkerStatusTest, CallbackExceptionDoesNotPropagate) {
  auto throwing = std::make_shared<FunctionStatusCallback>(
      [](const StatusSnapshot &) { throw std::runtime_error("callback failed"); });
  auto recorder = std::make_shared<StatusRecorder>();
  auto callbacks = std::make_shared<const StatusCallbacks>(
      StatusCallbacks{throwing, recorder});

  std::unique_ptr<WorkerStatus> status;
  ASSERT_NO_THROW(status = std::make_unique<WorkerStatus>("camera", callbacks));
  EXPECT_NO_THROW(status->setRunning());
  // Следующий обработчик в списке всё равно вызывается
  EXPECT_THAT(recorder->states("camera"),
              ElementsAre(WorkerState::Starting, WorkerState::Running));
}

TEST(WorkerStatusTest, NonStandardCallbackExceptionDoesNotPropagate) {
  auto throwing = std::make_shared<FunctionStatusCallback>(
      [](const StatusSnapshot &) { throw 42; });
  auto recorder = std::make_shared<StatusRecorder>();
  auto callbacks = std::make_shared<const StatusCallbacks>(
      StatusCallbacks{throwing, recorder});

  WorkerStatus status("camera", callbacks);
  EXPECT_NO_THROW(status.setRunning());
  EXPECT_NO_THROW(status.setFailure("boom"));
  EXPECT_THAT(recorder->states("camera"),
              ElementsAre(WorkerState::Starting, WorkerState::Running,
                          WorkerState::Failure));
}

TEST(WorkerStatusTest, MiscKeepsInsertionOrderAndReplacesValues) {
  WorkerStatus status("executor", nullptr);
  status.setMisc("current command", "no command running");
  status.setMisc("previous command output", "no previous command");
  status.setMisc("current command", "running for 3 seconds\nls");

  auto snapshot = status.snapshot();
  ASSERT_EQ(snapshot.misc.size(), 2u);
  EXPECT_EQ(snapshot.misc[0].first, "current command");
  EXPECT_EQ(snapshot.misc[0].second, "running for 3 seconds\nls");
  EXPECT_EQ(snapshot.miscValue("previous command output").value_or(""),
            "no previous command");

  status.removeMisc("current command");
  EXPECT_FALSE(status.snapshot().miscValue("current command").has_value());
}

TEST(WorkerStatusTest, TagsAddAndRemove) {
  WorkerStatus status("executor", nullptr);
  status.addTag("commands");
  status.addTag("network");
  status.removeTag("network");
  EXPECT_THAT(status.snapshot().tags, ElementsAre("commands"));
}

TEST(WorkerStatusTest, SnapshotJsonUsesLowercaseStates) {
  WorkerStatus status("camera", nullptr);
  status.setFailure("lens cap on");
  const auto json = status.snapshot().toJson();
  EXPECT_EQ(json.at("name"), "camera");
  EXPECT_EQ(json.at("state"), "failure");
  EXPECT_EQ(json.at("error"), "lens cap on");
}

TEST(WorkerStatusTest, SeverityOrdering) {
  EXPECT_LT(severity(WorkerState::Running), severity(WorkerState::Starting));
  EXPECT_LT(severity(WorkerState::Starting), severity(WorkerState::Off));
  EXPECT_LT(severity(WorkerState::Off), severity(WorkerState::Failure));
}

TEST(StatusRegistryTest, CreateReturnsExistingRecord) {
  auto recorder = std::make_shared<StatusRecorder>();
  StatusRegistry registry({recorder});

  auto first = registry.createStatus("camera");
  auto second = registry.createStatus("camera");
  EXPECT_EQ(first, second);
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_EQ(recorder->states("camera").size(), 1u);
}

TEST(StatusRegistryTest, SnapshotIsDeepCopy) {
  StatusRegistry registry;
  auto status = registry.createStatus("camera");
  status->setRunning();

  auto snapshot = registry.snapshot();
  status->setFailure("later");

  ASSERT_EQ(snapshot.count("camera"), 1u);
  EXPECT_EQ(snapshot.at("camera").state, WorkerState::Running);
  EXPECT_EQ(registry.snapshot().at("camera").state, WorkerState::Failure);
}

TEST(StatusRegistryTest, RemoveDropsRecord) {
  StatusRegistry registry;
  registry.createStatus("camera");
  registry.createStatus("upload");
  registry.remove("camera");
  EXPECT_EQ(registry.find("camera"), nullptr);
  EXPECT_NE(registry.find("upload"), nullptr);
  EXPECT_EQ(registry.size(), 1u);
}
