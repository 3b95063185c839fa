#include "container/handle.hpp"

#include <chrono>
#include <stdexcept>

#include "container/mock_runtime.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::_;
using ::testing::AllOf;
using ::testing::DoAll;
using ::testing::Ge;
using ::testing::Invoke;
using ::testing::Le;
using ::testing::Return;
using ::testing::SetArgPointee;
using ::testing::StrictMock;

using container::ContainerConfig;
using container::MockContainerRuntime;
using container::SandboxHandle;
using State = container::SandboxHandle::State;

void ExpectCreate(MockContainerRuntime* runtime, const std::string& id) {
  EXPECT_CALL(*runtime, CreateContainer(_, _, _))
      .WillOnce(DoAll(SetArgPointee<1>(id), Return(true)));
}

// NOLINTNEXTLINE
TEST(SandboxHandle, NothingToRemoveBeforeCreation) {
  StrictMock<MockContainerRuntime> runtime;
  SandboxHandle handle(&runtime);
  std::string error_msg;
  EXPECT_TRUE(handle.Remove(&error_msg));
  EXPECT_EQ(handle.GetState(), State::kRemoved);
}

// NOLINTNEXTLINE
TEST(SandboxHandle, FullLifecycle) {
  StrictMock<MockContainerRuntime> runtime;
  ExpectCreate(&runtime, "abc");
  EXPECT_CALL(runtime, StartContainer("abc", _)).WillOnce(Return(true));
  EXPECT_CALL(runtime, InspectContainer("abc", _, _, _))
      .WillOnce(DoAll(SetArgPointee<2>(container::RunningState()),
                      Return(true)))
      .WillOnce(DoAll(SetArgPointee<2>(container::ExitedState(3)),
                      Return(true)));
  EXPECT_CALL(runtime, RemoveContainer("abc", _)).WillOnce(Return(true));

  SandboxHandle handle(&runtime);
  std::string error_msg;
  ASSERT_TRUE(handle.Create(ContainerConfig(), &error_msg));
  EXPECT_EQ(handle.GetState(), State::kCreated);
  ASSERT_TRUE(handle.Start(&error_msg));
  EXPECT_EQ(handle.GetState(), State::kStarted);
  EXPECT_TRUE(handle.WaitForExit(10000, 1));
  EXPECT_EQ(handle.GetState(), State::kExited);
  EXPECT_EQ(handle.ExitCode(), 3);
  EXPECT_TRUE(handle.Remove(&error_msg));
  EXPECT_EQ(handle.GetState(), State::kRemoved);
}

// NOLINTNEXTLINE
TEST(SandboxHandle, PartialCreationIsRemovedOnDestruction) {
  StrictMock<MockContainerRuntime> runtime;
  EXPECT_CALL(runtime, CreateContainer(_, _, _))
      .WillOnce(DoAll(SetArgPointee<1>("partial"),
                      SetArgPointee<2>("bad mount"), Return(false)));
  EXPECT_CALL(runtime, RemoveContainer("partial", _)).WillOnce(Return(true));
  SandboxHandle handle(&runtime);
  std::string error_msg;
  EXPECT_FALSE(handle.Create(ContainerConfig(), &error_msg));
  EXPECT_EQ(error_msg, "bad mount");
  EXPECT_EQ(handle.Id(), "partial");
}

// NOLINTNEXTLINE
TEST(SandboxHandle, FailedCreationWithoutIdRemovesNothing) {
  StrictMock<MockContainerRuntime> runtime;
  EXPECT_CALL(runtime, CreateContainer(_, _, _)).WillOnce(Return(false));
  SandboxHandle handle(&runtime);
  std::string error_msg;
  EXPECT_FALSE(handle.Create(ContainerConfig(), &error_msg));
  EXPECT_EQ(handle.GetState(), State::kNew);
}

// NOLINTNEXTLINE
TEST(SandboxHandle, TimesOut) {
  StrictMock<MockContainerRuntime> runtime;
  ExpectCreate(&runtime, "abc");
  EXPECT_CALL(runtime, StartContainer("abc", _)).WillOnce(Return(true));
  EXPECT_CALL(runtime, InspectContainer("abc", _, _, _))
      .WillRepeatedly(
          DoAll(SetArgPointee<2>(container::RunningState()), Return(true)));
  EXPECT_CALL(runtime, RemoveContainer("abc", _)).WillOnce(Return(true));

  SandboxHandle handle(&runtime);
  std::string error_msg;
  ASSERT_TRUE(handle.Create(ContainerConfig(), &error_msg));
  ASSERT_TRUE(handle.Start(&error_msg));
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(handle.WaitForExit(100, 10));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_GE(elapsed, std::chrono::milliseconds(100));
  EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
  EXPECT_EQ(handle.GetState(), State::kTimedOut);
}

// NOLINTNEXTLINE
TEST(SandboxHandle, InspectFailuresKeepPolling) {
  StrictMock<MockContainerRuntime> runtime;
  ExpectCreate(&runtime, "abc");
  EXPECT_CALL(runtime, StartContainer("abc", _)).WillOnce(Return(true));
  EXPECT_CALL(runtime, InspectContainer("abc", _, _, _))
      .WillOnce(Return(false))
      .WillOnce(Return(false))
      .WillOnce(DoAll(SetArgPointee<2>(container::ExitedState(0)),
                      Return(true)));
  EXPECT_CALL(runtime, RemoveContainer("abc", _)).WillOnce(Return(true));

  SandboxHandle handle(&runtime);
  std::string error_msg;
  ASSERT_TRUE(handle.Create(ContainerConfig(), &error_msg));
  ASSERT_TRUE(handle.Start(&error_msg));
  EXPECT_TRUE(handle.WaitForExit(10000, 1));
  EXPECT_EQ(handle.ExitCode(), 0);
}

// NOLINTNEXTLINE
TEST(SandboxHandle, FailedRemovalStillEndsRemoved) {
  StrictMock<MockContainerRuntime> runtime;
  ExpectCreate(&runtime, "abc");
  EXPECT_CALL(runtime, RemoveContainer("abc", _))
      .WillOnce(DoAll(SetArgPointee<1>("daemon gone"), Return(false)));
  SandboxHandle handle(&runtime);
  std::string error_msg;
  ASSERT_TRUE(handle.Create(ContainerConfig(), &error_msg));
  EXPECT_FALSE(handle.Remove(&error_msg));
  EXPECT_EQ(error_msg, "daemon gone");
  EXPECT_EQ(handle.GetState(), State::kRemoved);
  // Removal is not attempted again.
  EXPECT_TRUE(handle.Remove(&error_msg));
}

// NOLINTNEXTLINE
TEST(SandboxHandle, ThrowingRemovalIsNotRetried) {
  StrictMock<MockContainerRuntime> runtime;
  ExpectCreate(&runtime, "abc");
  EXPECT_CALL(runtime, RemoveContainer("abc", _))
      .WillOnce(Invoke([](const std::string&, std::string*) -> bool {
        throw std::runtime_error("client crashed");
      }));
  {
    SandboxHandle handle(&runtime);
    std::string error_msg;
    ASSERT_TRUE(handle.Create(ContainerConfig(), &error_msg));
    EXPECT_THROW(handle.Remove(&error_msg), std::runtime_error);  // NOLINT
    EXPECT_EQ(handle.GetState(), State::kRemoved);
  }
}

// NOLINTNEXTLINE
TEST(SandboxHandle, DestructorSurvivesThrowingRemoval) {
  StrictMock<MockContainerRuntime> runtime;
  ExpectCreate(&runtime, "abc");
  EXPECT_CALL(runtime, RemoveContainer("abc", _))
      .WillOnce(Invoke([](const std::string&, std::string*) -> bool {
        throw std::runtime_error("client crashed");
      }));
  SandboxHandle handle(&runtime);
  std::string error_msg;
  ASSERT_TRUE(handle.Create(ContainerConfig(), &error_msg));
}

// NOLINTNEXTLINE
TEST(SandboxHandle, InspectIsBoundedByTheDeadline) {
  StrictMock<MockContainerRuntime> runtime;
  ExpectCreate(&runtime, "abc");
  EXPECT_CALL(runtime, StartContainer("abc", _)).WillOnce(Return(true));
  EXPECT_CALL(runtime, InspectContainer("abc", AllOf(Ge(10), Le(100)), _, _))
      .WillRepeatedly(
          DoAll(SetArgPointee<2>(container::RunningState()), Return(true)));
  EXPECT_CALL(runtime, RemoveContainer("abc", _)).WillOnce(Return(true));

  SandboxHandle handle(&runtime);
  std::string error_msg;
  ASSERT_TRUE(handle.Create(ContainerConfig(), &error_msg));
  ASSERT_TRUE(handle.Start(&error_msg));
  EXPECT_FALSE(handle.WaitForExit(100, 10));
}

// NOLINTNEXTLINE
TEST(SandboxHandle, LogsAreCapped) {
  StrictMock<MockContainerRuntime> runtime;
  ExpectCreate(&runtime, "abc");
  EXPECT_CALL(runtime, ContainerLogs("abc", 8, _, _))
      .WillOnce(DoAll(SetArgPointee<2>(std::string(1 << 20, 'x') + "the end"),
                      Return(true)));
  EXPECT_CALL(runtime, RemoveContainer("abc", _)).WillOnce(Return(true));

  SandboxHandle handle(&runtime);
  std::string error_msg;
  ASSERT_TRUE(handle.Create(ContainerConfig(), &error_msg));
  std::string logs;
  ASSERT_TRUE(handle.Logs(8, &logs, &error_msg));
  EXPECT_EQ(logs, "xthe end");
}

// NOLINTNEXTLINE
TEST(SandboxHandle, StartBeforeCreateThrows) {
  StrictMock<MockContainerRuntime> runtime;
  SandboxHandle handle(&runtime);
  std::string error_msg;
  EXPECT_ANY_THROW(handle.Start(&error_msg));
}

}  // namespace
