#include "supervisor.hh"

#include <csignal>
#include <pthread.h>
#include <thread>

#include <gtest/gtest.h>

#include "epoll.hh"

using namespace portal;

namespace {

struct SupervisorTest : ::testing::Test {
  Status status;
  Channel<Command> commands;

  void SetUp() override {
    epoll::Init(status);
    ASSERT_TRUE(OK(status)) << status.ToStr();
  }
};

// Waits for one command on a separate thread, then reports `result` back the
// way the orchestrator thread does.
std::thread FakeOrchestrator(Channel<Command> &commands,
                             ExitSupervisor &supervisor,
                             Optional<Command> &received) {
  return std::thread([&] {
    received = commands.Receive();
    supervisor.results.Send(ExitResult::Success());
  });
}

TEST_F(SupervisorTest, TerminationSignalBecomesExit) {
  ExitSupervisor supervisor(commands);
  supervisor.HookSignals(status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  supervisor.Open(status);
  ASSERT_TRUE(OK(status)) << status.ToStr();

  bool exit_seen = false;
  supervisor.on_exit = [&](const ExitResult &result) {
    exit_seen = result.Ok();
  };

  Optional<Command> received;
  std::thread orchestrator = FakeOrchestrator(commands, supervisor, received);
  ASSERT_EQ(pthread_kill(pthread_self(), SIGTERM), 0);

  epoll::Loop(status);
  orchestrator.join();

  EXPECT_TRUE(OK(status)) << status.ToStr();
  ASSERT_TRUE(received.has_value());
  EXPECT_TRUE(std::holds_alternative<command::Exit>(*received));
  EXPECT_TRUE(exit_seen);
  ASSERT_TRUE(supervisor.result.has_value());
  EXPECT_TRUE(supervisor.result->Ok());
  EXPECT_EQ(epoll::Count(), 0);
}

TEST_F(SupervisorTest, ActivityTimerSendsTimeout) {
  ExitSupervisor supervisor(commands);
  supervisor.Open(status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  supervisor.ArmActivityTimer(1, status);
  ASSERT_TRUE(OK(status)) << status.ToStr();

  Optional<Command> received;
  std::thread orchestrator = FakeOrchestrator(commands, supervisor, received);

  epoll::Loop(status);
  orchestrator.join();

  EXPECT_TRUE(OK(status)) << status.ToStr();
  ASSERT_TRUE(received.has_value());
  EXPECT_TRUE(std::holds_alternative<command::Timeout>(*received));
  EXPECT_EQ(supervisor.activity_timer, nullptr);
}

TEST_F(SupervisorTest, ZeroTimeoutDisablesTimer) {
  ExitSupervisor supervisor(commands);
  supervisor.ArmActivityTimer(0, status);
  EXPECT_TRUE(OK(status));
  EXPECT_EQ(supervisor.activity_timer, nullptr);
}

TEST(ExitCode, MapsResultToProcessStatus) {
  EXPECT_EQ(ExitCode(ExitResult::Success()), 0);
  Status cause;
  cause() += "no such device";
  EXPECT_EQ(ExitCode(ExitResult::Failure(ErrorKind::DeviceByInterface,
                                         std::move(cause), "wlan7")),
            1);
}

} // namespace
