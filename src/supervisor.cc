#include "supervisor.hh"

#include <csignal>
#include <cstring>

#include "log.hh"
#include "systemd.hh"

namespace portal {

ExitSupervisor::ExitSupervisor(Sink<Command> &commands)
    : commands(commands), results("ExitResult") {
  results.handler = [this](ExitResult r) { Finish(std::move(r)); };
}

void ExitSupervisor::HookSignals(Status &status) {
  signals = std::make_unique<SignalHandler>(
      std::initializer_list<int>{SIGINT, SIGTERM, SIGHUP}, status);
  if (!OK(status)) {
    AppendErrorMessage(status) += "Couldn't hook termination signals";
    signals.reset();
    return;
  }
  signals->handler = [this](int signo, Status &) {
    LOG << "Received " << strsignal(signo);
    if (!commands.Send(command::Exit{})) {
      VERBOSE << "Orchestrator is already gone";
    }
  };
}

void ExitSupervisor::Open(Status &status) { results.Open(status); }

void ExitSupervisor::ArmActivityTimer(U32 seconds, Status &status) {
  if (seconds == 0) {
    return;
  }
  activity_timer = std::make_unique<Timer>(status);
  RETURN_ON_ERROR(status);
  activity_timer->handler = [this]() {
    VERBOSE << "Activity timeout";
    if (!commands.Send(command::Timeout{})) {
      VERBOSE << "Orchestrator is already gone";
    }
  };
  activity_timer->Arm(seconds, 0, status);
  if (!OK(status)) {
    activity_timer.reset();
  }
}

void ExitSupervisor::Finish(ExitResult final_result) {
  result = std::move(final_result);
  if (on_exit) {
    on_exit(*result);
  }
  Stop();
}

void ExitSupervisor::Stop() {
  activity_timer.reset();
  signals.reset();
  results.Close();
  systemd::Stop();
}

int ExitCode(const ExitResult &result) {
  if (result.Ok()) {
    LOG << "Exiting";
    return 0;
  }
  ERROR << result.ToStr();
  return 1;
}

} // namespace portal
