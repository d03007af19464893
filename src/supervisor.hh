#pragma once

// Turns outside events into commands & the final result into an exit code.
//
// Lives on the epoll thread.

#include "channel.hh"
#include "command.hh"
#include "errors.hh"
#include "fn.hh"
#include "mailbox.hh"
#include "signal.hh"
#include "timer.hh"
#include "unique_ptr.hh"

namespace portal {

struct ExitSupervisor {
  Sink<Command> &commands;
  UniquePtr<SignalHandler> signals;
  UniquePtr<Timer> activity_timer;

  // Receives the result of the orchestrator thread.
  Mailbox<ExitResult> results;

  // Set once the orchestrator finished.
  Optional<ExitResult> result;

  // Called on the epoll thread with the final result, before the supervisor
  // stops its own listeners. Should close everything else registered in
  // epoll so that the loop can end.
  Fn<void(const ExitResult &)> on_exit;

  ExitSupervisor(Sink<Command> &);

  // SIGINT, SIGTERM & SIGHUP become command::Exit. Must be called before any
  // other thread is started.
  void HookSignals(Status &);

  // Opens the result mailbox.
  void Open(Status &);

  // Sends command::Timeout once after `seconds`. Zero disables the timer.
  void ArmActivityTimer(U32 seconds, Status &);

  // Stores the result & shuts down everything that keeps the epoll loop
  // running.
  void Finish(ExitResult);

  void Stop();
};

// Logs the outcome & returns the process exit code.
int ExitCode(const ExitResult &);

} // namespace portal
