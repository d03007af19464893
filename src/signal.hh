#pragma once

#include <initializer_list>

#include "epoll.hh"
#include "fn.hh"
#include "status.hh"

namespace portal {

// Delivers a set of POSIX signals through the epoll loop (using signalfd).
//
// The signals are blocked for the calling thread. Threads started afterwards
// inherit the mask, so the signals are only ever observed through this handler.
// They stay blocked after the handler is destroyed, so late signals are
// ignored.
struct SignalHandler : epoll::Listener {
  // Called with the number of each delivered signal.
  Fn<void(int signo, Status &)> handler;

  SignalHandler(std::initializer_list<int> signals, Status &);
  ~SignalHandler();

  void NotifyRead(Status &) override;
  const char *Name() const override;
};

} // namespace portal
