#pragma once

#include <functional>

#include "epoll.hh"

namespace portal {

struct Timer : epoll::Listener {
  std::function<void()> handler;

  // Creates the timerfd & registers it in the current thread's epoll.
  Timer(Status &);
  ~Timer();

  // Setting `initial_s` to zero disarms the timer.
  void Arm(double initial_s, double interval_s, Status &);

  // Calls `handler` whenever the timer triggers. Part of the epoll::Listener
  // interface.
  void NotifyRead(Status &) override;

  const char *Name() const override;
};

} // namespace portal
