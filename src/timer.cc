#include "timer.hh"

#include <cstdint>
#include <sys/timerfd.h>
#include <unistd.h>

#include "format.hh"

namespace portal {

Timer::Timer(Status &status) {
  fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
  if (fd == -1) {
    AppendErrorMessage(status) += "timerfd_create()";
    return;
  }
  epoll::Add(this, status);
  if (!OK(status)) {
    fd.Close();
  }
}

Timer::~Timer() {
  if (fd >= 0) {
    Status ignored;
    epoll::Del(this, ignored);
  }
}

static timespec SecondsToTimespec(double s) {
  return {.tv_sec = (time_t)s,
          .tv_nsec = (long)((s - (uint64_t)s) * 1000000000)};
}

void Timer::Arm(double initial_s, double interval_s, Status &status) {
  itimerspec ts = {.it_interval = SecondsToTimespec(interval_s),
                   .it_value = SecondsToTimespec(initial_s)};
  if (timerfd_settime(fd, 0, &ts, nullptr) == -1) {
    AppendErrorMessage(status) +=
        f("timerfd_settime(initial=%f s, interval=%f s)", initial_s, interval_s);
  }
}

void Timer::NotifyRead(Status &status) {
  uint64_t ticks;
  if (read(fd, &ticks, sizeof(ticks)) != sizeof(ticks)) {
    if (errno == EAGAIN) {
      errno = 0;
      return;
    }
    AppendErrorMessage(status) += "Timer::NotifyRead read()";
    return;
  }
  if (handler)
    handler();
}

const char *Timer::Name() const { return "Timer"; }

} // namespace portal
