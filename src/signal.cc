#include "signal.hh"

#include <cerrno>
#include <csignal>
#include <sys/signalfd.h>
#include <unistd.h>

#include "format.hh"

namespace portal {

SignalHandler::SignalHandler(std::initializer_list<int> signals,
                             Status &status) {
  sigset_t mask;
  sigemptyset(&mask);
  for (int signo : signals) {
    if (sigaddset(&mask, signo) == -1) {
      AppendErrorMessage(status) += f("sigaddset(%d)", signo);
      return;
    }
  }
  if (int err = pthread_sigmask(SIG_BLOCK, &mask, nullptr); err != 0) {
    errno = err;
    AppendErrorMessage(status) += "pthread_sigmask(SIG_BLOCK)";
    return;
  }
  fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
  if (!fd.Valid()) {
    AppendErrorMessage(status) += "signalfd";
    return;
  }
  epoll::Add(this, status);
  if (!OK(status)) {
    fd.Close();
  }
}

SignalHandler::~SignalHandler() {
  if (!fd.Valid()) {
    return;
  }
  Status status;
  epoll::Del(this, status);
  if (!OK(status)) {
    // Only possible when the epoll instance is already gone.
    status.Reset();
  }
  fd.Close();
}

void SignalHandler::NotifyRead(Status &status) {
  // A single wakeup may carry several queued signals.
  for (;;) {
    signalfd_siginfo info;
    ssize_t n = read(fd, &info, sizeof(info));
    if (n == -1 && errno == EAGAIN) {
      errno = 0;
      return;
    }
    if (n != sizeof(info)) {
      AppendErrorMessage(status) += "signalfd read()";
      return;
    }
    if (handler) {
      handler((int)info.ssi_signo, status);
      RETURN_ON_ERROR(status);
    }
  }
}

const char *SignalHandler::Name() const { return "SignalHandler"; }

} // namespace portal
