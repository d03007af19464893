#include "mailbox.hh"

#include <cstdint>
#include <sys/eventfd.h>
#include <unistd.h>

namespace portal {

void Doorbell::Open(Status &status) {
  fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (fd == -1) {
    AppendErrorMessage(status) += "eventfd()";
    return;
  }
  epoll::Add(this, status);
  if (!OK(status)) {
    fd.Close();
    return;
  }
  std::lock_guard<std::mutex> lock(mutex);
  open = true;
}

void Doorbell::Close() {
  std::lock_guard<std::mutex> lock(mutex);
  if (!open) {
    return;
  }
  open = false;
  Status ignored;
  epoll::Del(this, ignored);
  fd.Close();
}

bool Doorbell::Ring(Fn<void()> while_locked) {
  std::lock_guard<std::mutex> lock(mutex);
  if (!open) {
    return false;
  }
  while_locked();
  uint64_t one = 1;
  if (write(fd, &one, sizeof(one)) != sizeof(one)) {
    // The counter only overflows after 2^64-2 unread rings. The value is
    // already queued & will be picked up by the next Drain.
    errno = 0;
  }
  return true;
}

void Doorbell::NotifyRead(Status &status) {
  uint64_t count;
  if (read(fd, &count, sizeof(count)) != sizeof(count)) {
    if (errno == EAGAIN) {
      errno = 0;
      return;
    }
    AppendErrorMessage(status) += "eventfd read()";
    return;
  }
  Drain();
}

} // namespace portal
