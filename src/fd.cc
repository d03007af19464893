#include "fd.hh"

#include <cerrno>
#include <unistd.h>

namespace portal {

FD::FD() : fd(-1) {}
FD::FD(int fd) : fd(fd) {}
FD::FD(FD &&other) : fd(other.Release()) {}
FD::~FD() { Close(); }

FD &FD::operator=(FD &&other) {
  if (this != &other) {
    Close();
    fd = other.Release();
  }
  return *this;
}

int FD::Release() {
  int released = fd;
  fd = -1;
  return released;
}

void FD::Close() {
  if (!Valid()) {
    return;
  }
  // The descriptor is gone even if close() reports an error. Keep errno clean
  // so that it doesn't leak into an unrelated Status.
  int saved = errno;
  close(fd);
  errno = saved;
  fd = -1;
}

} // namespace portal
