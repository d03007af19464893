#pragma once

namespace portal {

// Owning wrapper around a file descriptor. Closes it on destruction.
struct FD {
  int fd;

  FD();
  FD(int fd);
  FD(const FD &) = delete;
  FD(FD &&other);
  ~FD();

  operator int() const { return fd; }

  FD &operator=(const FD &) = delete;
  FD &operator=(FD &&other);

  bool Valid() const { return fd >= 0; }

  // Gives up ownership without closing.
  int Release();

  void Close();
};

} // namespace portal
