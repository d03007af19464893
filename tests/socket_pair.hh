#pragma once

// Connected pair of stream sockets for driving http::Connection without a
// listening socket.

#include <sys/socket.h>
#include <unistd.h>

#include "http.hh"

namespace test {

using portal::Str;
using portal::StrView;

struct Client {
  int fd = -1;

  ~Client() {
    if (fd >= 0) {
      close(fd);
    }
  }

  void Write(StrView data) {
    ssize_t n = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    (void)n;
  }

  // Everything the server has sent so far.
  Str Read() {
    Str out;
    char buf[4096];
    while (true) {
      ssize_t n = recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
      if (n <= 0) {
        break;
      }
      out.append(buf, n);
    }
    return out;
  }

  // True if the server closed its end.
  bool Closed() {
    char c;
    return recv(fd, &c, 1, MSG_DONTWAIT) == 0;
  }

  void Shutdown() { shutdown(fd, SHUT_WR); }
};

// Creates a Connection owned by `server` & returns the peer socket in
// `client`.
inline http::Connection *Connect(http::Server &server, Client &client) {
  int fds[2];
  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
    return nullptr;
  }
  auto *c = new http::Connection();
  c->server = &server;
  c->fd = fds[0];
  c->addr = "test";
  server.connections.insert(c);
  client.fd = fds[1];
  return c;
}

} // namespace test
