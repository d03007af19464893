#pragma once

#include <arpa/inet.h>

#include "int.hh"
#include "status.hh"
#include "str.hh"

namespace portal {

union __attribute__((__packed__)) IP {
  U32 addr; // network byte order
  U8 bytes[4];
  IP() : addr(0) {}
  IP(U8 a, U8 b, U8 c, U8 d) : bytes{a, b, c, d} {}
  // Constructor for address in network byte order
  constexpr IP(U32 addr) : addr(addr) {}
  bool operator==(const IP &other) const { return addr == other.addr; }
  bool operator!=(const IP &other) const { return addr != other.addr; }

  // Parses dotted-quad notation. Trailing characters are rejected.
  bool TryParse(StrView);

  const static IP kZero;
};

Str ToStr(IP);
static_assert(Stringer<IP>);

// IPv4 address & TCP port, written as "a.b.c.d:port".
struct Endpoint {
  IP ip;
  U16 port = 0;

  bool TryParse(StrView);
  Str ToStr() const;
};

} // namespace portal
