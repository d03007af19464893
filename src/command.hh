#pragma once

// Messages exchanged with the orchestrator thread.

#include "int.hh"
#include "nm.hh"
#include "str.hh"
#include "variant.hh"
#include "vec.hh"

namespace portal {

// Identifies the HTTP request waiting for a response. Echoed back by the
// orchestrator so that concurrent requests never receive each other's
// responses.
using Ticket = U64;

namespace command {
struct EnableAp {};
struct DisableAp {};
struct Current {
  Ticket ticket;
};
struct HasConnection {
  Ticket ticket;
};
// Rescan & report the visible networks. Also marks the portal as in use.
struct Activate {
  Ticket ticket;
};
struct Connect {
  Str ssid;
  Str identity;
  Str passphrase;
};
// The activity timeout expired.
struct Timeout {};
struct Exit {};
} // namespace command

using Command =
    std::variant<command::EnableAp, command::DisableAp, command::Current,
                 command::HasConnection, command::Activate, command::Connect,
                 command::Timeout, command::Exit>;

// Name of the command, for logging.
StrView CommandName(const Command &);

// Public projection of an access point.
struct Network {
  Str ssid;
  nm::Security security;

  bool operator==(const Network &) const = default;
};

namespace response {
struct Networks {
  Ticket ticket;
  Vec<Network> networks;
};
struct Current {
  Ticket ticket;
  bool apmode;
  bool connected;
};
struct HasConnection {
  Ticket ticket;
  bool result;
};
} // namespace response

using Response = std::variant<response::Networks, response::Current,
                              response::HasConnection>;

Ticket TicketOf(const Response &);

} // namespace portal
