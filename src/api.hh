#pragma once

// HTTP API of the captive portal & the static files of its web UI.
//
// Runs on the epoll thread. Requests that need the orchestrator are turned
// into commands & deferred until the matching response arrives.

#include <map>

#include "channel.hh"
#include "command.hh"
#include "config.hh"
#include "errors.hh"
#include "http.hh"
#include "mailbox.hh"

namespace api {

using portal::Optional;
using portal::Path;
using portal::Status;
using portal::Str;
using portal::StrView;
using portal::Ticket;

// Content-Type of a static file with the given suffix (".html", ".js", ...).
StrView ContentTypeFor(StrView suffix);

// Maps a request path to a file under `root`. "/" means "index.html". Returns
// nothing for paths that try to escape `root`.
Optional<Path> ResolveStatic(const Path &root, StrView request_path);

struct PortalAPI {
  const portal::Config &config;
  portal::Sink<portal::Command> &commands;
  http::Server server;

  // Responses coming back from the orchestrator thread.
  portal::Mailbox<portal::Response> responses;

  struct Pending {
    http::Connection *connection;
    bool (*matches)(const portal::Response &);
  };

  // Requests waiting for the orchestrator, by ticket.
  std::map<Ticket, Pending> pending;
  Ticket next_ticket = 1;

  PortalAPI(const portal::Config &, portal::Sink<portal::Command> &);
  ~PortalAPI();

  // Opens the response mailbox & starts listening. Must be called on the epoll
  // thread.
  void Start(Status &);

  // Stops accepting requests & closes all connections.
  void Stop();

  void HandleRequest(http::Connection &, http::Request &, http::Response &);

  // Answers the request waiting for this response.
  void Deliver(portal::Response);

  // Answers every waiting request. Failures are described by `result`, a
  // successful exit is reported as "Shutting down".
  void FailPending(const portal::ExitResult &result);

  // Sends `command` & defers the response until a `T` with the same ticket
  // arrives.
  template <typename T, typename MakeCommand>
  void Await(http::Connection &, http::Response &, MakeCommand make_command);

  // Sends a command that is answered immediately with an empty 200.
  void Enqueue(http::Response &, portal::Command);

  void ServeStatic(http::Request &, http::Response &);
};

} // namespace api
