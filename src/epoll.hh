#pragma once

#include "fd.hh"
#include "status.hh"

// Readiness notifications for the main thread.
//
// Every thread gets its own epoll instance on first use of `Init`. Only the
// main thread runs a `Loop`. The orchestrator thread blocks on its command
// channel & reaches the loop through Mailboxes.
namespace portal::epoll {

// Base class for objects that would like to receive epoll updates.
struct Listener {
  FD fd;

  bool notify_read = true;
  bool notify_write = false;

  Listener() = default;
  Listener(FD fd) : fd(std::move(fd)) {}

  virtual ~Listener() = default;

  // Also called on hangup & error so that the Listener can observe them
  // through read().
  virtual void NotifyRead(Status &) = 0;

  virtual void NotifyWrite(Status &) {};

  // Used in error messages.
  virtual const char *Name() const = 0;
};

void Init(Status &);

// Add a new listener to this epoll instance.
void Add(Listener *, Status &);

// Re-reads `notify_read` & `notify_write` of an added Listener.
void Mod(Listener *, Status &);

// Stops delivering events to the Listener, including events already fetched
// by the current iteration of `Loop`. Does nothing when `Init` was never
// called on this thread.
void Del(Listener *, Status &);

// Number of Listeners currently added.
int Count();

// Dispatches events until an error is returned or all Listeners are removed.
void Loop(Status &);

} // namespace portal::epoll
