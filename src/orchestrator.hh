#pragma once

// State machine owning the wireless device.
//
// Commands arrive through a single Channel & are executed one at a time, to
// completion, on the orchestrator thread. Nothing else touches the device, the
// portal or the access point cache, so none of them need a lock.

#include "channel.hh"
#include "command.hh"
#include "config.hh"
#include "errors.hh"
#include "nm.hh"
#include "portal.hh"

namespace portal {

struct Orchestrator {
  nm::NetworkManager &manager;
  const Config &config;
  PortalManager portals;
  nm::Device device;

  // Present while the captive portal is up. At most one exists at a time.
  Optional<PortalSession> session;

  // Access points seen by the previous scan.
  Vec<nm::AccessPoint> access_points;

  // Set once a client asked for the network list. From then on the activity
  // timeout is ignored.
  bool activated = false;

  Channel<Command> &commands;
  Sink<Response> &responses;

  Orchestrator(nm::NetworkManager &, dnsmasq::Launcher &, const Config &,
               nm::Device, Channel<Command> &commands,
               Sink<Response> &responses);

  // Stops the portal if it's still up.
  ~Orchestrator();

  // Raises the portal unless a WiFi connection is already configured, then
  // fills the access point cache.
  ExitResult Start();

  // Executes commands until one of them ends the loop. The portal is torn down
  // before returning.
  ExitResult Run();

  // Executes a single command. Returns the final result when the loop should
  // end.
  Optional<ExitResult> Handle(Command);

  Optional<ExitResult> EnableAp();
  Optional<ExitResult> Current(Ticket);
  Optional<ExitResult> HasConnection(Ticket);
  Optional<ExitResult> Activate(Ticket);
  Optional<ExitResult> Connect(const command::Connect &);

  // Rescans & merges the result with the cached list.
  //
  // The returned list holds the fresh scan followed by every previously cached
  // access point whose SSID is still visible (so such SSIDs appear twice). The
  // cache itself is replaced with the fresh scan.
  Vec<nm::AccessPoint> RefreshAccessPoints(Status &);

  void StopPortal();
  Optional<ExitResult> RaisePortal();
  void DeleteProfilesWithSSID(StrView ssid);
  Optional<ExitResult> Reply(Response);
};

} // namespace portal
