#pragma once

// Lifecycle of the captive portal: the hotspot profile in NetworkManager plus
// the dnsmasq helper serving its clients.

#include "config.hh"
#include "dnsmasq.hh"
#include "errors.hh"
#include "nm.hh"

namespace portal {

struct PortalSession {
  nm::Connection connection;
  UniquePtr<dnsmasq::Instance> helper;
};

struct PortalManager {
  nm::NetworkManager &manager;
  dnsmasq::Launcher &launcher;
  const Config &config;

  PortalManager(nm::NetworkManager &manager, dnsmasq::Launcher &launcher,
                const Config &config)
      : manager(manager), launcher(launcher), config(config) {}

  // Creates the hotspot on `device`, waits until NetworkManager activates it &
  // starts the helper bound to it.
  //
  // On failure `error` is set (CreateCaptivePortal or StartHelper) & nothing is
  // left behind: a hotspot that didn't activate or whose helper failed is
  // removed again.
  Optional<PortalSession> Raise(const nm::Device &device, ExitResult &error);

  // Stops the helper, deactivates & deletes the hotspot profile. Failures are
  // logged & otherwise ignored.
  void Stop(PortalSession &session);
};

} // namespace portal
