#include "portal.hh"

#include "connectivity.hh"
#include "format.hh"
#include "log.hh"

namespace portal {

Optional<PortalSession> PortalManager::Raise(const nm::Device &device,
                                             ExitResult &error) {
  LOG << "Starting access point \"" << config.ssid << "\" on "
      << device.interface << "...";
  Status status;
  nm::HotspotSettings settings{.ssid = config.ssid,
                               .passphrase = config.passphrase,
                               .gateway = config.gateway};
  auto connection = manager.CreateHotspot(device, settings, status);
  if (!OK(status)) {
    error = ExitResult::Failure(ErrorKind::CreateCaptivePortal,
                                std::move(status), config.ssid);
    return std::nullopt;
  }

  // dnsmasq binds to the gateway address, which only appears on the interface
  // once the hotspot is activated.
  auto state = WaitForActivation(manager, connection.active,
                                 config.timing.activation_timeout,
                                 config.timing.activation_poll, status);
  if (OK(status) && state != nm::ActiveState::Activated) {
    AppendErrorMessage(status) +=
        f("Access point didn't activate (state %u)", (U32)state);
  }
  if (!OK(status)) {
    error = ExitResult::Failure(ErrorKind::CreateCaptivePortal,
                                std::move(status), config.ssid);
    PortalSession half_made{.connection = std::move(connection)};
    Stop(half_made);
    return std::nullopt;
  }
  LOG << "Access point \"" << config.ssid << "\" created";

  dnsmasq::Options options{.gateway = config.gateway,
                           .dhcp_range = config.dhcp_range,
                           .interface = device.interface};
  auto helper = launcher.Start(options, status);
  if (!OK(status)) {
    error = ExitResult::Failure(ErrorKind::StartHelper, std::move(status),
                                device.interface);
    PortalSession half_made{.connection = std::move(connection)};
    Stop(half_made);
    return std::nullopt;
  }

  return PortalSession{.connection = std::move(connection),
                       .helper = std::move(helper)};
}

void PortalManager::Stop(PortalSession &session) {
  LOG << "Stopping access point \"" << config.ssid << "\"...";
  session.helper.reset();

  if (!session.connection.active.empty()) {
    Status status;
    manager.Deactivate(session.connection.active, status);
    if (!OK(status)) {
      WARNING << "Deactivating the access point failed: " << status;
    }
  }
  if (!session.connection.profile.empty()) {
    Status status;
    manager.DeleteProfile(session.connection.profile, status);
    if (!OK(status)) {
      WARNING << "Deleting the access point profile failed: " << status;
    }
  }
  session.connection = {};
  Sleep(config.timing.portal_stop_settle);
  LOG << "Access point \"" << config.ssid << "\" stopped";
}

} // namespace portal
