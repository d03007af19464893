#include "startup.hh"

#include "log.hh"

namespace portal {

using Clock = std::chrono::steady_clock;

static ExitResult StartNetworkManagerService(nm::NetworkManager &manager,
                                             const Timing &timing) {
  Status status;
  Str state = manager.GetServiceState(status);
  if (!OK(status)) {
    // Systems without systemd may still run NetworkManager.
    WARNING << "Couldn't check the NetworkManager service: " << status;
    return ExitResult::Success();
  }
  if (state == "active") {
    VERBOSE << "NetworkManager service running";
    return ExitResult::Success();
  }

  LOG << "Starting NetworkManager service (currently " << state << ")...";
  manager.StartService(status);
  if (!OK(status)) {
    return ExitResult::Failure(ErrorKind::StartNetworkManager, std::move(status));
  }
  auto deadline = Clock::now() + timing.service_start_timeout;
  while (true) {
    state = manager.GetServiceState(status);
    if (!OK(status)) {
      return ExitResult::Failure(ErrorKind::StartNetworkManager,
                                 std::move(status));
    }
    if (state == "active") {
      LOG << "NetworkManager service started";
      return ExitResult::Success();
    }
    if (Clock::now() >= deadline) {
      break;
    }
    Sleep(timing.service_poll);
  }
  return ExitResult::Failure(ErrorKind::StartActiveNetworkManager,
                             std::move(status), state);
}

static ExitResult DeleteAccessPointProfiles(nm::NetworkManager &manager) {
  Status status;
  auto profiles = manager.GetProfiles(status);
  if (!OK(status)) {
    return ExitResult::Failure(ErrorKind::DeleteAccessPointProfiles,
                               std::move(status));
  }
  for (auto &profile : profiles) {
    if (!profile.IsAccessPoint()) {
      continue;
    }
    LOG << "Deleting access point connection profile \"" << profile.id << "\"";
    manager.DeleteProfile(profile.path, status);
    if (!OK(status)) {
      return ExitResult::Failure(ErrorKind::DeleteAccessPointProfiles,
                                 std::move(status), profile.id);
    }
  }
  return ExitResult::Success();
}

ExitResult InitNetworking(nm::NetworkManager &manager, const Timing &timing) {
  auto result = StartNetworkManagerService(manager, timing);
  if (!result.Ok()) {
    return result;
  }
  return DeleteAccessPointProfiles(manager);
}

ExitResult LocateDevice(nm::NetworkManager &manager,
                        const Optional<Str> &interface, nm::Device &device) {
  Status status;
  if (interface) {
    auto found = manager.GetDeviceByInterface(*interface, status);
    if (!OK(status) || !found) {
      return ExitResult::Failure(ErrorKind::DeviceByInterface,
                                 std::move(status), *interface);
    }
    if (found->type != nm::DeviceType::WiFi) {
      return ExitResult::Failure(ErrorKind::NotAWiFiDevice, std::move(status),
                                 *interface);
    }
    device = std::move(*found);
  } else {
    auto devices = manager.GetDevices(status);
    if (!OK(status)) {
      return ExitResult::Failure(ErrorKind::NoWiFiDevice, std::move(status));
    }
    auto *wifi = devices.FindIf(
        [](const nm::Device &d) { return d.type == nm::DeviceType::WiFi; });
    if (wifi == nullptr) {
      return ExitResult::Failure(ErrorKind::NoWiFiDevice, std::move(status));
    }
    device = *wifi;
  }
  LOG << "WiFi device: " << device.interface;
  return ExitResult::Success();
}

} // namespace portal
