#include "orchestrator.hh"

#include "connectivity.hh"
#include "log.hh"
#include "scanner.hh"

namespace portal {

Orchestrator::Orchestrator(nm::NetworkManager &manager,
                           dnsmasq::Launcher &launcher, const Config &config,
                           nm::Device device, Channel<Command> &commands,
                           Sink<Response> &responses)
    : manager(manager), config(config), portals(manager, launcher, config),
      device(std::move(device)), commands(commands), responses(responses) {}

Orchestrator::~Orchestrator() { StopPortal(); }

ExitResult Orchestrator::Start() {
  Status status;
  auto profiles = manager.GetProfiles(status);
  if (!OK(status)) {
    return ExitResult::Failure(ErrorKind::ListConnections, std::move(status));
  }
  if (nm::HasConnectionDefined(profiles)) {
    LOG << "A WiFi connection is already configured. Not starting the portal.";
  } else if (auto error = RaisePortal()) {
    return std::move(*error);
  }

  access_points =
      ScanAccessPoints(manager, device, config.ssid, config.timing, status);
  if (!OK(status)) {
    StopPortal();
    return ExitResult::Failure(ErrorKind::ListAccessPoints, std::move(status),
                               device.interface);
  }
  return ExitResult::Success();
}

ExitResult Orchestrator::Run() {
  ExitResult result;
  while (true) {
    auto command = commands.Receive();
    if (!command) {
      Status status;
      AppendErrorMessage(status) += "Command channel closed";
      result = ExitResult::Failure(ErrorKind::ReceiveCommand, std::move(status));
      break;
    }
    if (auto final_result = Handle(std::move(*command))) {
      result = std::move(*final_result);
      break;
    }
  }
  StopPortal();
  return result;
}

Optional<ExitResult> Orchestrator::Handle(Command command) {
  VERBOSE << "Executing " << CommandName(command);
  return std::visit(
      overloaded{
          [&](command::EnableAp &) { return EnableAp(); },
          [&](command::DisableAp &) -> Optional<ExitResult> {
            StopPortal();
            return std::nullopt;
          },
          [&](command::Current &c) { return Current(c.ticket); },
          [&](command::HasConnection &c) { return HasConnection(c.ticket); },
          [&](command::Activate &c) { return Activate(c.ticket); },
          [&](command::Connect &c) { return Connect(c); },
          [&](command::Timeout &) -> Optional<ExitResult> {
            if (activated) {
              VERBOSE << "Timeout ignored - a client is using the portal";
              return std::nullopt;
            }
            LOG << "Timeout reached. Exiting...";
            return ExitResult::Success();
          },
          [&](command::Exit &) -> Optional<ExitResult> {
            LOG << "Exiting...";
            return ExitResult::Success();
          },
      },
      command);
}

Optional<ExitResult> Orchestrator::EnableAp() {
  if (session) {
    VERBOSE << "Access point already running";
    return std::nullopt;
  }
  Status scan_status;
  manager.RequestScan(device, scan_status);
  if (OK(scan_status)) {
    Sleep(config.timing.scan_settle);
  }
  return RaisePortal();
}

Optional<ExitResult> Orchestrator::Current(Ticket ticket) {
  Status status;
  auto state = manager.GetDeviceState(device, status);
  if (!OK(status)) {
    return ExitResult::Failure(ErrorKind::DeviceState, std::move(status),
                               device.interface);
  }
  return Reply(response::Current{.ticket = ticket,
                                 .apmode = !session.has_value(),
                                 .connected = state == nm::DeviceState::Activated});
}

Optional<ExitResult> Orchestrator::HasConnection(Ticket ticket) {
  Status status;
  auto profiles = manager.GetProfiles(status);
  if (!OK(status)) {
    return ExitResult::Failure(ErrorKind::ListConnections, std::move(status));
  }
  return Reply(response::HasConnection{
      .ticket = ticket, .result = nm::HasConnectionDefined(profiles)});
}

Optional<ExitResult> Orchestrator::Activate(Ticket ticket) {
  activated = true;
  Status status;
  auto merged = RefreshAccessPoints(status);
  if (!OK(status)) {
    return ExitResult::Failure(ErrorKind::ListAccessPoints, std::move(status),
                               device.interface);
  }
  response::Networks networks{.ticket = ticket};
  for (auto &ap : merged) {
    networks.networks.push_back(
        Network{.ssid = ap.ssid, .security = ap.GetSecurity()});
  }
  return Reply(std::move(networks));
}

Optional<ExitResult> Orchestrator::Connect(const command::Connect &request) {
  DeleteProfilesWithSSID(request.ssid);
  StopPortal();

  Status status;
  auto merged = RefreshAccessPoints(status);
  if (!OK(status)) {
    return ExitResult::Failure(ErrorKind::ListAccessPoints, std::move(status),
                               request.ssid);
  }

  auto *ap = merged.FindIf([&](const nm::AccessPoint &candidate) {
    return candidate.ssid == request.ssid;
  });
  if (ap == nullptr) {
    WARNING << "Access point \"" << request.ssid << "\" not found";
  } else {
    LOG << "Connecting to access point \"" << request.ssid << "\"...";
    auto credentials = nm::MakeCredentials(ap->GetSecurity(), request.identity,
                                           request.passphrase);
    Status join_status;
    auto connection = manager.Connect(device, *ap, credentials, join_status);
    nm::ActiveState state = nm::ActiveState::Unknown;
    if (OK(join_status)) {
      state = WaitForActivation(manager, connection.active,
                                config.timing.activation_timeout,
                                config.timing.activation_poll, join_status);
    }
    if (OK(join_status) && state == nm::ActiveState::Activated) {
      if (WaitForConnectivity(manager, config.timing.connectivity_timeout,
                              config.timing.connectivity_poll)) {
        LOG << "Internet connectivity established";
      } else {
        WARNING << "Cannot establish Internet connectivity";
      }
      return ExitResult::Success();
    }
    if (OK(join_status)) {
      WARNING << "Connection to access point \"" << request.ssid
              << "\" not activated (state " << (U32)state << ")";
    } else {
      WARNING << "Error connecting to access point \"" << request.ssid
              << "\": " << join_status;
    }
    if (!connection.profile.empty()) {
      Status delete_status;
      manager.DeleteProfile(connection.profile, delete_status);
      if (!OK(delete_status)) {
        ERROR << "Deleting connection object failed: " << delete_status;
      }
    }
  }

  return RaisePortal();
}

Vec<nm::AccessPoint> Orchestrator::RefreshAccessPoints(Status &status) {
  auto fresh =
      ScanAccessPoints(manager, device, config.ssid, config.timing, status);
  if (!OK(status)) {
    return {};
  }
  Vec<nm::AccessPoint> merged = fresh;
  for (auto &cached : access_points) {
    bool still_visible = fresh.FindIf([&](const nm::AccessPoint &ap) {
      return ap.ssid == cached.ssid;
    }) != nullptr;
    if (still_visible) {
      merged.push_back(cached);
    }
  }
  access_points = std::move(fresh);
  return merged;
}

void Orchestrator::StopPortal() {
  if (session) {
    portals.Stop(*session);
    session.reset();
  }
}

Optional<ExitResult> Orchestrator::RaisePortal() {
  ExitResult error;
  session = portals.Raise(device, error);
  if (!session) {
    return std::move(error);
  }
  return std::nullopt;
}

void Orchestrator::DeleteProfilesWithSSID(StrView ssid) {
  Status status;
  auto profiles = manager.GetProfiles(status);
  if (!OK(status)) {
    WARNING << "Listing connection profiles failed: " << status;
    return;
  }
  for (auto &profile : profiles) {
    if (!profile.IsWireless() || profile.ssid != ssid) {
      continue;
    }
    LOG << "Deleting existing connection profile \"" << profile.id << "\"";
    Status delete_status;
    manager.DeleteProfile(profile.path, delete_status);
    if (!OK(delete_status)) {
      WARNING << "Deleting connection profile \"" << profile.id
              << "\" failed: " << delete_status;
    }
  }
}

Optional<ExitResult> Orchestrator::Reply(Response response) {
  if (!responses.Send(std::move(response))) {
    Status status;
    AppendErrorMessage(status) += "Response receiver is gone";
    return ExitResult::Failure(ErrorKind::SendResponse, std::move(status));
  }
  return std::nullopt;
}

} // namespace portal
