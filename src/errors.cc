#include "errors.hh"

namespace portal {

StrView Describe(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "Success";
  case ErrorKind::Configuration:
    return "Invalid configuration";
  case ErrorKind::HookSignals:
    return "Trapping exit signals failed";
  case ErrorKind::ConnectNetworkManager:
    return "Connecting to the system bus failed";
  case ErrorKind::StartNetworkManager:
    return "Starting the NetworkManager service failed";
  case ErrorKind::StartActiveNetworkManager:
    return "NetworkManager service did not become active";
  case ErrorKind::DeleteAccessPointProfiles:
    return "Deleting access point connection profiles failed";
  case ErrorKind::DeviceByInterface:
    return "Cannot find network device with interface name";
  case ErrorKind::NotAWiFiDevice:
    return "Not a WiFi device";
  case ErrorKind::NoWiFiDevice:
    return "Cannot find a WiFi device";
  case ErrorKind::StartHTTPServer:
    return "Cannot start HTTP server";
  case ErrorKind::CreateCaptivePortal:
    return "Creating the captive portal failed";
  case ErrorKind::StartHelper:
    return "Spawning dnsmasq failed";
  case ErrorKind::ListConnections:
    return "Getting existing connections failed";
  case ErrorKind::DeviceState:
    return "Getting device state failed";
  case ErrorKind::ListAccessPoints:
    return "Getting access points failed";
  case ErrorKind::SendResponse:
    return "Sending a response to the HTTP server failed";
  case ErrorKind::ReceiveCommand:
    return "Receiving network command failed";
  }
  return "Unknown error";
}

Str ExitResult::ToStr() const {
  Str ret(Describe(kind));
  if (!subject.empty()) {
    ret += ": ";
    ret += subject;
  }
  if (!status.Ok()) {
    ret += ". ";
    ret += status.ToStr();
  }
  return ret;
}

} // namespace portal
