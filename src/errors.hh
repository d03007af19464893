#pragma once

#include "status.hh"
#include "str.hh"

namespace portal {

// Reasons for the process to stop with a failure.
//
// The first group can only happen during startup, the second one while the
// orchestrator loop is running.
enum class ErrorKind {
  None,

  Configuration,
  HookSignals,
  ConnectNetworkManager,
  StartNetworkManager,
  StartActiveNetworkManager,
  DeleteAccessPointProfiles,
  DeviceByInterface,
  NotAWiFiDevice,
  NoWiFiDevice,
  StartHTTPServer,

  CreateCaptivePortal,
  StartHelper,
  ListConnections,
  DeviceState,
  ListAccessPoints,
  SendResponse,
  ReceiveCommand,
};

// Short, user-facing description. Used as the body of HTTP 500 responses.
StrView Describe(ErrorKind);

// Final outcome of the orchestrator (or of a startup step).
struct ExitResult {
  ErrorKind kind = ErrorKind::None;

  // Offending interface name, SSID or address. May be empty.
  Str subject;

  // Underlying cause, including the OS error if there was one.
  Status status;

  static ExitResult Success() { return {}; }
  static ExitResult Failure(ErrorKind kind, Status status, Str subject = "") {
    return ExitResult{
        .kind = kind, .subject = std::move(subject), .status = std::move(status)};
  }

  bool Ok() const { return kind == ErrorKind::None; }

  // "<description>[: <subject>]. <cause>"
  Str ToStr() const;
};

} // namespace portal
