#pragma once

#include "str.hh"

// Integration with the systemd service manager (using libsystemd).
namespace systemd {

// Call this function after epoll::Init to setup systemd integration.
//
// This function does nothing when not running under systemd.
//
// When running under systemd:
// 1. Configures logging (LOG, ERROR, etc.) to send structured entries to the
//    journal, if stdout is connected to it.
// 2. Publishes errors as the service STATUS.
// 3. Starts a watchdog timer if systemd watchdog is enabled.
void Init();

// Call this function after the service is ready to start accepting connections.
void Ready();

// Sets the free-form STATUS of the service.
void SetStatus(portal::StrView);

// Call this function when the service begins its shutdown. Stops the watchdog
// pings.
void Stop();

} // namespace systemd
