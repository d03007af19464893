#pragma once

// Steps executed once, before the orchestrator takes over the device.

#include "errors.hh"
#include "nm.hh"
#include "timing.hh"

namespace portal {

// Makes sure the NetworkManager service is running & removes hotspot profiles
// left behind by a previous run.
ExitResult InitNetworking(nm::NetworkManager &, const Timing &);

// Finds the wireless device to use - by interface name when one is given,
// otherwise the first WiFi device.
ExitResult LocateDevice(nm::NetworkManager &, const Optional<Str> &interface,
                        nm::Device &device);

} // namespace portal
