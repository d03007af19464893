#pragma once

#include "nm.hh"
#include "timing.hh"

namespace portal {

// Polls NetworkManager until it reports full or limited connectivity.
//
// Returns false when `timeout` elapses first. Errors are logged & treated as
// "no connectivity".
bool WaitForConnectivity(nm::NetworkManager &, Duration timeout, Duration poll);

// Polls the active connection until it leaves the Activating state or
// `timeout` elapses. Returns the last observed state.
nm::ActiveState WaitForActivation(nm::NetworkManager &,
                                  const nm::ObjectPath &active,
                                  Duration timeout, Duration poll, Status &);

} // namespace portal
