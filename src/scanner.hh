#pragma once

#include "nm.hh"
#include "timing.hh"

namespace portal {

// Drops access points that can't be offered to the user: our own portal &
// those whose SSID isn't valid UTF-8.
Vec<nm::AccessPoint> FilterAccessPoints(Vec<nm::AccessPoint>,
                                        StrView own_ssid);

// Requests a scan (best-effort) & waits for it to settle. Then reads the
// access points, retrying while none are visible.
//
// Running out of attempts is not an error - an empty list is returned.
// Failures to read the access point list are.
Vec<nm::AccessPoint> ScanAccessPoints(nm::NetworkManager &, const nm::Device &,
                                      StrView own_ssid, const Timing &,
                                      Status &);

} // namespace portal
