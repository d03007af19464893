#include "scanner.hh"

#include "log.hh"

namespace portal {

Vec<nm::AccessPoint> FilterAccessPoints(Vec<nm::AccessPoint> access_points,
                                        StrView own_ssid) {
  Vec<nm::AccessPoint> result;
  for (auto &ap : access_points) {
    if (!IsValidUTF8(ap.ssid)) {
      continue;
    }
    if (ap.ssid == own_ssid) {
      continue;
    }
    result.push_back(std::move(ap));
  }
  return result;
}

static Str JoinSSIDs(const Vec<nm::AccessPoint> &access_points) {
  Str ret;
  for (auto &ap : access_points) {
    if (!ret.empty()) {
      ret += ", ";
    }
    ret += '"';
    ret += ap.ssid;
    ret += '"';
  }
  return ret;
}

Vec<nm::AccessPoint> ScanAccessPoints(nm::NetworkManager &manager,
                                      const nm::Device &device,
                                      StrView own_ssid, const Timing &timing,
                                      Status &status) {
  Status scan_status;
  manager.RequestScan(device, scan_status);
  if (OK(scan_status)) {
    Sleep(timing.scan_settle);
  } else {
    // Most likely a scan is already running.
    VERBOSE << "Scan request failed: " << scan_status;
  }

  // After stopping the hotspot it may take a while for the list of access
  // points to become available.
  for (int attempt = 1; attempt <= timing.scan_attempts; ++attempt) {
    auto access_points = manager.GetAccessPoints(device, status);
    if (!OK(status)) {
      AppendErrorMessage(status) += "Couldn't read access points of " + device.interface;
      return {};
    }
    access_points = FilterAccessPoints(std::move(access_points), own_ssid);
    if (!access_points.empty()) {
      LOG << "Access points: " << JoinSSIDs(access_points);
      return access_points;
    }
    VERBOSE << "No access points found - retry #" << attempt;
    if (attempt < timing.scan_attempts) {
      Sleep(timing.scan_retry);
    }
  }
  WARNING << "No access points found - giving up...";
  return {};
}

} // namespace portal
