#pragma once

// In-memory NetworkManager & dnsmasq used by the tests.

#include <algorithm>
#include <set>

#include "config.hh"
#include "dnsmasq.hh"
#include "format.hh"
#include "nm.hh"

namespace fake {

using namespace portal;

inline nm::AccessPoint OpenAP(Str ssid) {
  return nm::AccessPoint{.path = "/AccessPoint/" + ssid, .ssid = ssid};
}

inline nm::AccessPoint WpaAP(Str ssid) {
  return nm::AccessPoint{.path = "/AccessPoint/" + ssid,
                         .ssid = ssid,
                         .flags = nm::kApFlagPrivacy,
                         .rsn_flags = nm::kApSecurityKeyMgmtPSK};
}

inline nm::Profile WifiProfile(Str path, Str ssid) {
  return nm::Profile{.path = std::move(path),
                     .id = ssid,
                     .type = "802-11-wireless",
                     .mode = "infrastructure",
                     .ssid = ssid};
}

inline nm::Device WifiDevice() {
  return nm::Device{.path = "/Devices/3",
                    .interface = "wlan0",
                    .type = nm::DeviceType::WiFi};
}

struct NetworkManager : nm::NetworkManager {
  Vec<nm::Device> devices = {
      nm::Device{.path = "/Devices/1",
                 .interface = "eth0",
                 .type = nm::DeviceType::Ethernet},
      WifiDevice(),
  };
  Vec<nm::AccessPoint> access_points;
  Vec<nm::Profile> profiles;
  std::set<nm::ObjectPath> active;
  nm::DeviceState device_state = nm::DeviceState::Disconnected;
  nm::Connectivity connectivity = nm::Connectivity::Full;
  Str service_state = "active";
  Str service_state_after_start = "active";

  // States returned by GetActiveState, front first. The last one repeats.
  Vec<nm::ActiveState> join_states = {nm::ActiveState::Activated};

  // Same as `join_states`, for active connections of hotspots.
  Vec<nm::ActiveState> hotspot_states = {nm::ActiveState::Activated};
  std::set<nm::ObjectPath> hotspots;

  // The first `empty_reads` calls of GetAccessPoints return nothing.
  int empty_reads = 0;

  bool fail_request_scan = false;
  bool fail_get_access_points = false;
  bool fail_get_profiles = false;
  bool fail_device_state = false;
  bool fail_create_hotspot = false;
  bool fail_deactivate = false;
  bool fail_connect = false;
  bool fail_connectivity = false;
  bool fail_service_state = false;
  bool fail_start_service = false;

  int scan_requests = 0;
  int access_point_reads = 0;
  int hotspots_created = 0;
  int deactivations = 0;
  int deletions = 0;
  int joins = 0;
  int connectivity_checks = 0;
  int service_starts = 0;
  int active_state_reads = 0;
  int hotspot_state_reads = 0;
  int next_id = 10;

  Optional<nm::HotspotSettings> last_hotspot;
  Optional<nm::Credentials> last_credentials;

  static void Fail(Status &status, StrView what) {
    AppendErrorMessage(status) += Str(what) + " failed";
  }

  Vec<nm::Device> GetDevices(Status &) override { return devices; }

  Optional<nm::Device> GetDeviceByInterface(StrView interface,
                                            Status &) override {
    for (auto &device : devices) {
      if (device.interface == interface) {
        return device;
      }
    }
    return std::nullopt;
  }

  nm::DeviceState GetDeviceState(const nm::Device &, Status &status) override {
    if (fail_device_state) {
      Fail(status, "GetDeviceState");
    }
    return device_state;
  }

  void RequestScan(const nm::Device &, Status &status) override {
    ++scan_requests;
    if (fail_request_scan) {
      Fail(status, "RequestScan");
    }
  }

  Vec<nm::AccessPoint> GetAccessPoints(const nm::Device &,
                                       Status &status) override {
    ++access_point_reads;
    if (fail_get_access_points) {
      Fail(status, "GetAccessPoints");
      return {};
    }
    if (empty_reads > 0) {
      --empty_reads;
      return {};
    }
    return access_points;
  }

  Vec<nm::Profile> GetProfiles(Status &status) override {
    if (fail_get_profiles) {
      Fail(status, "GetProfiles");
      return {};
    }
    return profiles;
  }

  void DeleteProfile(const nm::ObjectPath &path, Status &status) override {
    ++deletions;
    auto it = std::find_if(profiles.begin(), profiles.end(),
                           [&](auto &p) { return p.path == path; });
    if (it == profiles.end()) {
      Fail(status, "DeleteProfile(" + path + ")");
      return;
    }
    profiles.erase(it);
  }

  nm::Connection AddProfile(nm::Profile profile) {
    int id = next_id++;
    profile.path = f("/Settings/%d", id);
    nm::Connection connection{.profile = profile.path,
                              .active = f("/ActiveConnection/%d", id)};
    profiles.push_back(std::move(profile));
    active.insert(connection.active);
    return connection;
  }

  nm::Connection CreateHotspot(const nm::Device &,
                               const nm::HotspotSettings &settings,
                               Status &status) override {
    if (fail_create_hotspot) {
      Fail(status, "CreateHotspot");
      return {};
    }
    ++hotspots_created;
    last_hotspot = settings;
    auto connection = AddProfile(nm::Profile{.id = settings.ssid,
                                             .type = "802-11-wireless",
                                             .mode = "ap",
                                             .ssid = settings.ssid});
    hotspots.insert(connection.active);
    return connection;
  }

  void Deactivate(const nm::ObjectPath &path, Status &status) override {
    ++deactivations;
    if (fail_deactivate) {
      Fail(status, "Deactivate");
      return;
    }
    active.erase(path);
  }

  nm::Connection Connect(const nm::Device &, const nm::AccessPoint &ap,
                         const nm::Credentials &credentials,
                         Status &status) override {
    ++joins;
    last_credentials = credentials;
    if (fail_connect) {
      Fail(status, "Connect");
      return {};
    }
    return AddProfile(WifiProfile("", ap.ssid));
  }

  nm::ActiveState GetActiveState(const nm::ObjectPath &path,
                                 Status &) override {
    if (hotspots.contains(path)) {
      size_t i =
          std::min<size_t>(hotspot_state_reads, hotspot_states.size() - 1);
      ++hotspot_state_reads;
      return hotspot_states[i];
    }
    size_t i = std::min<size_t>(active_state_reads, join_states.size() - 1);
    ++active_state_reads;
    return join_states[i];
  }

  nm::Connectivity GetConnectivity(Status &status) override {
    ++connectivity_checks;
    if (fail_connectivity) {
      Fail(status, "GetConnectivity");
    }
    return connectivity;
  }

  Str GetServiceState(Status &status) override {
    if (fail_service_state) {
      Fail(status, "GetServiceState");
      return "";
    }
    return service_state;
  }

  void StartService(Status &status) override {
    ++service_starts;
    if (fail_start_service) {
      Fail(status, "StartService");
      return;
    }
    service_state = service_state_after_start;
  }

  int CountAccessPointProfiles() const {
    int count = 0;
    for (auto &profile : profiles) {
      count += profile.IsAccessPoint();
    }
    return count;
  }
};

struct Launcher : dnsmasq::Launcher {
  struct Instance : dnsmasq::Instance {
    int &running;
    Instance(int &running) : running(running) { ++running; }
    ~Instance() override { --running; }
  };

  int running = 0;
  int started = 0;
  bool fail = false;
  Vec<dnsmasq::Options> options;

  UniquePtr<dnsmasq::Instance> Start(const dnsmasq::Options &o,
                                     Status &status) override {
    options.push_back(o);
    if (fail) {
      AppendErrorMessage(status) += "exec(dnsmasq) failed";
      return nullptr;
    }
    ++started;
    return std::make_unique<Instance>(running);
  }
};

inline Config TestConfig() {
  Config config;
  config.ssid = "HalleyHub-abc";
  config.passphrase = "pairing1";
  config.timing = Timing::Immediate(3);
  return config;
}

} // namespace fake
